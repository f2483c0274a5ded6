// SPDX-License-Identifier: Apache-2.0
#include <net/Compression.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace toolmesh;

TEST_CASE("gzipCompress shrinks repetitive input and inflates back", "[compression]")
{
    auto const input = std::string(4096, 'a') + std::string(4096, 'b');

    auto compressed = gzipCompress(input);
    REQUIRE(compressed.has_value());
    CHECK(compressed->size() < input.size());

    // gzip magic bytes
    REQUIRE(compressed->size() > 2);
    CHECK(static_cast<unsigned char>((*compressed)[0]) == 0x1f);
    CHECK(static_cast<unsigned char>((*compressed)[1]) == 0x8b);

    auto inflated = gzipDecompress(*compressed);
    REQUIRE(inflated.has_value());
    CHECK(*inflated == input);
}

TEST_CASE("gzipCompress handles empty input", "[compression]")
{
    auto compressed = gzipCompress("");
    REQUIRE(compressed.has_value());

    auto inflated = gzipDecompress(*compressed);
    REQUIRE(inflated.has_value());
    CHECK(inflated->empty());
}

TEST_CASE("gzipDecompress rejects garbage and truncated streams", "[compression]")
{
    auto garbage = gzipDecompress("this is not gzip");
    REQUIRE(!garbage.has_value());
    CHECK(garbage.error().code == ErrorCode::CompressionError);

    auto compressed = gzipCompress(std::string(2048, 'x'));
    REQUIRE(compressed.has_value());
    auto truncated = gzipDecompress(std::string_view(*compressed).substr(0, compressed->size() / 2));
    REQUIRE(!truncated.has_value());
    CHECK(truncated.error().code == ErrorCode::CompressionError);
}

TEST_CASE("compress with None returns the input", "[compression]")
{
    auto result = compress(CompressionAlgorithm::None, "payload");
    REQUIRE(result.has_value());
    CHECK(*result == "payload");
    CHECK(contentEncodingFor(CompressionAlgorithm::Gzip) == "gzip");
    CHECK(contentEncodingFor(CompressionAlgorithm::None).empty());
}
