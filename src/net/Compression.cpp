// SPDX-License-Identifier: Apache-2.0
#include "Compression.hpp"

#include <array>
#include <format>

#include <zlib.h>

namespace toolmesh
{

namespace
{

    /// @brief zlib window bits selecting a gzip wrapper with the maximum window.
    constexpr auto GzipWindowBits = 15 + 16;
    constexpr auto MemoryLevel = 8;
    constexpr auto InflateChunkSize = std::size_t { 16 * 1024 };

} // namespace

auto gzipCompress(std::string_view input) -> Result<std::string>
{
    auto stream = z_stream {};
    if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, GzipWindowBits, MemoryLevel, Z_DEFAULT_STRATEGY)
        != Z_OK)
        return makeError(ErrorCode::CompressionError, "deflateInit2 failed");

    auto output = std::string(deflateBound(&stream, static_cast<uLong>(input.size())), '\0');

    // zlib's API is not const-correct; the input buffer is only read.
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(output.size());

    auto const rc = deflate(&stream, Z_FINISH);
    auto const written = stream.total_out;
    deflateEnd(&stream);

    if (rc != Z_STREAM_END)
        return makeError(ErrorCode::CompressionError, std::format("deflate failed ({})", rc));

    output.resize(written);
    return output;
}

auto gzipDecompress(std::string_view input) -> Result<std::string>
{
    auto stream = z_stream {};
    if (inflateInit2(&stream, GzipWindowBits) != Z_OK)
        return makeError(ErrorCode::CompressionError, "inflateInit2 failed");

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());

    auto output = std::string {};
    auto chunk = std::array<char, InflateChunkSize> {};
    auto rc = Z_OK;
    while (rc != Z_STREAM_END)
    {
        stream.next_out = reinterpret_cast<Bytef*>(chunk.data());
        stream.avail_out = static_cast<uInt>(chunk.size());

        rc = inflate(&stream, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END)
        {
            inflateEnd(&stream);
            return makeError(ErrorCode::CompressionError, std::format("inflate failed ({})", rc));
        }

        output.append(chunk.data(), chunk.size() - stream.avail_out);

        if (rc == Z_OK && stream.avail_in == 0 && stream.avail_out != 0)
        {
            inflateEnd(&stream);
            return makeError(ErrorCode::CompressionError, "Truncated gzip stream");
        }
    }

    inflateEnd(&stream);
    return output;
}

auto compress(CompressionAlgorithm algorithm, std::string_view input) -> Result<std::string>
{
    switch (algorithm)
    {
        case CompressionAlgorithm::None: return std::string(input);
        case CompressionAlgorithm::Gzip: return gzipCompress(input);
    }
    return makeError(ErrorCode::CompressionError, "Unknown compression algorithm");
}

} // namespace toolmesh
