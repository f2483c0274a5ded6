// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <net/TransportConfig.hpp>

#include <string>
#include <string_view>

namespace toolmesh
{

/// @brief Returns the Content-Encoding token for an algorithm ("gzip"), or empty for None.
[[nodiscard]] constexpr auto contentEncodingFor(CompressionAlgorithm algorithm) -> std::string_view
{
    switch (algorithm)
    {
        case CompressionAlgorithm::None: return "";
        case CompressionAlgorithm::Gzip: return "gzip";
    }
    return "";
}

/// @brief Compresses @p input into a gzip member using zlib.
/// @return The compressed bytes or a CompressionError.
[[nodiscard]] auto gzipCompress(std::string_view input) -> Result<std::string>;

/// @brief Decompresses a gzip member.
/// @return The decompressed bytes or a CompressionError.
[[nodiscard]] auto gzipDecompress(std::string_view input) -> Result<std::string>;

/// @brief Compresses @p input with the given algorithm. None returns the input unchanged.
[[nodiscard]] auto compress(CompressionAlgorithm algorithm, std::string_view input) -> Result<std::string>;

} // namespace toolmesh
