#pragma once

/// @file decompression.hpp
/// @brief zlib inflation of compressed catalog payloads.

#include <optional>
#include <string>
#include <string_view>

namespace starlight::catalog
{
    /// @brief Inflate a gzip- or zlib-wrapped payload.
    ///
    /// The wrapper is taken from the stream header; raw (unwrapped) deflate
    /// data and plain text are rejected rather than passed through.
    /// @return The decompressed bytes, or std::nullopt if the stream is not valid.
    [[nodiscard]] std::optional<std::string> inflate_payload(std::string_view compressed);

    /// @brief gzip-compress a payload (used to produce fixtures and cached copies).
    /// @return The gzip stream, or std::nullopt if zlib reports an error.
    [[nodiscard]] std::optional<std::string> gzip_payload(std::string_view plain, int level = 6);

} // namespace starlight::catalog
