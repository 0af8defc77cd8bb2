/// @file decompression.cpp
/// @brief zlib-based inflate/deflate helpers.

#include "catalog/decompression.hpp"

#include "core/logger.hpp"

#include <zlib.h>

#include <array>

namespace starlight::catalog
{

namespace
{

constexpr int kGzipOrZlibWindow = 15 + 32;   // auto-detect gzip or zlib header
constexpr int kGzipWindow       = 15 + 16;   // write a gzip header
constexpr std::size_t kChunkSize = 64 * 1024;

} // namespace

std::optional<std::string> inflate_payload(std::string_view compressed)
{
    z_stream stream{};
    if (inflateInit2(&stream, kGzipOrZlibWindow) != Z_OK)
    {
        SLT_CORE_ERROR("Decompression: inflateInit2 failed");
        return std::nullopt;
    }

    stream.next_in  = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
    stream.avail_in = static_cast<uInt>(compressed.size());

    std::string output;
    std::array<char, kChunkSize> chunk{};
    int status = Z_OK;

    while (status != Z_STREAM_END)
    {
        stream.next_out  = reinterpret_cast<Bytef*>(chunk.data());
        stream.avail_out = static_cast<uInt>(chunk.size());

        status = inflate(&stream, Z_NO_FLUSH);
        if (status != Z_OK && status != Z_STREAM_END)
        {
            SLT_CORE_ERROR("Decompression: inflate failed ({}): {}",
                           status, stream.msg != nullptr ? stream.msg : "no message");
            inflateEnd(&stream);
            return std::nullopt;
        }

        output.append(chunk.data(), chunk.size() - stream.avail_out);

        // Input exhausted before the end-of-stream marker: truncated payload
        if (status == Z_OK && stream.avail_in == 0 && stream.avail_out != 0)
        {
            SLT_CORE_ERROR("Decompression: Stream truncated after {} bytes", output.size());
            inflateEnd(&stream);
            return std::nullopt;
        }
    }

    inflateEnd(&stream);
    return output;
}

std::optional<std::string> gzip_payload(std::string_view plain, int level)
{
    z_stream stream{};
    if (deflateInit2(&stream, level, Z_DEFLATED, kGzipWindow, 8, Z_DEFAULT_STRATEGY) != Z_OK)
    {
        SLT_CORE_ERROR("Decompression: deflateInit2 failed");
        return std::nullopt;
    }

    stream.next_in  = reinterpret_cast<Bytef*>(const_cast<char*>(plain.data()));
    stream.avail_in = static_cast<uInt>(plain.size());

    std::string output;
    std::array<char, kChunkSize> chunk{};
    int status = Z_OK;

    while (status != Z_STREAM_END)
    {
        stream.next_out  = reinterpret_cast<Bytef*>(chunk.data());
        stream.avail_out = static_cast<uInt>(chunk.size());

        status = deflate(&stream, Z_FINISH);
        if (status == Z_STREAM_ERROR)
        {
            SLT_CORE_ERROR("Decompression: deflate failed");
            deflateEnd(&stream);
            return std::nullopt;
        }

        output.append(chunk.data(), chunk.size() - stream.avail_out);
    }

    deflateEnd(&stream);
    return output;
}

} // namespace starlight::catalog
