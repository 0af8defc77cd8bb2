/// @file catalog_fetcher.cpp
/// @brief Filesystem catalog fetcher.

#include "catalog/catalog_fetcher.hpp"

#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

namespace starlight::catalog
{

std::optional<std::string> FileCatalogFetcher::fetch(const std::string& locator)
{
    const std::filesystem::path path(locator);

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        SLT_CORE_ERROR("FileCatalogFetcher: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::string bytes{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad())
    {
        SLT_CORE_ERROR("FileCatalogFetcher: Read error on: {}", path.string());
        return std::nullopt;
    }

    SLT_CORE_DEBUG("FileCatalogFetcher: Read {} bytes from {}", bytes.size(), path.string());
    return bytes;
}

} // namespace starlight::catalog
