#pragma once

/// @file catalog_error.hpp
/// @brief Error taxonomy of the catalog load path.

#include <string_view>

namespace starlight::catalog
{
    /// @brief Why a catalog load did not produce an index.
    enum class CatalogError
    {
        FetchFailed,        ///< Transport failure or fetch timeout
        DecodeFailed,       ///< Payload could not be inflated (decompression flag mismatch)
        Empty,              ///< Parsed, but zero valid rows
        PreviouslyFailed,   ///< An earlier attempt failed; no retry until reset()
    };

    [[nodiscard]] constexpr std::string_view to_string(CatalogError error)
    {
        switch (error)
        {
            case CatalogError::FetchFailed:      return "FetchFailed";
            case CatalogError::DecodeFailed:     return "DecodeFailed";
            case CatalogError::Empty:            return "Empty";
            case CatalogError::PreviouslyFailed: return "PreviouslyFailed";
        }
        return "Unknown";
    }

} // namespace starlight::catalog
