#pragma once

/// @file catalog_fetcher.hpp
/// @brief Transport abstraction delivering raw catalog payloads.

#include <optional>
#include <string>

namespace starlight::catalog
{
    /// @brief Fetches the bytes of a catalog source.
    ///
    /// Implementations may block; CatalogLoader bounds every call with its fetch
    /// timeout and abandons calls that overrun, so an implementation must stay
    /// valid while a call is still running after the loader gave up on it
    /// (the loader holds fetchers by shared_ptr for that reason).
    class CatalogFetcher
    {
    public:
        virtual ~CatalogFetcher() = default;

        /// @brief Fetch the payload named by @p locator.
        /// @return The raw bytes exactly as delivered, or std::nullopt on transport failure.
        [[nodiscard]] virtual std::optional<std::string> fetch(const std::string& locator) = 0;
    };

    /// @brief Reads catalog payloads from the local filesystem; the locator is a path.
    class FileCatalogFetcher final : public CatalogFetcher
    {
    public:
        [[nodiscard]] std::optional<std::string> fetch(const std::string& locator) override;
    };

} // namespace starlight::catalog
