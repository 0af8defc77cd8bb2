#pragma once

/// @file catalog_loader.hpp
/// @brief Single-flight loader turning a catalog source into a CatalogIndex.

#include "catalog/catalog_error.hpp"
#include "catalog/catalog_fetcher.hpp"
#include "catalog/catalog_index.hpp"
#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace starlight::catalog
{
    /// @brief Lifecycle of the catalog: Unloaded → Loading → {Loaded | Failed}.
    enum class LoadState
    {
        Unloaded,
        Loading,
        Loaded,
        Failed,   ///< Sticky until reset()
    };

    [[nodiscard]] constexpr std::string_view to_string(LoadState state)
    {
        switch (state)
        {
            case LoadState::Unloaded: return "Unloaded";
            case LoadState::Loading:  return "Loading";
            case LoadState::Loaded:   return "Loaded";
            case LoadState::Failed:   return "Failed";
        }
        return "Unknown";
    }

    /// @brief Outcome of CatalogLoader::load(): an index or an error, never both.
    struct LoadResult
    {
        std::shared_ptr<const CatalogIndex> index;
        std::optional<CatalogError> error;
        u64 malformed_rows = 0;   ///< Rows skipped by the parser during this attempt

        [[nodiscard]] bool ok() const { return index != nullptr; }

        [[nodiscard]] static LoadResult success(std::shared_ptr<const CatalogIndex> index, u64 malformed_rows = 0)
        {
            return LoadResult{.index = std::move(index), .error = std::nullopt, .malformed_rows = malformed_rows};
        }

        [[nodiscard]] static LoadResult failure(CatalogError error, u64 malformed_rows = 0)
        {
            return LoadResult{.index = nullptr, .error = error, .malformed_rows = malformed_rows};
        }
    };

    /// @brief Fetches, decompresses and parses the catalog exactly once.
    ///
    /// All state transitions happen under one mutex:
    /// - Unloaded: the caller becomes the loader; state goes to Loading.
    /// - Loading: the caller blocks until the in-flight attempt finishes and
    ///   receives that attempt's result (same index instance or same error).
    /// - Loaded: the cached index is returned immediately.
    /// - Failed: CatalogError::PreviouslyFailed is returned without fetching.
    ///
    /// Any failure (fetch, timeout, decode, empty) moves the loader to Failed;
    /// only reset() makes another attempt possible. The index is published only
    /// after it is fully built, so readers never observe a partial index.
    class CatalogLoader
    {
    public:
        /// @param fetcher Transport used for every attempt.
        /// @param fetch_timeout Upper bound on one fetch; expiry counts as FetchFailed.
        explicit CatalogLoader(std::shared_ptr<CatalogFetcher> fetcher,
                               std::chrono::milliseconds fetch_timeout = std::chrono::seconds(30));

        CatalogLoader(const CatalogLoader&) = delete;
        CatalogLoader& operator=(const CatalogLoader&) = delete;
        CatalogLoader(CatalogLoader&&) = delete;
        CatalogLoader& operator=(CatalogLoader&&) = delete;

        /// @brief Load the catalog, or join / reuse the outcome of an earlier attempt.
        ///
        /// @param source_locator Passed to the fetcher unchanged.
        /// @param already_decompressed True when the transport already inflated the
        ///        payload. When false the payload must be a gzip/zlib stream; a
        ///        mismatch yields CatalogError::DecodeFailed, it is never guessed.
        [[nodiscard]] LoadResult load(const std::string& source_locator, bool already_decompressed);

        /// @brief Return a Loaded or Failed loader to Unloaded.
        /// @return False (and no change) while an attempt is in flight.
        bool reset();

        [[nodiscard]] LoadState state() const;

        /// @brief The published index, or nullptr if none. Never blocks on a load.
        [[nodiscard]] std::shared_ptr<const CatalogIndex> current_index() const;

        /// @brief Error of the most recent failed attempt (cleared by reset()).
        [[nodiscard]] std::optional<CatalogError> last_error() const;

        /// @brief Number of times the fetcher has been invoked.
        [[nodiscard]] u64 fetch_attempts() const { return m_fetch_attempts.load(); }

    private:
        /// @brief Fetch + decode + parse + index. Runs without holding m_mutex.
        [[nodiscard]] LoadResult run_attempt(const std::string& source_locator, bool already_decompressed);

        std::shared_ptr<CatalogFetcher> m_fetcher;
        std::chrono::milliseconds m_fetch_timeout;

        mutable std::mutex m_mutex;
        std::condition_variable m_attempt_finished;
        LoadState m_state = LoadState::Unloaded;
        std::shared_ptr<const CatalogIndex> m_index;
        std::optional<CatalogError> m_error;
        LoadResult m_last_outcome;
        u64 m_completed_attempts = 0;

        std::atomic<u64> m_fetch_attempts{0};
    };

} // namespace starlight::catalog
