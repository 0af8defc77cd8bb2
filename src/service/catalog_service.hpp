#pragma once

/// @file catalog_service.hpp
/// @brief Process-wide catalog cache with deferred background loading.

#include "catalog/catalog_fetcher.hpp"
#include "catalog/catalog_loader.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "suggestion/star_generator.hpp"
#include "suggestion/suggestion_resolver.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>
#include <vector>

namespace starlight::service
{
    /// @brief Owns the catalog loader and the suggestion resolver.
    ///
    /// Constructed once at startup and passed by reference to whoever needs
    /// suggestions. start() schedules one background load after the configured
    /// delay; foreground callers may load at any time and share the same
    /// single-flight attempt.
    class CatalogService
    {
    public:
        /// @param generator May be null; the AI stage is then skipped as Unavailable.
        CatalogService(core::EngineConfig config,
                       std::shared_ptr<catalog::CatalogFetcher> fetcher,
                       std::shared_ptr<suggestion::StarGenerator> generator);

        /// @brief Cancels a pending background load and joins the worker.
        ~CatalogService();

        CatalogService(const CatalogService&) = delete;
        CatalogService& operator=(const CatalogService&) = delete;

        /// @brief Schedule the one background load.
        /// @return True if a load was scheduled; false if disabled, already
        ///         started, or the catalog is no longer Unloaded.
        bool start();

        /// @brief Foreground, blocking load (joins an in-flight attempt).
        [[nodiscard]] catalog::LoadResult load_catalog();

        /// @brief Suggestions for an emotion with the configured default count.
        [[nodiscard]] std::vector<suggestion::EmotionSuggestion> suggest(std::string_view emotion_key);

        /// @brief Exactly @p count suggestions (empty for count <= 0).
        [[nodiscard]] std::vector<suggestion::EmotionSuggestion> suggest(std::string_view emotion_key, i32 count);

        /// @brief Allow another load after a failure (see CatalogLoader::reset()).
        bool reset_catalog();

        /// @brief Block until the background worker, if any, has finished.
        void wait_for_background();

        [[nodiscard]] const core::EngineConfig& config() const { return m_config; }
        [[nodiscard]] catalog::CatalogLoader& loader() { return m_loader; }
        [[nodiscard]] const catalog::CatalogLoader& loader() const { return m_loader; }
        [[nodiscard]] suggestion::SuggestionResolver& resolver() { return m_resolver; }

    private:
        void background_load();

        core::EngineConfig m_config;
        catalog::CatalogLoader m_loader;
        suggestion::SuggestionResolver m_resolver;

        std::mutex m_schedule_mutex;
        std::condition_variable m_cancel_cv;
        bool m_started = false;
        bool m_cancelled = false;
        std::thread m_worker;
    };

} // namespace starlight::service
