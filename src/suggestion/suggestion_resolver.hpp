#pragma once

/// @file suggestion_resolver.hpp
/// @brief Layered AI -> catalog -> fallback resolution of star suggestions.

#include "catalog/catalog_index.hpp"
#include "core/types.hpp"
#include "suggestion/emotion_suggestion.hpp"
#include "suggestion/pcg_rng.hpp"
#include "suggestion/star_generator.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace starlight::suggestion
{
    /// @brief Supplies the currently published index (nullptr while none is loaded).
    using IndexSource = std::function<std::shared_ptr<const catalog::CatalogIndex>()>;

    /// @brief Result of one resolution with the stage that produced it.
    struct Resolution
    {
        std::vector<EmotionSuggestion> suggestions;
        SuggestionSource stage = SuggestionSource::Fallback;
        std::optional<GeneratorError> generator_error;   ///< Set when the AI stage was rejected by an error
    };

    /// @brief Resolves a fixed-size suggestion list for an emotion.
    ///
    /// Stages run in order and the first one that yields exactly `count`
    /// suggestions wins; a short stage is discarded as a whole:
    /// 1. AI: generator proposals matched against the index by name.
    /// 2. Catalog: named stars assigned round-robin to the emotion categories.
    /// 3. Fallback: synthetic records, always exactly `count`.
    ///
    /// The resolver never blocks on a catalog load; it reads whatever index the
    /// IndexSource publishes at call time. Safe to call from several threads.
    class SuggestionResolver
    {
    public:
        /// @param index_source Current index provider.
        /// @param generator AI collaborator; may be null (the AI stage then reports Unavailable).
        /// @param generator_timeout Upper bound on one generator call.
        /// @param rng Random source for templates and synthetic stars.
        SuggestionResolver(IndexSource index_source,
                           std::shared_ptr<StarGenerator> generator,
                           std::chrono::milliseconds generator_timeout,
                           PcgRng rng);

        /// Larger requests are clamped to this many suggestions.
        static constexpr i32 kMaxSuggestions = 1000;

        SuggestionResolver(const SuggestionResolver&) = delete;
        SuggestionResolver& operator=(const SuggestionResolver&) = delete;

        /// @brief Exactly @p count suggestions for @p emotion_key (empty for count <= 0,
        ///        kMaxSuggestions for larger counts).
        [[nodiscard]] std::vector<EmotionSuggestion> resolve(std::string_view emotion_key, i32 count = 5) noexcept;

        /// @brief Same as resolve(), also reporting the winning stage.
        [[nodiscard]] Resolution resolve_detailed(std::string_view emotion_key, i32 count = 5) noexcept;

    private:
        /// @return Exactly @p count suggestions, or std::nullopt with @p error set when applicable.
        [[nodiscard]] std::optional<std::vector<EmotionSuggestion>>
            try_ai_stage(std::string_view emotion_key, std::size_t count,
                         const catalog::CatalogIndex& index, std::optional<GeneratorError>& error);

        [[nodiscard]] std::optional<std::vector<EmotionSuggestion>>
            try_catalog_stage(std::string_view emotion_key, std::size_t count,
                              const catalog::CatalogIndex& index);

        [[nodiscard]] std::vector<EmotionSuggestion>
            run_fallback_stage(std::string_view emotion_key, std::size_t count);

        IndexSource m_index_source;
        std::shared_ptr<StarGenerator> m_generator;
        std::chrono::milliseconds m_generator_timeout;

        std::mutex m_rng_mutex;
        PcgRng m_rng;
    };

} // namespace starlight::suggestion
