#pragma once

/// @file emotion_suggestion.hpp
/// @brief One suggested star for an emotion, and the stage that produced it.

#include "catalog/catalog_record.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

namespace starlight::suggestion
{
    /// @brief Pipeline stage a suggestion came from.
    enum class SuggestionSource
    {
        Ai,
        Catalog,
        Fallback,
    };

    [[nodiscard]] constexpr std::string_view to_string(SuggestionSource source)
    {
        switch (source)
        {
            case SuggestionSource::Ai:       return "ai";
            case SuggestionSource::Catalog:  return "catalog";
            case SuggestionSource::Fallback: return "fallback";
        }
        return "unknown";
    }

    /// @brief Fixed confidence attached to every suggestion of a stage.
    [[nodiscard]] constexpr f64 confidence_for(SuggestionSource source)
    {
        switch (source)
        {
            case SuggestionSource::Ai:       return 0.9;
            case SuggestionSource::Catalog:  return 0.8;
            case SuggestionSource::Fallback: return 0.5;
        }
        return 0.0;
    }

    /// @brief A transient suggestion handed to the caller.
    struct EmotionSuggestion
    {
        std::string id;                   ///< Unique within one batch, e.g. "catalog-91262"
        std::string display_name;
        std::string description;
        f64 confidence = 0.0;             ///< confidence_for(source)
        SuggestionSource source = SuggestionSource::Fallback;
        std::string emotion_key;          ///< Key as requested
        catalog::CatalogRecord catalog_ref;
    };

} // namespace starlight::suggestion
