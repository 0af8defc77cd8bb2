#pragma once

/// @file projection.hpp
/// @brief JSON projections of catalog records and suggestions for display and storage.

#include "catalog/catalog_record.hpp"
#include "core/types.hpp"
#include "suggestion/emotion_suggestion.hpp"

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <vector>

namespace starlight::service
{
    /// @brief Rendering hints derived from photometry.
    struct VisualData
    {
        f64 brightness = 0.0;   ///< [0.3, 1.0], brighter stars closer to 1
        std::string color;      ///< "#RRGGBB" from the spectral letter
        f64 size = 0.0;         ///< [0.8, 1.6]
    };

    /// @brief Compute the visual hints of a record.
    [[nodiscard]] VisualData visual_data_for(const catalog::CatalogRecord& record);

    /// @brief Hex colour for a spectral class (first letter, case-insensitive).
    [[nodiscard]] std::string spectral_color(const std::string& spectral_class);

    /// @brief Record projection: id, name, coordinates, photometry, cartesian and visual data.
    [[nodiscard]] nlohmann::json project_record(const catalog::CatalogRecord& record);

    /// @brief Suggestion projection with the record projection under "catalog_ref".
    [[nodiscard]] nlohmann::json project_suggestion(const suggestion::EmotionSuggestion& suggestion);

    /// @brief Array of suggestion projections, in order.
    [[nodiscard]] nlohmann::json project_suggestions(const std::vector<suggestion::EmotionSuggestion>& suggestions);

} // namespace starlight::service
