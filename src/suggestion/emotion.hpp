#pragma once

/// @file emotion.hpp
/// @brief Fixed emotion categories and the text pools used to describe suggested stars.

#include "catalog/catalog_record.hpp"
#include "suggestion/pcg_rng.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace starlight::suggestion
{
    /// @brief One suggestion theme (love, friendship, ...).
    struct EmotionCategory
    {
        std::string_view key;                         ///< Lower-case identifier, e.g. "love"
        std::string_view display_name;                ///< e.g. "Love"
        std::span<const std::string_view> templates;  ///< Description templates, "{name}" = star name
    };

    /// @brief Property-driven sentence appended to a catalog description.
    enum class PropertyClause
    {
        None,
        Pulsing,   ///< Variable star
        Blazing,   ///< Magnitude < 2.0
        Distant,   ///< Distance > 100 pc
    };

    /// @brief All categories in their fixed order; the order drives catalog partitioning.
    [[nodiscard]] std::span<const EmotionCategory> emotion_categories();

    /// @brief Look up a category by key, ignoring case and surrounding whitespace.
    /// @return nullptr for unknown keys.
    [[nodiscard]] const EmotionCategory* find_emotion(std::string_view key);

    /// @brief Position of the category within emotion_categories(), if known.
    [[nodiscard]] std::optional<std::size_t> emotion_position(std::string_view key);

    /// @brief Template pool for a key; unknown keys get the default pool.
    [[nodiscard]] std::span<const std::string_view> template_pool(std::string_view key);

    /// @brief Display name for a key; unknown keys are title-cased, blank keys become "Celestial".
    [[nodiscard]] std::string emotion_display_name(std::string_view key);

    /// @brief Pick the clause for a record. Priority: variable, then bright, then distant.
    [[nodiscard]] PropertyClause property_clause(const catalog::CatalogRecord& record);

    /// @brief Sentence for a clause (empty for PropertyClause::None).
    [[nodiscard]] std::string_view clause_text(PropertyClause clause);

    /// @brief Sample a template for @p key, fill in the star name and append its clause.
    [[nodiscard]] std::string compose_description(std::string_view key,
                                                  const catalog::CatalogRecord& record,
                                                  PcgRng& rng);

} // namespace starlight::suggestion
