/// @file emotion.cpp
/// @brief Emotion category table, template pools and description composition.

#include "suggestion/emotion.hpp"

#include "catalog/catalog_index.hpp"
#include "catalog/catalog_parser.hpp"

#include <spdlog/fmt/fmt.h>

#include <array>
#include <cctype>

namespace starlight::suggestion
{

namespace
{

// -----------------------------------------------------------------
// Template pools ({name} is replaced by the star's display name)
// -----------------------------------------------------------------

constexpr std::array<std::string_view, 4> kLoveTemplates{
    "{name} burns with the steady warmth of a love that never dims.",
    "Two hearts can meet in the light of {name}, however far apart they stand.",
    "{name} keeps watch over every promise whispered beneath the night sky.",
    "Let {name} carry your devotion across the quiet distances of space.",
};

constexpr std::array<std::string_view, 4> kFriendshipTemplates{
    "{name} shines like a friend who is always there when the night grows long.",
    "Loyal and constant, {name} mirrors the bond you share.",
    "{name} lights the road for companions walking side by side.",
    "Every laugh you have shared is echoed in the glow of {name}.",
};

constexpr std::array<std::string_view, 4> kFamilyTemplates{
    "{name} gathers its light the way a family gathers around a table.",
    "Rooted and enduring, {name} honours the ties that hold you together.",
    "{name} has guided generations, just as your family guides you.",
    "Under {name}, every homecoming feels a little warmer.",
};

constexpr std::array<std::string_view, 4> kMilestoneTemplates{
    "{name} marks this moment as brightly as you earned it.",
    "A new chapter begins beneath the proud light of {name}.",
    "{name} stands as a beacon for everything you have achieved.",
    "Let {name} remember the day you reached higher than before.",
};

constexpr std::array<std::string_view, 4> kMemorialTemplates{
    "{name} holds a memory that time cannot dim.",
    "Look to {name} and know that love outlasts every goodbye.",
    "{name} keeps a gentle vigil for someone dearly missed.",
    "The quiet light of {name} carries a cherished name forward.",
};

constexpr std::array<std::string_view, 4> kHealingTemplates{
    "{name} offers a calm, patient light for the road to recovery.",
    "Breathe slowly and let {name} remind you that dawn always comes.",
    "{name} glows softly, a reminder that every wound can mend.",
    "Find stillness in {name} and gather strength for tomorrow.",
};

constexpr std::array<std::string_view, 4> kAdventureTemplates{
    "{name} has guided explorers across oceans and deserts alike.",
    "Set your course by {name} and chase the horizon.",
    "{name} calls to every restless heart that longs for the unknown.",
    "The journey ahead is written in the light of {name}.",
};

constexpr std::array<std::string_view, 4> kCreativityTemplates{
    "{name} sparks ideas the way starlight sparks wonder.",
    "Let {name} colour the canvas of your imagination.",
    "{name} dances with the restless energy of creation.",
    "Every masterpiece begins with a light like {name}.",
};

constexpr std::array<std::string_view, 4> kDefaultTemplates{
    "{name} shines with a light chosen just for this moment.",
    "A beautiful celestial beacon, {name} holds your feelings among the stars.",
    "{name} carries your story across the sky.",
    "Whenever you look up, {name} will be there.",
};

constexpr std::array<EmotionCategory, 8> kCategories{{
    {.key = "love",       .display_name = "Love",       .templates = kLoveTemplates},
    {.key = "friendship", .display_name = "Friendship", .templates = kFriendshipTemplates},
    {.key = "family",     .display_name = "Family",     .templates = kFamilyTemplates},
    {.key = "milestones", .display_name = "Milestones", .templates = kMilestoneTemplates},
    {.key = "memorial",   .display_name = "Memorial",   .templates = kMemorialTemplates},
    {.key = "healing",    .display_name = "Healing",    .templates = kHealingTemplates},
    {.key = "adventure",  .display_name = "Adventure",  .templates = kAdventureTemplates},
    {.key = "creativity", .display_name = "Creativity", .templates = kCreativityTemplates},
}};

constexpr f64 kBlazingMagnitude = 2.0;
constexpr f64 kDistantParsecs   = 100.0;

} // namespace

std::span<const EmotionCategory> emotion_categories()
{
    return kCategories;
}

const EmotionCategory* find_emotion(std::string_view key)
{
    const std::string wanted = catalog::to_lower(catalog::CatalogParser::trim(key));
    for (const auto& category : kCategories)
    {
        if (category.key == wanted)
        {
            return &category;
        }
    }
    return nullptr;
}

std::optional<std::size_t> emotion_position(std::string_view key)
{
    const EmotionCategory* category = find_emotion(key);
    if (category == nullptr)
    {
        return std::nullopt;
    }
    return static_cast<std::size_t>(category - kCategories.data());
}

std::span<const std::string_view> template_pool(std::string_view key)
{
    const EmotionCategory* category = find_emotion(key);
    return category != nullptr ? category->templates : std::span<const std::string_view>(kDefaultTemplates);
}

std::string emotion_display_name(std::string_view key)
{
    if (const EmotionCategory* category = find_emotion(key))
    {
        return std::string(category->display_name);
    }

    std::string name(catalog::CatalogParser::trim(key));
    if (name.empty())
    {
        return "Celestial";
    }
    name.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(name.front())));
    return name;
}

PropertyClause property_clause(const catalog::CatalogRecord& record)
{
    if (record.is_variable)
    {
        return PropertyClause::Pulsing;
    }
    if (record.magnitude < kBlazingMagnitude)
    {
        return PropertyClause::Blazing;
    }
    if (record.distance > kDistantParsecs)
    {
        return PropertyClause::Distant;
    }
    return PropertyClause::None;
}

std::string_view clause_text(PropertyClause clause)
{
    switch (clause)
    {
        case PropertyClause::Pulsing: return "Its pulsing light rises and falls like a heartbeat.";
        case PropertyClause::Blazing: return "It is blazing among the brightest lights of the night sky.";
        case PropertyClause::Distant: return "Its light has crossed a distant ocean of space to reach you.";
        case PropertyClause::None:    break;
    }
    return {};
}

std::string compose_description(std::string_view key,
                                const catalog::CatalogRecord& record,
                                PcgRng& rng)
{
    const auto pool = template_pool(key);
    const std::string_view tpl = pool[rng.nextUInt(static_cast<u32>(pool.size()))];

    std::string description = fmt::format(fmt::runtime(tpl), fmt::arg("name", record.display_name()));

    const std::string_view clause = clause_text(property_clause(record));
    if (!clause.empty())
    {
        description += ' ';
        description += clause;
    }
    return description;
}

} // namespace starlight::suggestion
