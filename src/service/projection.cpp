/// @file projection.cpp
/// @brief Record and suggestion projections.

#include "service/projection.hpp"

#include "astro/coordinate_formatter.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace starlight::service
{

namespace
{

template <typename T>
nlohmann::json optional_value(const std::optional<T>& value)
{
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

VisualData visual_data_for(const catalog::CatalogRecord& record)
{
    const f64 brightness = std::clamp(1.2 - 0.07 * record.magnitude, 0.3, 1.0);

    return VisualData{
        .brightness = brightness,
        .color = spectral_color(record.spectral_class.value_or("")),
        .size = std::clamp(brightness * 1.5, 0.8, 1.6),
    };
}

std::string spectral_color(const std::string& spectral_class)
{
    if (spectral_class.empty())
    {
        return "#F8F8FF";
    }

    switch (std::toupper(static_cast<unsigned char>(spectral_class.front())))
    {
        case 'O':
        case 'B': return "#B0C4DE";
        case 'A': return "#F8F8FF";
        case 'F': return "#FFFACD";
        case 'G': return "#FFE4B5";
        case 'K': return "#FFA500";
        case 'M': return "#FF6347";
        default:  return "#F8F8FF";
    }
}

// -----------------------------------------------------------------
// Projections
// -----------------------------------------------------------------

nlohmann::json project_record(const catalog::CatalogRecord& record)
{
    const VisualData visual = visual_data_for(record);

    return nlohmann::json{
        {"id", record.id},
        {"name", record.display_name()},
        {"coordinates", astro::CoordinateFormatter::format(record.ra, record.dec)},
        {"ra", record.ra},
        {"dec", record.dec},
        {"distance", record.distance},
        {"magnitude", record.magnitude},
        {"absolute_magnitude", record.absolute_magnitude},
        {"spectral_class", optional_value(record.spectral_class)},
        {"is_variable", record.is_variable},
        {"constellation", optional_value(record.constellation)},
        {"bayer", optional_value(record.bayer)},
        {"is_synthetic", record.is_synthetic},
        {"cartesian", {record.cartesian.x, record.cartesian.y, record.cartesian.z}},
        {"visual_data", {
            {"brightness", visual.brightness},
            {"color", visual.color},
            {"size", visual.size},
        }},
    };
}

nlohmann::json project_suggestion(const suggestion::EmotionSuggestion& suggestion)
{
    return nlohmann::json{
        {"id", suggestion.id},
        {"name", suggestion.display_name},
        {"description", suggestion.description},
        {"confidence", suggestion.confidence},
        {"source", std::string(suggestion::to_string(suggestion.source))},
        {"emotion", suggestion.emotion_key},
        {"catalog_ref", project_record(suggestion.catalog_ref)},
    };
}

nlohmann::json project_suggestions(const std::vector<suggestion::EmotionSuggestion>& suggestions)
{
    nlohmann::json array = nlohmann::json::array();
    for (const auto& suggestion : suggestions)
    {
        array.push_back(project_suggestion(suggestion));
    }
    return array;
}

} // namespace starlight::service
