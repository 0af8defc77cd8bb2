/// @file star_generator.cpp
/// @brief Generator reply decoding and the file-backed replay generator.

#include "suggestion/star_generator.hpp"

#include "catalog/catalog_index.hpp"
#include "catalog/catalog_parser.hpp"
#include "core/logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <utility>

namespace starlight::suggestion
{

namespace
{

std::string string_field(const nlohmann::json& entry, const char* key)
{
    const auto it = entry.find(key);
    return (it != entry.end() && it->is_string()) ? it->get<std::string>() : std::string{};
}

} // namespace

// -----------------------------------------------------------------
// parse_generator_response
// -----------------------------------------------------------------

std::optional<GeneratorResponse> parse_generator_response(std::string_view json)
{
    const nlohmann::json doc = nlohmann::json::parse(json.begin(), json.end(), nullptr,
                                                     /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object())
    {
        SLT_CORE_WARN("StarGenerator: Reply is not a JSON object");
        return std::nullopt;
    }

    const auto success = doc.find("success");
    if (success == doc.end() || !success->is_boolean())
    {
        SLT_CORE_WARN("StarGenerator: Reply has no boolean 'success'");
        return std::nullopt;
    }

    GeneratorResponse response;
    response.success = success->get<bool>();

    const auto stars = doc.find("stars");
    if (stars == doc.end() || !stars->is_array())
    {
        return response;
    }

    for (const auto& entry : *stars)
    {
        if (!entry.is_object())
        {
            continue;
        }
        const auto name = entry.find("name");
        if (name == entry.end() || !name->is_string())
        {
            SLT_CORE_DEBUG("StarGenerator: Skipping proposal without a name");
            continue;
        }

        GeneratedStar star;
        star.name = name->get<std::string>();
        star.description = string_field(entry, "description");
        star.generated_at = string_field(entry, "generatedAt");
        response.stars.push_back(std::move(star));
    }

    return response;
}

// -----------------------------------------------------------------
// JsonFileStarGenerator
// -----------------------------------------------------------------

JsonFileStarGenerator::JsonFileStarGenerator(std::filesystem::path response_dir)
    : m_response_dir(std::move(response_dir))
{
}

std::optional<GeneratorResponse> JsonFileStarGenerator::generate(const std::string& emotion_key)
{
    // Keys become file names; only plain identifiers are accepted
    const std::string key = catalog::to_lower(catalog::CatalogParser::trim(emotion_key));
    const bool valid_key = !key.empty() && std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
    if (!valid_key)
    {
        SLT_CORE_WARN("JsonFileStarGenerator: Rejecting emotion key '{}'", emotion_key);
        return std::nullopt;
    }

    const std::filesystem::path path = m_response_dir / (key + ".json");
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        SLT_CORE_WARN("JsonFileStarGenerator: No recorded reply at {}", path.string());
        return std::nullopt;
    }

    const std::string body{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    return parse_generator_response(body);
}

} // namespace starlight::suggestion
