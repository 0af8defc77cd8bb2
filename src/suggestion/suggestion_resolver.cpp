/// @file suggestion_resolver.cpp
/// @brief Implementation of the three-stage suggestion pipeline.

#include "suggestion/suggestion_resolver.hpp"

#include "catalog/catalog_parser.hpp"
#include "core/logger.hpp"
#include "core/timeout.hpp"
#include "suggestion/emotion.hpp"
#include "suggestion/fallback_generator.hpp"

#include <spdlog/fmt/fmt.h>

#include <string>
#include <unordered_set>
#include <utility>

namespace starlight::suggestion
{

namespace
{

constexpr std::size_t kCategoryCount = 8;

EmotionSuggestion make_suggestion(std::string id, SuggestionSource source,
                                  std::string_view emotion_key,
                                  const catalog::CatalogRecord& record,
                                  std::string description)
{
    return EmotionSuggestion{
        .id = std::move(id),
        .display_name = record.display_name(),
        .description = std::move(description),
        .confidence = confidence_for(source),
        .source = source,
        .emotion_key = std::string(emotion_key),
        .catalog_ref = record,
    };
}

// Exact name first, otherwise the first substring hit
const catalog::CatalogRecord* match_proposal(const catalog::CatalogIndex& index, std::string_view name)
{
    const auto exact = index.find_by_exact_name(name);
    if (!exact.empty())
    {
        return exact.front();
    }
    const auto hits = index.search_by_name(name);
    return hits.empty() ? nullptr : hits.front();
}

} // namespace

SuggestionResolver::SuggestionResolver(IndexSource index_source,
                                       std::shared_ptr<StarGenerator> generator,
                                       std::chrono::milliseconds generator_timeout,
                                       PcgRng rng)
    : m_index_source(std::move(index_source))
    , m_generator(std::move(generator))
    , m_generator_timeout(generator_timeout)
    , m_rng(rng)
{
}

// -----------------------------------------------------------------
// Public entry points
// -----------------------------------------------------------------

std::vector<EmotionSuggestion> SuggestionResolver::resolve(std::string_view emotion_key, i32 count) noexcept
{
    return resolve_detailed(emotion_key, count).suggestions;
}

Resolution SuggestionResolver::resolve_detailed(std::string_view emotion_key, i32 count) noexcept
{
    Resolution resolution;
    if (count <= 0)
    {
        return resolution;
    }
    if (count > kMaxSuggestions)
    {
        SLT_CORE_WARN("SuggestionResolver: Requested {} suggestions for '{}', clamping to {}",
                      count, emotion_key, kMaxSuggestions);
        count = kMaxSuggestions;
    }
    const auto wanted = static_cast<std::size_t>(count);

    try
    {
        const auto index = m_index_source ? m_index_source() : nullptr;

        if (index)
        {
            if (auto ai = try_ai_stage(emotion_key, wanted, *index, resolution.generator_error))
            {
                resolution.suggestions = std::move(*ai);
                resolution.stage = SuggestionSource::Ai;
                return resolution;
            }

            if (auto from_catalog = try_catalog_stage(emotion_key, wanted, *index))
            {
                resolution.suggestions = std::move(*from_catalog);
                resolution.stage = SuggestionSource::Catalog;
                return resolution;
            }
        }
        else
        {
            SLT_CORE_DEBUG("SuggestionResolver: No catalog published, skipping AI and catalog stages");
        }
    }
    catch (const std::exception& e)
    {
        SLT_CORE_ERROR("SuggestionResolver: Resolution for '{}' failed, using fallback: {}", emotion_key, e.what());
    }
    catch (...)
    {
        SLT_CORE_ERROR("SuggestionResolver: Resolution for '{}' failed with an unknown exception, using fallback",
                       emotion_key);
    }

    resolution.suggestions = run_fallback_stage(emotion_key, wanted);
    resolution.stage = SuggestionSource::Fallback;
    return resolution;
}

// -----------------------------------------------------------------
// Stage 1: AI proposals matched against the catalog
// -----------------------------------------------------------------

std::optional<std::vector<EmotionSuggestion>>
SuggestionResolver::try_ai_stage(std::string_view emotion_key, std::size_t count,
                                 const catalog::CatalogIndex& index, std::optional<GeneratorError>& error)
{
    if (!m_generator)
    {
        error = GeneratorError::Unavailable;
        return std::nullopt;
    }

    std::optional<std::optional<GeneratorResponse>> reply;
    try
    {
        reply = core::call_with_timeout(
            [generator = m_generator, key = std::string(emotion_key)]() { return generator->generate(key); },
            m_generator_timeout);
    }
    catch (const std::exception& e)
    {
        SLT_CORE_WARN("SuggestionResolver: Generator threw for '{}': {}", emotion_key, e.what());
        error = GeneratorError::Unavailable;
        return std::nullopt;
    }
    catch (...)
    {
        SLT_CORE_WARN("SuggestionResolver: Generator threw an unknown exception for '{}'", emotion_key);
        error = GeneratorError::Unavailable;
        return std::nullopt;
    }

    if (!reply)
    {
        SLT_CORE_WARN("SuggestionResolver: Generator timed out after {} ms", m_generator_timeout.count());
        error = GeneratorError::Timeout;
        return std::nullopt;
    }

    const std::optional<GeneratorResponse>& response = *reply;
    if (!response || !response->success || response->stars.empty())
    {
        SLT_CORE_DEBUG("SuggestionResolver: Generator returned no usable proposals for '{}'", emotion_key);
        error = GeneratorError::Unavailable;
        return std::nullopt;
    }

    std::vector<EmotionSuggestion> suggestions;
    std::unordered_set<i64> used;
    for (const auto& proposal : response->stars)
    {
        if (suggestions.size() == count)
        {
            break;
        }

        const catalog::CatalogRecord* record = match_proposal(index, proposal.name);
        if (record == nullptr)
        {
            SLT_CORE_DEBUG("SuggestionResolver: No catalog star matches proposal '{}'", proposal.name);
            continue;
        }
        if (!used.insert(record->id).second)
        {
            continue;
        }

        suggestions.push_back(make_suggestion(fmt::format("ai-{}", record->id), SuggestionSource::Ai,
                                              emotion_key, *record, proposal.description));
    }

    if (suggestions.size() != count)
    {
        SLT_CORE_DEBUG("SuggestionResolver: AI stage matched {}/{} stars, discarding", suggestions.size(), count);
        return std::nullopt;
    }
    return suggestions;
}

// -----------------------------------------------------------------
// Stage 2: named catalog stars partitioned by emotion
// -----------------------------------------------------------------

std::optional<std::vector<EmotionSuggestion>>
SuggestionResolver::try_catalog_stage(std::string_view emotion_key, std::size_t count,
                                      const catalog::CatalogIndex& index)
{
    const auto& named = index.get_named_stars();
    const auto position = emotion_position(emotion_key);

    std::vector<const catalog::CatalogRecord*> picked;
    picked.reserve(count);
    for (std::size_t i = 0; i < named.size() && picked.size() < count; ++i)
    {
        if (!position || i % kCategoryCount == *position)
        {
            picked.push_back(named[i]);
        }
    }

    if (picked.size() != count)
    {
        SLT_CORE_DEBUG("SuggestionResolver: Catalog stage found {}/{} stars for '{}', discarding",
                       picked.size(), count, emotion_key);
        return std::nullopt;
    }

    std::vector<EmotionSuggestion> suggestions;
    suggestions.reserve(count);

    std::lock_guard lock(m_rng_mutex);
    for (const auto* record : picked)
    {
        suggestions.push_back(make_suggestion(fmt::format("catalog-{}", record->id), SuggestionSource::Catalog,
                                              emotion_key, *record,
                                              compose_description(emotion_key, *record, m_rng)));
    }
    return suggestions;
}

// -----------------------------------------------------------------
// Stage 3: synthetic stars
// -----------------------------------------------------------------

std::vector<EmotionSuggestion> SuggestionResolver::run_fallback_stage(std::string_view emotion_key, std::size_t count)
{
    std::vector<EmotionSuggestion> suggestions;
    suggestions.reserve(count);

    const std::string slug = catalog::to_lower(catalog::CatalogParser::trim(emotion_key));

    std::lock_guard lock(m_rng_mutex);
    const auto records = FallbackGenerator::generate(emotion_key, static_cast<int>(count), m_rng);
    for (std::size_t i = 0; i < records.size(); ++i)
    {
        suggestions.push_back(make_suggestion(fmt::format("fallback-{}-{}", slug, i + 1), SuggestionSource::Fallback,
                                              emotion_key, records[i],
                                              compose_description(emotion_key, records[i], m_rng)));
    }

    SLT_CORE_INFO("SuggestionResolver: Served {} fallback suggestions for '{}'", suggestions.size(), emotion_key);
    return suggestions;
}

} // namespace starlight::suggestion
