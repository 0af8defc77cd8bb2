/// @file catalog_service.cpp
/// @brief CatalogService implementation.

#include "service/catalog_service.hpp"

#include "core/logger.hpp"

#include <utility>

namespace starlight::service
{

namespace
{

suggestion::PcgRng make_rng(const core::ServiceConfig& config)
{
    if (config.seed)
    {
        SLT_CORE_INFO("CatalogService: Using fixed suggestion seed {}", *config.seed);
        return suggestion::PcgRng(*config.seed);
    }
    return suggestion::PcgRng::fromEntropy();
}

} // namespace

CatalogService::CatalogService(core::EngineConfig config,
                               std::shared_ptr<catalog::CatalogFetcher> fetcher,
                               std::shared_ptr<suggestion::StarGenerator> generator)
    : m_config(std::move(config))
    , m_loader(std::move(fetcher), m_config.catalog.fetch_timeout)
    , m_resolver([this]() { return m_loader.current_index(); },
                 std::move(generator),
                 m_config.generator.timeout,
                 make_rng(m_config.service))
{
}

CatalogService::~CatalogService()
{
    {
        std::lock_guard lock(m_schedule_mutex);
        m_cancelled = true;
    }
    m_cancel_cv.notify_all();

    if (m_worker.joinable())
    {
        m_worker.join();
    }
}

// -----------------------------------------------------------------
// Background scheduling
// -----------------------------------------------------------------

bool CatalogService::start()
{
    std::lock_guard lock(m_schedule_mutex);

    if (!m_config.service.background_load)
    {
        SLT_CORE_DEBUG("CatalogService: Background load disabled");
        return false;
    }
    if (m_started)
    {
        return false;
    }
    if (m_loader.state() != catalog::LoadState::Unloaded)
    {
        SLT_CORE_DEBUG("CatalogService: Catalog already {}, nothing to schedule",
                       catalog::to_string(m_loader.state()));
        return false;
    }

    m_started = true;
    m_worker = std::thread([this]() { background_load(); });

    SLT_CORE_INFO("CatalogService: Background load scheduled in {} ms",
                  m_config.service.background_load_delay.count());
    return true;
}

void CatalogService::background_load()
{
    {
        std::unique_lock lock(m_schedule_mutex);
        const bool cancelled = m_cancel_cv.wait_for(lock, m_config.service.background_load_delay,
                                                     [this]() { return m_cancelled; });
        if (cancelled)
        {
            SLT_CORE_DEBUG("CatalogService: Background load cancelled");
            return;
        }
    }

    // A foreground load may already have run or be running
    if (m_loader.state() != catalog::LoadState::Unloaded)
    {
        SLT_CORE_DEBUG("CatalogService: Skipping background load, catalog is {}",
                       catalog::to_string(m_loader.state()));
        return;
    }

    const auto result = m_loader.load(m_config.catalog.source, m_config.catalog.already_decompressed);
    if (result.ok())
    {
        SLT_CORE_INFO("CatalogService: Background load finished ({} stars)", result.index->total_count());
    }
    else
    {
        SLT_CORE_ERROR("CatalogService: Background load failed ({}), not retrying",
                       catalog::to_string(*result.error));
    }
}

void CatalogService::wait_for_background()
{
    if (m_worker.joinable())
    {
        m_worker.join();
    }
}

// -----------------------------------------------------------------
// Foreground operations
// -----------------------------------------------------------------

catalog::LoadResult CatalogService::load_catalog()
{
    auto result = m_loader.load(m_config.catalog.source, m_config.catalog.already_decompressed);
    if (!result.ok())
    {
        SLT_CORE_WARN("CatalogService: Catalog unavailable ({})", catalog::to_string(*result.error));
    }
    return result;
}

std::vector<suggestion::EmotionSuggestion> CatalogService::suggest(std::string_view emotion_key)
{
    return suggest(emotion_key, m_config.service.default_count);
}

std::vector<suggestion::EmotionSuggestion> CatalogService::suggest(std::string_view emotion_key, i32 count)
{
    if (m_config.service.load_on_demand && m_loader.state() != catalog::LoadState::Loaded)
    {
        // Result only matters through the published index
        static_cast<void>(load_catalog());
    }
    return m_resolver.resolve(emotion_key, count);
}

bool CatalogService::reset_catalog()
{
    const bool reset = m_loader.reset();
    if (reset)
    {
        SLT_CORE_INFO("CatalogService: Catalog reset, next load will fetch again");
    }
    else
    {
        SLT_CORE_WARN("CatalogService: Reset refused while a load is in flight");
    }
    return reset;
}

} // namespace starlight::service
