/// @file catalog_loader.cpp
/// @brief Implementation of the single-flight catalog loader.

#include "catalog/catalog_loader.hpp"

#include "catalog/catalog_parser.hpp"
#include "catalog/decompression.hpp"
#include "core/logger.hpp"
#include "core/timeout.hpp"

#include <utility>

namespace starlight::catalog
{

CatalogLoader::CatalogLoader(std::shared_ptr<CatalogFetcher> fetcher,
                             std::chrono::milliseconds fetch_timeout)
    : m_fetcher(std::move(fetcher))
    , m_fetch_timeout(fetch_timeout)
{
}

// -----------------------------------------------------------------
// load: state machine gate
// -----------------------------------------------------------------

LoadResult CatalogLoader::load(const std::string& source_locator, bool already_decompressed)
{
    std::unique_lock lock(m_mutex);

    switch (m_state)
    {
        case LoadState::Loaded:
            return LoadResult::success(m_index);

        case LoadState::Failed:
            SLT_CORE_DEBUG("CatalogLoader: Previous attempt failed ({}), not retrying",
                           to_string(m_error.value_or(CatalogError::PreviouslyFailed)));
            return LoadResult::failure(CatalogError::PreviouslyFailed);

        case LoadState::Loading:
        {
            SLT_CORE_DEBUG("CatalogLoader: Joining in-flight load");
            const u64 joined = m_completed_attempts;
            m_attempt_finished.wait(lock, [this, joined]() { return m_completed_attempts != joined; });
            return m_last_outcome;
        }

        case LoadState::Unloaded:
            break;
    }

    m_state = LoadState::Loading;
    lock.unlock();

    LoadResult outcome;
    try
    {
        outcome = run_attempt(source_locator, already_decompressed);
    }
    catch (const std::exception& e)
    {
        // Parsing/indexing only throw on resource exhaustion; the state must
        // still leave Loading so waiters are released.
        SLT_CORE_ERROR("CatalogLoader: Load of {} aborted: {}", source_locator, e.what());
        outcome = LoadResult::failure(CatalogError::FetchFailed);
    }
    catch (...)
    {
        SLT_CORE_ERROR("CatalogLoader: Load of {} aborted by an unknown exception", source_locator);
        outcome = LoadResult::failure(CatalogError::FetchFailed);
    }

    lock.lock();
    m_state = outcome.ok() ? LoadState::Loaded : LoadState::Failed;
    m_index = outcome.index;
    m_error = outcome.error;
    m_last_outcome = outcome;
    ++m_completed_attempts;
    lock.unlock();

    m_attempt_finished.notify_all();
    return outcome;
}

// -----------------------------------------------------------------
// run_attempt: fetch → (inflate) → parse → index
// -----------------------------------------------------------------

LoadResult CatalogLoader::run_attempt(const std::string& source_locator, bool already_decompressed)
{
    const auto started = std::chrono::steady_clock::now();

    if (!m_fetcher)
    {
        SLT_CORE_ERROR("CatalogLoader: No fetcher configured");
        return LoadResult::failure(CatalogError::FetchFailed);
    }

    SLT_CORE_INFO("CatalogLoader: Loading catalog from {} (already decompressed: {})",
                  source_locator, already_decompressed);

    ++m_fetch_attempts;

    std::optional<std::optional<std::string>> fetched;
    try
    {
        // The closure owns copies; an abandoned fetch may outlive this call
        fetched = core::call_with_timeout(
            [fetcher = m_fetcher, source_locator]() { return fetcher->fetch(source_locator); },
            m_fetch_timeout);
    }
    catch (const std::exception& e)
    {
        SLT_CORE_ERROR("CatalogLoader: Fetch of {} threw: {}", source_locator, e.what());
        return LoadResult::failure(CatalogError::FetchFailed);
    }
    catch (...)
    {
        SLT_CORE_ERROR("CatalogLoader: Fetch of {} threw an unknown exception", source_locator);
        return LoadResult::failure(CatalogError::FetchFailed);
    }

    if (!fetched)
    {
        SLT_CORE_ERROR("CatalogLoader: Fetch of {} timed out after {} ms",
                       source_locator, m_fetch_timeout.count());
        return LoadResult::failure(CatalogError::FetchFailed);
    }
    if (!*fetched)
    {
        SLT_CORE_ERROR("CatalogLoader: Fetch of {} failed", source_locator);
        return LoadResult::failure(CatalogError::FetchFailed);
    }

    std::string payload = std::move(**fetched);

    if (!already_decompressed)
    {
        auto inflated = inflate_payload(payload);
        if (!inflated)
        {
            SLT_CORE_ERROR("CatalogLoader: Payload from {} is not a compressed stream; "
                           "check the already_decompressed setting for this source",
                           source_locator);
            return LoadResult::failure(CatalogError::DecodeFailed);
        }
        SLT_CORE_DEBUG("CatalogLoader: Inflated {} -> {} bytes", payload.size(), inflated->size());
        payload = std::move(*inflated);
    }

    ParseReport report = CatalogParser::parse_csv(payload);

    if (report.records.empty())
    {
        SLT_CORE_ERROR("CatalogLoader: No valid stars found in: {} ({} rows, {} malformed)",
                       source_locator, report.data_rows, report.malformed);
        return LoadResult::failure(CatalogError::Empty, report.malformed);
    }

    auto index = std::make_shared<const CatalogIndex>(std::move(report.records));

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    SLT_CORE_INFO("CatalogLoader: Loaded {} stars from {} in {} ms",
                  index->total_count(), source_locator, elapsed.count());

    return LoadResult::success(std::move(index), report.malformed);
}

// -----------------------------------------------------------------
// Introspection and reset
// -----------------------------------------------------------------

bool CatalogLoader::reset()
{
    std::lock_guard lock(m_mutex);
    if (m_state == LoadState::Loading)
    {
        SLT_CORE_WARN("CatalogLoader: reset() ignored while a load is in flight");
        return false;
    }

    SLT_CORE_INFO("CatalogLoader: Reset from {}", to_string(m_state));
    m_state = LoadState::Unloaded;
    m_index.reset();
    m_error.reset();
    return true;
}

LoadState CatalogLoader::state() const
{
    std::lock_guard lock(m_mutex);
    return m_state;
}

std::shared_ptr<const CatalogIndex> CatalogLoader::current_index() const
{
    std::lock_guard lock(m_mutex);
    return m_index;
}

std::optional<CatalogError> CatalogLoader::last_error() const
{
    std::lock_guard lock(m_mutex);
    return m_error;
}

} // namespace starlight::catalog
