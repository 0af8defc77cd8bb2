/// @file catalog_index.cpp
/// @brief CatalogIndex construction and queries.

#include "catalog/catalog_index.hpp"

#include "catalog/catalog_parser.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cctype>

namespace starlight::catalog
{

std::string to_lower(std::string_view text)
{
    std::string out(text);
    for (char& c : out)
    {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

namespace
{

bool magnitude_order(const CatalogRecord* a, const CatalogRecord* b)
{
    if (a->magnitude != b->magnitude)
    {
        return a->magnitude < b->magnitude;
    }
    return a->id < b->id;
}

template <typename Pred>
std::vector<const CatalogRecord*> collect(const std::vector<CatalogRecord>& records, Pred pred)
{
    std::vector<const CatalogRecord*> result;
    for (const auto& r : records)
    {
        if (pred(r))
        {
            result.push_back(&r);
        }
    }
    return result;
}

} // namespace

// -----------------------------------------------------------------
// Construction: one pass over the input, one sort per ordering
// -----------------------------------------------------------------

CatalogIndex::CatalogIndex(std::vector<CatalogRecord> records)
{
    m_records.reserve(records.size());
    m_by_id.reserve(records.size());

    for (auto& record : records)
    {
        if (m_by_id.contains(record.id))
        {
            SLT_CORE_DEBUG("CatalogIndex: Dropping duplicate id {}", record.id);
            ++m_duplicates;
            continue;
        }
        m_by_id.emplace(record.id, m_records.size());
        m_records.push_back(std::move(record));
    }

    // Pointers are taken only after m_records has stopped growing
    m_by_magnitude.reserve(m_records.size());
    m_lower_names.reserve(m_records.size());

    for (std::size_t i = 0; i < m_records.size(); ++i)
    {
        const CatalogRecord& record = m_records[i];
        m_by_magnitude.push_back(&record);

        if (record.is_named())
        {
            m_named_by_magnitude.push_back(&record);
            m_lower_names.push_back(to_lower(*record.proper_name));
            m_by_lower_name[to_lower(CatalogParser::trim(*record.proper_name))].push_back(i);
        }
        else
        {
            m_lower_names.emplace_back();
        }
    }

    std::stable_sort(m_by_magnitude.begin(), m_by_magnitude.end(), magnitude_order);
    std::stable_sort(m_named_by_magnitude.begin(), m_named_by_magnitude.end(), magnitude_order);

    if (m_duplicates > 0)
    {
        SLT_CORE_WARN("CatalogIndex: Dropped {} records with duplicate ids", m_duplicates);
    }

    SLT_CORE_INFO("CatalogIndex: Indexed {} stars ({} named)",
                  m_records.size(), m_named_by_magnitude.size());
}

// -----------------------------------------------------------------
// Lookups
// -----------------------------------------------------------------

const CatalogRecord* CatalogIndex::get_by_id(i64 id) const
{
    const auto it = m_by_id.find(id);
    return it == m_by_id.end() ? nullptr : &m_records[it->second];
}

std::vector<const CatalogRecord*> CatalogIndex::get_by_magnitude_range(f64 min_mag, f64 max_mag) const
{
    if (min_mag > max_mag)
    {
        return {};
    }

    // m_by_magnitude is sorted, so the range is a contiguous slice
    const auto first = std::partition_point(m_by_magnitude.begin(), m_by_magnitude.end(),
        [min_mag](const CatalogRecord* r) { return r->magnitude < min_mag; });
    const auto last = std::partition_point(first, m_by_magnitude.end(),
        [max_mag](const CatalogRecord* r) { return r->magnitude <= max_mag; });

    return {first, last};
}

std::vector<const CatalogRecord*> CatalogIndex::search_by_name(std::string_view query) const
{
    const auto trimmed = CatalogParser::trim(query);
    if (trimmed.empty())
    {
        return {};
    }

    const std::string needle = to_lower(trimmed);
    std::vector<const CatalogRecord*> result;
    for (std::size_t i = 0; i < m_records.size(); ++i)
    {
        if (!m_lower_names[i].empty() && m_lower_names[i].find(needle) != std::string::npos)
        {
            result.push_back(&m_records[i]);
        }
    }
    return result;
}

std::vector<const CatalogRecord*> CatalogIndex::find_by_exact_name(std::string_view name) const
{
    const auto it = m_by_lower_name.find(to_lower(CatalogParser::trim(name)));
    if (it == m_by_lower_name.end())
    {
        return {};
    }

    std::vector<const CatalogRecord*> result;
    result.reserve(it->second.size());
    for (const std::size_t i : it->second)
    {
        result.push_back(&m_records[i]);
    }
    return result;
}

std::vector<const CatalogRecord*> CatalogIndex::get_variable_stars() const
{
    return collect(m_records, [](const CatalogRecord& r) { return r.is_variable; });
}

std::vector<const CatalogRecord*> CatalogIndex::get_by_constellation(std::string_view constellation) const
{
    const std::string wanted = to_lower(CatalogParser::trim(constellation));
    if (wanted.empty())
    {
        return {};
    }
    return collect(m_records, [&wanted](const CatalogRecord& r)
    {
        return r.constellation && to_lower(*r.constellation) == wanted;
    });
}

std::vector<const CatalogRecord*> CatalogIndex::get_by_spectral_class(std::string_view prefix) const
{
    const std::string wanted = to_lower(CatalogParser::trim(prefix));
    if (wanted.empty())
    {
        return {};
    }
    return collect(m_records, [&wanted](const CatalogRecord& r)
    {
        return r.spectral_class && to_lower(*r.spectral_class).starts_with(wanted);
    });
}

std::vector<const CatalogRecord*> CatalogIndex::get_by_distance_range(f64 min_pc, f64 max_pc) const
{
    return collect(m_records, [min_pc, max_pc](const CatalogRecord& r)
    {
        return r.distance >= min_pc && r.distance <= max_pc;
    });
}

} // namespace starlight::catalog
