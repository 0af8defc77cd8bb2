/// @file catalog_record.cpp
/// @brief CatalogRecord helpers and raw-row promotion.

#include "catalog/catalog_record.hpp"

#include <algorithm>
#include <cctype>

namespace starlight::catalog
{

namespace
{

bool is_blank(const std::string& s)
{
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

// Empty or whitespace-only text is treated as absent.
std::optional<std::string> non_blank(const std::optional<std::string>& s)
{
    if (!s || is_blank(*s))
    {
        return std::nullopt;
    }
    return s;
}

} // namespace

bool CatalogRecord::is_named() const
{
    return proper_name && !is_blank(*proper_name);
}

std::string CatalogRecord::display_name() const
{
    if (is_named())
    {
        return *proper_name;
    }
    return "HYG " + std::to_string(id);
}

std::optional<CatalogRecord> promote(const RawCatalogRow& row)
{
    if (!row.id || !row.ra || !row.dec || !row.mag)
    {
        return std::nullopt;
    }

    CatalogRecord record;
    record.id                 = *row.id;
    record.proper_name        = non_blank(row.proper);
    record.ra                 = *row.ra;
    record.dec                = *row.dec;
    record.distance           = std::max(0.0, row.dist.value_or(0.0));
    record.magnitude          = *row.mag;
    record.absolute_magnitude = row.absmag.value_or(0.0);
    record.spectral_class     = non_blank(row.spect);
    record.is_variable        = non_blank(row.var).has_value();
    record.cartesian          = Vec3d{row.x.value_or(0.0), row.y.value_or(0.0), row.z.value_or(0.0)};
    record.constellation      = non_blank(row.con);
    record.bayer              = non_blank(row.bayer);
    return record;
}

} // namespace starlight::catalog
