/// @file catalog_parser.cpp
/// @brief Implementation of the HYG-style CSV parser.

#include "catalog/catalog_parser.hpp"

#include "core/logger.hpp"

#include <charconv>
#include <cmath>
#include <unordered_map>

namespace starlight::catalog
{

namespace
{

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

/// @brief Column positions resolved from the header row (-1 = column absent).
struct ColumnMap
{
    i32 id = -1;
    i32 proper = -1;
    i32 ra = -1;
    i32 dec = -1;
    i32 dist = -1;
    i32 mag = -1;
    i32 absmag = -1;
    i32 spect = -1;
    i32 var = -1;
    i32 x = -1;
    i32 y = -1;
    i32 z = -1;
    i32 con = -1;
    i32 bayer = -1;

    [[nodiscard]] bool has_required() const
    {
        return id >= 0 && ra >= 0 && dec >= 0 && mag >= 0;
    }
};

ColumnMap map_columns(const std::vector<std::string>& header)
{
    std::unordered_map<std::string, i32> positions;
    for (std::size_t i = 0; i < header.size(); ++i)
    {
        positions.emplace(std::string(CatalogParser::trim(header[i])), static_cast<i32>(i));
    }

    const auto find = [&positions](const char* name) -> i32
    {
        const auto it = positions.find(name);
        return it == positions.end() ? -1 : it->second;
    };

    return ColumnMap{
        .id     = find("id"),
        .proper = find("proper"),
        .ra     = find("ra"),
        .dec    = find("dec"),
        .dist   = find("dist"),
        .mag    = find("mag"),
        .absmag = find("absmag"),
        .spect  = find("spect"),
        .var    = find("var"),
        .x      = find("x"),
        .y      = find("y"),
        .z      = find("z"),
        .con    = find("con"),
        .bayer  = find("bayer"),
    };
}

std::optional<std::string_view> field(const std::vector<std::string>& values, i32 column)
{
    if (column < 0)
    {
        return std::nullopt;
    }
    const auto text = CatalogParser::trim(values[static_cast<std::size_t>(column)]);
    if (text.empty())
    {
        return std::nullopt;
    }
    return text;
}

std::optional<f64> number_field(const std::vector<std::string>& values, i32 column)
{
    const auto text = field(values, column);
    return text ? CatalogParser::parse_f64(*text) : std::nullopt;
}

std::optional<std::string> text_field(const std::vector<std::string>& values, i32 column)
{
    const auto text = field(values, column);
    return text ? std::optional<std::string>(std::string(*text)) : std::nullopt;
}

RawCatalogRow read_row(const std::vector<std::string>& values, const ColumnMap& columns)
{
    RawCatalogRow row;
    if (const auto id = field(values, columns.id))
    {
        row.id = CatalogParser::parse_i64(*id);
    }
    row.proper = text_field(values, columns.proper);
    row.ra     = number_field(values, columns.ra);
    row.dec    = number_field(values, columns.dec);
    row.dist   = number_field(values, columns.dist);
    row.mag    = number_field(values, columns.mag);
    row.absmag = number_field(values, columns.absmag);
    row.spect  = text_field(values, columns.spect);
    row.var    = text_field(values, columns.var);
    row.x      = number_field(values, columns.x);
    row.y      = number_field(values, columns.y);
    row.z      = number_field(values, columns.z);
    row.con    = text_field(values, columns.con);
    row.bayer  = text_field(values, columns.bayer);
    return row;
}

} // namespace

// -----------------------------------------------------------------
// Parse full payload
// -----------------------------------------------------------------

ParseReport CatalogParser::parse_csv(std::string_view text)
{
    ParseReport report;

    if (text.substr(0, kUtf8Bom.size()) == kUtf8Bom)
    {
        text.remove_prefix(kUtf8Bom.size());
    }

    std::optional<ColumnMap> columns;
    std::size_t header_width = 0;
    u64 line_number = 0;

    while (!text.empty())
    {
        const auto newline = text.find('\n');
        std::string_view line = text.substr(0, newline);
        text.remove_prefix(newline == std::string_view::npos ? text.size() : newline + 1);
        ++line_number;

        if (!line.empty() && line.back() == '\r')
        {
            line.remove_suffix(1);
        }
        if (trim(line).empty() || line.front() == '#')
        {
            continue;
        }

        const auto values = split_csv_line(line);

        if (!columns)
        {
            columns = map_columns(values);
            header_width = values.size();
            if (!columns->has_required())
            {
                SLT_CORE_ERROR("CatalogParser: Header lacks one of id/ra/dec/mag: {}", line);
            }
            continue;
        }

        ++report.data_rows;

        if (!columns->has_required())
        {
            ++report.malformed;
            continue;
        }

        if (values.size() != header_width)
        {
            SLT_CORE_DEBUG("CatalogParser: Line {} has {} fields, expected {}",
                           line_number, values.size(), header_width);
            ++report.malformed;
            continue;
        }

        auto record = promote(read_row(values, *columns));
        if (!record)
        {
            SLT_CORE_DEBUG("CatalogParser: Failed to parse required values on line {}: {}",
                           line_number, line);
            ++report.malformed;
            continue;
        }

        report.records.push_back(std::move(*record));
    }

    if (!columns)
    {
        SLT_CORE_ERROR("CatalogParser: Payload has no header row");
    }

    if (report.malformed > 0)
    {
        SLT_CORE_WARN("CatalogParser: Skipped {} malformed rows", report.malformed);
    }

    return report;
}

// -----------------------------------------------------------------
// Utility: split CSV line, honouring double quotes
// -----------------------------------------------------------------

std::vector<std::string> CatalogParser::split_csv_line(std::string_view line)
{
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;

    for (std::size_t i = 0; i < line.size(); ++i)
    {
        const char c = line[i];
        if (in_quotes)
        {
            if (c == '"')
            {
                if (i + 1 < line.size() && line[i + 1] == '"')
                {
                    current.push_back('"');
                    ++i;
                }
                else
                {
                    in_quotes = false;
                }
            }
            else
            {
                current.push_back(c);
            }
        }
        else if (c == '"')
        {
            in_quotes = true;
        }
        else if (c == ',')
        {
            fields.push_back(std::move(current));
            current.clear();
        }
        else
        {
            current.push_back(c);
        }
    }

    fields.push_back(std::move(current));
    return fields;
}

// -----------------------------------------------------------------
// Utility: trim whitespace
// -----------------------------------------------------------------

std::string_view CatalogParser::trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

// -----------------------------------------------------------------
// Utility: parse f64 from string_view
// -----------------------------------------------------------------

std::optional<f64> CatalogParser::parse_f64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size() || !std::isfinite(value))
    {
        return std::nullopt;
    }

    return value;
}

// -----------------------------------------------------------------
// Utility: parse i64 from string_view
// -----------------------------------------------------------------

std::optional<i64> CatalogParser::parse_i64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    i64 value = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

} // namespace starlight::catalog
