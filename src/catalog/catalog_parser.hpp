#pragma once

/// @file catalog_parser.hpp
/// @brief Parses HYG-style CSV text into catalog records.

#include "catalog/catalog_record.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace starlight::catalog
{
    /// @brief Outcome of parsing one catalog payload.
    struct ParseReport
    {
        std::vector<CatalogRecord> records;   ///< Valid rows, in file order
        u64 data_rows = 0;                    ///< Non-empty, non-comment rows after the header
        u64 malformed = 0;                    ///< Rows skipped by validation
    };

    /// @brief Static utility class for parsing the catalog CSV format.
    ///
    /// The first non-comment line is the header; columns are located by name so
    /// the file may carry extra columns in any order. Recognised columns:
    ///   id, proper, ra, dec, dist, mag, absmag, spect, var, x, y, z, con, bayer
    ///
    /// A UTF-8 BOM before the header is removed, lines starting with '#' and blank
    /// lines are ignored, and double-quoted fields may contain commas ("" escapes a quote).
    /// Each row is validated independently; a bad row is counted, never fatal.
    class CatalogParser
    {
    public:
        CatalogParser() = delete;

        /// @brief Parse a complete, already decompressed CSV payload.
        [[nodiscard]] static ParseReport parse_csv(std::string_view text);

        /// @brief Split one CSV line into unquoted, untrimmed fields.
        [[nodiscard]] static std::vector<std::string> split_csv_line(std::string_view line);

        /// @brief Trim leading and trailing whitespace from a string_view.
        [[nodiscard]] static std::string_view trim(std::string_view sv);

        /// @brief Parse a single f64 value from a trimmed string_view.
        /// @return The parsed value, or std::nullopt on failure.
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);

        /// @brief Parse a single i64 value from a trimmed string_view.
        /// @return The parsed value, or std::nullopt on failure.
        [[nodiscard]] static std::optional<i64> parse_i64(std::string_view sv);
    };

} // namespace starlight::catalog
