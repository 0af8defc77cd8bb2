#pragma once

/// @file catalog_index.hpp
/// @brief Immutable, query-ready index over the loaded star catalog.

#include "catalog/catalog_record.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace starlight::catalog
{
    /// @brief Read-only catalog with id, name and magnitude lookups.
    ///
    /// Built once from parsed records in a single pass; the magnitude orderings
    /// are stable-sorted once at the end (ties broken by ascending id).
    /// After construction nothing is mutated, so any number of threads may
    /// query concurrently without locking.
    ///
    /// Returned pointers stay valid for the lifetime of the index.
    class CatalogIndex
    {
    public:
        /// @brief Build the index. Records repeating an earlier id are dropped.
        explicit CatalogIndex(std::vector<CatalogRecord> records);

        CatalogIndex(const CatalogIndex&) = delete;
        CatalogIndex& operator=(const CatalogIndex&) = delete;

        /// @brief Retrieve a record by catalog id (nullptr if not found).
        [[nodiscard]] const CatalogRecord* get_by_id(i64 id) const;

        /// @brief All records with min_mag <= magnitude <= max_mag, brightest first.
        [[nodiscard]] std::vector<const CatalogRecord*> get_by_magnitude_range(f64 min_mag, f64 max_mag) const;

        /// @brief Case-insensitive substring match on proper names, in catalog order.
        /// A blank query matches nothing.
        [[nodiscard]] std::vector<const CatalogRecord*> search_by_name(std::string_view query) const;

        /// @brief Records whose proper name equals @p name ignoring case and
        /// surrounding whitespace, in catalog order.
        [[nodiscard]] std::vector<const CatalogRecord*> find_by_exact_name(std::string_view name) const;

        /// @brief All named records, brightest first.
        [[nodiscard]] const std::vector<const CatalogRecord*>& get_named_stars() const { return m_named_by_magnitude; }

        /// @brief Variable stars, in catalog order.
        [[nodiscard]] std::vector<const CatalogRecord*> get_variable_stars() const;

        /// @brief Stars of a constellation (IAU abbreviation, case-insensitive), in catalog order.
        [[nodiscard]] std::vector<const CatalogRecord*> get_by_constellation(std::string_view constellation) const;

        /// @brief Stars whose spectral class starts with @p prefix (case-insensitive), in catalog order.
        [[nodiscard]] std::vector<const CatalogRecord*> get_by_spectral_class(std::string_view prefix) const;

        /// @brief Stars with min_pc <= distance <= max_pc, in catalog order.
        [[nodiscard]] std::vector<const CatalogRecord*> get_by_distance_range(f64 min_pc, f64 max_pc) const;

        /// @brief Number of records held (duplicates excluded).
        [[nodiscard]] std::size_t total_count() const { return m_records.size(); }

        /// @brief Number of input records dropped for repeating an id.
        [[nodiscard]] std::size_t duplicate_count() const { return m_duplicates; }

        /// @brief Access all records in catalog (insertion) order.
        [[nodiscard]] const std::vector<CatalogRecord>& records() const { return m_records; }

    private:
        std::vector<CatalogRecord> m_records;

        std::unordered_map<i64, std::size_t> m_by_id;
        std::vector<const CatalogRecord*> m_by_magnitude;
        std::vector<const CatalogRecord*> m_named_by_magnitude;

        // Lower-cased proper names, parallel to m_records ("" for unnamed)
        std::vector<std::string> m_lower_names;
        std::unordered_map<std::string, std::vector<std::size_t>> m_by_lower_name;

        std::size_t m_duplicates = 0;
    };

    /// @brief ASCII lower-casing used for all case-insensitive catalog lookups.
    [[nodiscard]] std::string to_lower(std::string_view text);

} // namespace starlight::catalog
