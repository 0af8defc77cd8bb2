#pragma once

/// @file catalog_record.hpp
/// @brief Catalog star record and the typed raw row it is promoted from.

#include "core/types.hpp"

#include <optional>
#include <string>

namespace starlight::catalog
{
    /// @brief One star of the loaded catalog.
    ///
    /// Owned by CatalogIndex once built and never mutated afterwards.
    /// Coordinates follow the HYG conventions: RA in hours, Dec in degrees.
    struct CatalogRecord
    {
        i64 id = 0;                                   ///< Catalog identifier, unique per catalog
        std::optional<std::string> proper_name;       ///< Absent for unnamed stars
        f64 ra = 0.0;                                 ///< Right ascension (hours, 0..24)
        f64 dec = 0.0;                                ///< Declination (degrees, -90..+90)
        f64 distance = 0.0;                           ///< Distance (parsecs)
        f64 magnitude = 0.0;                          ///< Apparent visual magnitude
        f64 absolute_magnitude = 0.0;                 ///< Absolute visual magnitude
        std::optional<std::string> spectral_class;    ///< e.g. "A0V"; first letter drives color
        bool is_variable = false;
        Vec3d cartesian{0.0};                         ///< Heliocentric x/y/z (parsecs), as given
        std::optional<std::string> constellation;     ///< IAU abbreviation, e.g. "Lyr"
        std::optional<std::string> bayer;             ///< Bayer designation, e.g. "Alp"
        bool is_synthetic = false;                    ///< Made by the fallback generator

        /// @brief True when the record carries a non-blank proper name.
        [[nodiscard]] bool is_named() const;

        /// @brief Proper name if present, otherwise "HYG <id>".
        [[nodiscard]] std::string display_name() const;
    };

    /// @brief Strongly typed intermediate for one CSV row.
    ///
    /// Each field is empty when the column is missing or its text did not parse.
    struct RawCatalogRow
    {
        std::optional<i64> id;
        std::optional<std::string> proper;
        std::optional<f64> ra;
        std::optional<f64> dec;
        std::optional<f64> dist;
        std::optional<f64> mag;
        std::optional<f64> absmag;
        std::optional<std::string> spect;
        std::optional<std::string> var;
        std::optional<f64> x;
        std::optional<f64> y;
        std::optional<f64> z;
        std::optional<std::string> con;
        std::optional<std::string> bayer;
    };

    /// @brief Validate a raw row and promote it to a CatalogRecord.
    ///
    /// Required: numeric id, ra, dec and mag. Optional numeric fields default to 0.
    /// @return The record, or std::nullopt if a required field is missing or invalid.
    [[nodiscard]] std::optional<CatalogRecord> promote(const RawCatalogRow& row);

} // namespace starlight::catalog
