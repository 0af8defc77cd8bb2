#pragma once

/// @file coordinate_formatter.hpp
/// @brief Sexagesimal formatting of equatorial coordinates.

#include "core/types.hpp"

#include <string>

namespace starlight::astro
{
    /// @brief Static utility class turning RA/Dec floats into the fixed display string.
    ///
    /// Output pattern: `HHh MMm SS.Ss ±DD° MM′ SS″`, e.g. `18h 36m 56.2s +38° 47′ 01″`.
    /// The string is stored verbatim by callers, so the pattern is a compatibility
    /// contract: zero-padded fields, U+2212 for negative declinations, UTF-8 output.
    ///
    /// Inputs outside RA [0,24) / Dec [-90,90] are a caller contract violation;
    /// the output is then unspecified but formatting never fails.
    class CoordinateFormatter
    {
    public:
        CoordinateFormatter() = delete;

        /// @brief Format a full coordinate pair.
        /// @param ra_hours Right ascension in hours, [0, 24).
        /// @param dec_deg Declination in degrees, [-90, 90].
        [[nodiscard]] static std::string format(f64 ra_hours, f64 dec_deg);

        /// @brief Format right ascension only: `HHh MMm SS.Ss` (seconds to one decimal).
        [[nodiscard]] static std::string format_ra(f64 ra_hours);

        /// @brief Format declination only: `±DD° MM′ SS″` (seconds to whole arcseconds).
        [[nodiscard]] static std::string format_dec(f64 dec_deg);
    };

} // namespace starlight::astro
