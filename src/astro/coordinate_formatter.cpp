/// @file coordinate_formatter.cpp
/// @brief Implementation of sexagesimal RA/Dec formatting.

#include "astro/coordinate_formatter.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>

namespace starlight::astro
{

namespace
{

// UTF-8 encodings, spelled out so the output does not depend on the source charset
constexpr const char* kMinusSign = "\xE2\x88\x92";   // U+2212 MINUS SIGN
constexpr const char* kDegree    = "\xC2\xB0";       // U+00B0 DEGREE SIGN
constexpr const char* kPrime     = "\xE2\x80\xB2";   // U+2032 PRIME
constexpr const char* kPrime2    = "\xE2\x80\xB3";   // U+2033 DOUBLE PRIME

} // namespace

// -----------------------------------------------------------------
// Right ascension: hours → HHh MMm SS.Ss
//
// Seconds are rounded to tenths; a rounded value of 60.0 carries into
// the minutes (and minutes into hours) so 60.0s is never printed.
// -----------------------------------------------------------------

std::string CoordinateFormatter::format_ra(f64 ra_hours)
{
    i64 hours = static_cast<i64>(std::floor(ra_hours));
    const f64 minutes_f = (ra_hours - static_cast<f64>(hours)) * 60.0;
    i64 minutes = static_cast<i64>(std::floor(minutes_f));
    const f64 seconds = (minutes_f - static_cast<f64>(minutes)) * 60.0;

    i64 tenths = std::llround(seconds * 10.0);
    if (tenths >= 600)
    {
        tenths -= 600;
        ++minutes;
    }
    if (minutes >= 60)
    {
        minutes -= 60;
        ++hours;
    }

    return fmt::format("{:02d}h {:02d}m {:02d}.{:d}s", hours, minutes, tenths / 10, tenths % 10);
}

// -----------------------------------------------------------------
// Declination: degrees → ±DD° MM′ SS″
// -----------------------------------------------------------------

std::string CoordinateFormatter::format_dec(f64 dec_deg)
{
    const char* sign = dec_deg >= 0.0 ? "+" : kMinusSign;
    const f64 magnitude = std::abs(dec_deg);

    i64 degrees = static_cast<i64>(std::floor(magnitude));
    const f64 minutes_f = (magnitude - static_cast<f64>(degrees)) * 60.0;
    i64 minutes = static_cast<i64>(std::floor(minutes_f));
    i64 seconds = std::llround((minutes_f - static_cast<f64>(minutes)) * 60.0);

    if (seconds >= 60)
    {
        seconds -= 60;
        ++minutes;
    }
    if (minutes >= 60)
    {
        minutes -= 60;
        ++degrees;
    }

    return fmt::format("{}{:02d}{} {:02d}{} {:02d}{}",
                       sign, degrees, kDegree, minutes, kPrime, seconds, kPrime2);
}

std::string CoordinateFormatter::format(f64 ra_hours, f64 dec_deg)
{
    return format_ra(ra_hours) + " " + format_dec(dec_deg);
}

} // namespace starlight::astro
