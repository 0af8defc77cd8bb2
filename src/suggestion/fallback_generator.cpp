// suggestion/fallback_generator.cpp
#include "suggestion/fallback_generator.hpp"
#include "suggestion/emotion.hpp"

#include <spdlog/fmt/fmt.h>

#include <array>
#include <cmath>

namespace starlight::suggestion {

namespace {
constexpr std::array<char, 7> kSpectralLetters{'O', 'B', 'A', 'F', 'G', 'K', 'M'};
}

f64 absoluteMagnitude(f64 apparent_mag, f64 dist_pc) {
    // m - M = 5 log10(d / 10 pc)
    return apparent_mag - 5.0 * std::log10(dist_pc / 10.0);
}

Vec3d cartesianFromEquatorial(f64 ra_hours, f64 dec_deg, f64 dist_pc) {
    using namespace astro_constants;
    const f64 ra  = ra_hours * kHourToRad;
    const f64 dec = dec_deg * kDegToRad;
    return Vec3d{dist_pc * std::cos(dec) * std::cos(ra),
                 dist_pc * std::cos(dec) * std::sin(ra),
                 dist_pc * std::sin(dec)};
}

// -----------------------------------------------------------------------
// FallbackGenerator
// -----------------------------------------------------------------------
catalog::CatalogRecord FallbackGenerator::generateStar(std::string_view emotion_key,
                                                       int n, PcgRng& rng) {
    // Uniform in degrees, stored in hours as the catalog does
    const f64 ra_deg  = rng.nextInRange(0.0, 360.0);
    const f64 dec_deg = rng.nextInRange(-90.0, 90.0);
    const f64 dist_pc = rng.nextInRange(10.0, 110.0);
    const f64 v_mag   = rng.nextInRange(0.0, 6.0);

    catalog::CatalogRecord r;
    r.id                 = -static_cast<i64>(n);
    r.proper_name        = fmt::format("{} Star {}", emotion_display_name(emotion_key), n);
    r.ra                 = ra_deg / astro_constants::kDegPerHour;
    r.dec                = dec_deg;
    r.distance           = dist_pc;
    r.magnitude          = v_mag;
    r.absolute_magnitude = absoluteMagnitude(v_mag, dist_pc);
    r.spectral_class     = std::string(1, kSpectralLetters[rng.nextUInt(static_cast<u32>(kSpectralLetters.size()))]);
    r.is_variable        = false;
    r.cartesian          = cartesianFromEquatorial(r.ra, r.dec, dist_pc);
    r.is_synthetic       = true;
    return r;
}

std::vector<catalog::CatalogRecord> FallbackGenerator::generate(std::string_view emotion_key,
                                                               int count, PcgRng& rng) {
    std::vector<catalog::CatalogRecord> result;
    if (count <= 0) {
        return result;
    }
    result.reserve(static_cast<std::size_t>(count));
    for (int n = 1; n <= count; ++n) {
        result.push_back(generateStar(emotion_key, n, rng));
    }
    return result;
}

} // namespace starlight::suggestion
