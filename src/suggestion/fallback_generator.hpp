#pragma once
// suggestion/fallback_generator.hpp - Synthetic stars for when no real star can be suggested
//
// Records are drawn uniformly over the sky from the injected PcgRng, so the same
// seed reproduces the same batch. Synthetic records carry negative ids, which
// never collide with catalog ids.

#include "catalog/catalog_record.hpp"
#include "suggestion/pcg_rng.hpp"

#include <string_view>
#include <vector>

namespace starlight::suggestion {

/// Distance modulus: absolute magnitude from apparent magnitude and distance [pc].
f64 absoluteMagnitude(f64 apparent_mag, f64 dist_pc);

/// Heliocentric cartesian position [pc] from RA [hours], Dec [degrees] and distance [pc].
Vec3d cartesianFromEquatorial(f64 ra_hours, f64 dec_deg, f64 dist_pc);

// -----------------------------------------------------------------------
// FallbackGenerator
// -----------------------------------------------------------------------
class FallbackGenerator {
public:
    /// Generate exactly @p count synthetic records named "<Emotion> Star <n>", n = 1..count.
    static std::vector<catalog::CatalogRecord> generate(std::string_view emotion_key,
                                                        int count, PcgRng& rng);

    /// Generate the n-th (1-based) synthetic record of a batch.
    static catalog::CatalogRecord generateStar(std::string_view emotion_key,
                                               int n, PcgRng& rng);
};

} // namespace starlight::suggestion
