#pragma once
// suggestion/pcg_rng.hpp - Seedable pseudorandom source for suggestion text and fallback stars
//
// Everything random in the suggestion pipeline draws from one PcgRng so a fixed
// seed reproduces a resolution exactly. Production seeds from std::random_device.

#include "core/types.hpp"

#include <random>

namespace starlight::suggestion {

// -----------------------------------------------------------------------
// Fast PCG-based pseudorandom number generator (PCG-XSH-RR 32/64)
// -----------------------------------------------------------------------
class PcgRng {
public:
    explicit PcgRng(u64 seed, u64 stream = 1)
        : m_state(seed + (stream | 1)), m_inc((stream << 1) | 1) {
        advance();
    }

    /// Seed from the operating system entropy source.
    static PcgRng fromEntropy() {
        std::random_device rd;
        const u64 seed = (static_cast<u64>(rd()) << 32) | rd();
        return PcgRng(seed);
    }

    u32 next() {
        u64 old = m_state;
        m_state = old * 6364136223846793005ULL + m_inc;
        u32 xorshifted = static_cast<u32>(((old >> 18u) ^ old) >> 27u);
        u32 rot = static_cast<u32>(old >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((-rot) & 31));
    }

    /// Uniform double in [0,1)
    f64 nextDouble() {
        return static_cast<f64>(next()) / 4294967296.0;
    }

    /// Uniform double in [lo, hi)
    f64 nextInRange(f64 lo, f64 hi) {
        return lo + nextDouble() * (hi - lo);
    }

    /// Integer in [0, n)
    u32 nextUInt(u32 n) {
        return next() % n;
    }

private:
    u64 m_state;
    u64 m_inc;
    void advance() { next(); }
};

} // namespace starlight::suggestion
