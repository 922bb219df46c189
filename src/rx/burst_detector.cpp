#include "droneid/rx/burst_detector.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>
#include <numeric>

#include "droneid/debug.hpp"
#include "droneid/rx/offset_estimator.hpp"
#include "droneid/workspace.hpp"

namespace droneid::rx {

std::vector<float> stft_max_profile(std::span<const std::complex<float>> x) {
    constexpr std::size_t N = kDetectorFftSize;
    const std::size_t steps = x.size() / N;
    std::vector<float> prof(steps, 0.f);
    if (steps == 0) return prof;

    std::array<float, N> win{};
    for (std::size_t i = 0; i < N; ++i)
        win[i] = static_cast<float>(0.5 - 0.5 * std::cos(2.0 * std::numbers::pi * i / N));

    FftPlan plan(N, false);
    std::vector<std::complex<float>> buf(N), spec(N);
    for (std::size_t s = 0; s < steps; ++s) {
        const std::complex<float>* blk = x.data() + s * N;
        for (std::size_t i = 0; i < N; ++i) buf[i] = blk[i] * win[i];
        plan.execute(buf.data(), spec.data());
        float m = 0.f;
        for (const auto& v : spec) m = std::max(m, std::abs(v));
        prof[s] = m;
    }
    return prof;
}

BurstDetection detect_bursts(std::span<const std::complex<float>> x,
                             double sample_rate_hz,
                             PacketType type,
                             bool legacy) {
    BurstDetection out;
    const auto prof = stft_max_profile(x);
    if (prof.empty() || !(sample_rate_hz > 0.0)) return out;

    const double noise_floor = std::accumulate(prof.begin(), prof.end(), 0.0) / static_cast<double>(prof.size());
    const double thr = kDetectorThreshold * noise_floor;

    const double dt = static_cast<double>(kDetectorFftSize) / sample_rate_hz;
    const BurstEnvelope env = burst_envelope(type, legacy);
    const auto min_steps = static_cast<std::size_t>(env.min_s / dt);
    const auto max_steps = static_cast<std::size_t>(env.max_s / dt);

    std::size_t i = 0;
    while (i < prof.size() && out.candidates.size() < kMaxCandidatesPerCall) {
        if (prof[i] <= thr) { ++i; continue; }
        const std::size_t begin = i;
        while (i < prof.size() && prof[i] > thr) ++i;
        const std::size_t width = i - begin;
        if (width < min_steps || width > max_steps) continue;

        const double t0 = static_cast<double>(begin) * dt - kBurstGuardSeconds;
        const double t1 = static_cast<double>(i) * dt + kBurstGuardSeconds;
        BurstCandidate c;
        c.start = t0 > 0.0 ? static_cast<std::size_t>(t0 * sample_rate_hz) : 0;
        c.end = std::min(x.size(), static_cast<std::size_t>(t1 * sample_rate_hz));
        c.duration_s = static_cast<double>(width) * dt;

        const auto est = estimate_offset(x.subspan(c.start, c.length()), sample_rate_hz, legacy);
        out.last_offset_hz = est.offset_hz;
        if (!est.found) {
            if (!legacy) {
                debug::set_fail(debug::kOffsetMismatch);
                DRONEID_DEBUGF("burst @%zu len %.1f us: cfo mismatch (bw %.3f MHz)",
                               c.start, c.duration_s * 1e6, est.bandwidth_hz / 1e6);
                continue;
            }
            c.offset_hz = 0.0;
        } else {
            c.offset_hz = est.offset_hz;
        }
        c.offset_valid = true;
        DRONEID_DEBUGF("burst @%zu len %.1f us cfo %.1f Hz", c.start, c.duration_s * 1e6, c.offset_hz);
        out.candidates.push_back(c);
    }
    return out;
}

} // namespace droneid::rx
