#include "droneid/rx/symbol_extractor.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <vector>

#include "droneid/debug.hpp"
#include "droneid/rx/ofdm.hpp"
#include "droneid/workspace.hpp"

namespace droneid::rx {

namespace {

using cf = std::complex<float>;

// Coherent segments of the timing search. Splitting the reference keeps the
// metric usable with a few kHz of residual offset.
constexpr std::size_t kTimingSegments = 4;
constexpr std::size_t kRefineSpan = 8;

std::size_t next_pow2(std::size_t n) {
    std::size_t p = 1;
    while (p < n) p <<= 1;
    return p;
}

// Segmented normalised correlation of `x` against `ref` for every lag
// 0..x.size()-ref.size(); values lie in [0, 1].
std::vector<float> timing_metric(std::span<const cf> x, const std::vector<cf>& ref) {
    const std::size_t M = ref.size();
    const std::size_t lags = x.size() - M + 1;
    const std::size_t L = next_pow2(x.size() + M);
    const std::size_t seg = M / kTimingSegments;

    FftPlan fwd(L, false), inv(L, true);
    std::vector<cf> X(L), buf(L), R(L), C(L);
    std::fill(buf.begin(), buf.end(), cf{0.f, 0.f});
    std::copy(x.begin(), x.end(), buf.begin());
    fwd.execute(buf.data(), X.data());

    std::vector<double> acc(lags, 0.0);
    for (std::size_t s = 0; s < kTimingSegments; ++s) {
        std::fill(buf.begin(), buf.end(), cf{0.f, 0.f});
        std::copy(ref.begin() + s * seg, ref.begin() + (s + 1) * seg, buf.begin() + s * seg);
        fwd.execute(buf.data(), R.data());
        for (std::size_t k = 0; k < L; ++k) buf[k] = X[k] * std::conj(R[k]);
        inv.execute(buf.data(), C.data());
        for (std::size_t p = 0; p < lags; ++p) acc[p] += std::abs(C[p]) / static_cast<double>(L);
    }

    double er = 0.0;
    for (const auto& v : ref) er += std::norm(v);
    std::vector<double> csum(x.size() + 1, 0.0);
    for (std::size_t i = 0; i < x.size(); ++i) csum[i + 1] = csum[i] + std::norm(x[i]);

    std::vector<float> metric(lags, 0.f);
    for (std::size_t p = 0; p < lags; ++p) {
        const double ex = csum[p + M] - csum[p];
        if (ex > 0.0 && er > 0.0)
            metric[p] = static_cast<float>(acc[p] / std::sqrt(ex * er));
    }
    return metric;
}

// Residual offset in cycles/sample from the cyclic prefixes of every symbol.
double cp_cfo(std::span<const cf> x, std::size_t frame_start, const FrameLayout& L) {
    std::complex<double> acc{0.0, 0.0};
    for (std::size_t s = 0; s < L.symbol_count(); ++s) {
        const std::size_t b = frame_start + L.symbol_start(s);
        for (std::size_t n = 0; n < L.cp_lengths[s]; ++n)
            acc += std::complex<double>(x[b + n]) * std::conj(std::complex<double>(x[b + n + kFftSize]));
    }
    // x[n + N] = x[n] * exp(j 2π ε N), so the product carries -2π ε N.
    return -std::arg(acc) / (2.0 * std::numbers::pi * static_cast<double>(kFftSize));
}

std::vector<cf> demod_symbol(FftPlan& plan, const cf* td) {
    std::vector<cf> bins(kFftSize);
    plan.execute(td, bins.data());
    std::vector<cf> carriers(kDataCarriers);
    for (std::size_t k = 0; k < kDataCarriers; ++k) carriers[k] = bins[carrier_bin(k)];
    return carriers;
}

} // namespace

std::optional<SymbolFrame> extract_symbols(std::span<const cf> burst,
                                           const ExtractorOptions& opt,
                                           ExtractorReport* report) {
    const FrameLayout& L = frame_layout(opt.legacy);
    const std::size_t frame_len = L.total_samples();
    if (burst.size() < frame_len) {
        debug::set_fail(debug::kTruncatedBurst);
        DRONEID_DEBUGF("extract: burst of %zu samples shorter than a frame (%zu)", burst.size(), frame_len);
        return std::nullopt;
    }

    // Useful part of the first reference relative to the frame start.
    const std::size_t ref_off = L.symbol_start(L.zc_first) + L.cp_lengths[L.zc_first];
    const auto ref1 = zc_time_symbol(kZcRootFirst);

    // Coarse timing.
    const auto metric = timing_metric(burst, ref1);
    std::size_t best = 0;
    for (std::size_t p = 1; p < metric.size(); ++p)
        if (metric[p] > metric[best]) best = p;
    if (metric[best] < opt.min_correlation) {
        debug::set_fail(debug::kWeakCorrelation);
        DRONEID_DEBUGF("extract: reference correlation %.3f below %.3f", metric[best], opt.min_correlation);
        return std::nullopt;
    }
    if (best < ref_off || best - ref_off + frame_len > burst.size()) {
        debug::set_fail(debug::kTruncatedBurst);
        DRONEID_DEBUGF("extract: frame at %zu does not fit the burst", best);
        return std::nullopt;
    }
    std::size_t start = best - ref_off;

    // Fine CFO from the cyclic prefixes, then remove it from the whole burst.
    const double eps = cp_cfo(burst, start, L);
    std::vector<cf> x(burst.size());
    for (std::size_t n = 0; n < burst.size(); ++n) {
        const double ph = std::remainder(-2.0 * std::numbers::pi * eps * static_cast<double>(n), 2.0 * std::numbers::pi);
        x[n] = burst[n] * cf(static_cast<float>(std::cos(ph)), static_cast<float>(std::sin(ph)));
    }

    // Coherent refinement around the coarse peak.
    {
        double best_c = -1.0;
        std::size_t best_p = best;
        const std::size_t lo = best > kRefineSpan ? best - kRefineSpan : 0;
        const std::size_t hi = std::min(best + kRefineSpan, x.size() - ref1.size());
        for (std::size_t p = lo; p <= hi; ++p) {
            std::complex<double> c{0.0, 0.0};
            for (std::size_t n = 0; n < ref1.size(); ++n)
                c += std::complex<double>(x[p + n]) * std::conj(std::complex<double>(ref1[n]));
            if (std::abs(c) > best_c) { best_c = std::abs(c); best_p = p; }
        }
        if (best_p >= ref_off && best_p - ref_off + frame_len <= x.size())
            start = best_p - ref_off;
    }

    // FFT windows start slightly inside the cyclic prefix.
    FftPlan plan(kFftSize, false);
    std::vector<std::vector<cf>> grid(L.symbol_count());
    for (std::size_t s = 0; s < L.symbol_count(); ++s) {
        const std::size_t back = std::min(opt.cp_backoff, L.cp_lengths[s]);
        const std::size_t w = start + L.symbol_start(s) + L.cp_lengths[s] - back;
        grid[s] = demod_symbol(plan, x.data() + w);
    }

    // Channel estimate per carrier from both references. The common phase
    // drift between them is spread linearly over the symbol index.
    const auto z1 = zc_carriers(kZcRootFirst);
    const auto z2 = zc_carriers(kZcRootSecond);
    std::vector<cf> h1(kDataCarriers), h2(kDataCarriers);
    std::complex<double> drift{0.0, 0.0};
    for (std::size_t k = 0; k < kDataCarriers; ++k) {
        h1[k] = grid[L.zc_first][k] / z1[k];
        h2[k] = grid[L.zc_second][k] / z2[k];
        drift += std::complex<double>(h2[k]) * std::conj(std::complex<double>(h1[k]));
    }
    const double span = static_cast<double>(L.zc_second - L.zc_first);
    const double dphi = std::arg(drift) / span;
    std::vector<cf> href(kDataCarriers);
    const cf undo = std::polar(1.0f, static_cast<float>(-dphi * span));
    for (std::size_t k = 0; k < kDataCarriers; ++k) href[k] = 0.5f * (h1[k] + h2[k] * undo);

    SymbolFrame frame;
    auto equalise = [&](std::size_t s) {
        const double rel = static_cast<double>(s) - static_cast<double>(L.zc_first);
        const cf rot = std::polar(1.0f, static_cast<float>(dphi * rel));
        std::vector<cf> out(kDataCarriers);
        for (std::size_t k = 0; k < kDataCarriers; ++k) {
            const cf h = href[k] * rot;
            out[k] = std::norm(h) > 1e-20f ? grid[s][k] / h : cf{0.f, 0.f};
        }
        frame.symbols.push_back(std::move(out));
    };
    if (opt.skip_zc) {
        for (std::size_t s : L.payload_symbols) equalise(s);
    } else {
        for (std::size_t s = 0; s < L.symbol_count(); ++s) equalise(s);
    }

    if (report) {
        report->frame_start = start;
        report->correlation = metric[best];
        report->fine_cfo_hz = eps * kCanonicalSampleRateHz;
    }
    DRONEID_DEBUGF("extract: start=%zu corr=%.3f fine_cfo=%.1f Hz", start, metric[best], eps * kCanonicalSampleRateHz);
    return frame;
}

} // namespace droneid::rx
