#include "droneid/rx/offset_estimator.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <vector>

#include "droneid/debug.hpp"
#include "droneid/workspace.hpp"

namespace droneid::rx {

namespace {

constexpr std::size_t kMinWelchSize = 256;
constexpr std::size_t kMaxWelchSize = 4096;
constexpr double kMinPeakToFloorDb = 6.0;

std::size_t welch_size(std::size_t n) {
    std::size_t p = 1;
    while (p * 2 <= n / 4 && p * 2 <= kMaxWelchSize) p *= 2;
    return p;
}

// Averaged |X|^2 over 50%-overlapping Hann segments, DC moved to the centre.
std::vector<double> welch_psd(std::span<const std::complex<float>> x, std::size_t nfft) {
    std::vector<float> win(nfft);
    for (std::size_t i = 0; i < nfft; ++i)
        win[i] = static_cast<float>(0.5 - 0.5 * std::cos(2.0 * std::numbers::pi * i / nfft));

    FftPlan plan(nfft, false);
    std::vector<std::complex<float>> seg(nfft), spec(nfft);
    std::vector<double> psd(nfft, 0.0);
    std::size_t segments = 0;
    for (std::size_t off = 0; off + nfft <= x.size(); off += nfft / 2) {
        for (std::size_t i = 0; i < nfft; ++i) seg[i] = x[off + i] * win[i];
        plan.execute(seg.data(), spec.data());
        for (std::size_t k = 0; k < nfft; ++k)
            psd[(k + nfft / 2) % nfft] += std::norm(spec[k]);
        ++segments;
    }
    for (auto& v : psd) v /= static_cast<double>(std::max<std::size_t>(segments, 1));
    return psd;
}

std::vector<double> smooth(const std::vector<double>& v, std::size_t width) {
    std::vector<double> out(v.size());
    const std::size_t half = width / 2;
    for (std::size_t i = 0; i < v.size(); ++i) {
        const std::size_t lo = i >= half ? i - half : 0;
        const std::size_t hi = std::min(v.size() - 1, i + half);
        double acc = 0.0;
        for (std::size_t j = lo; j <= hi; ++j) acc += v[j];
        out[i] = acc / static_cast<double>(hi - lo + 1);
    }
    return out;
}

// Fractional position where the dB curve crosses `thr` between bins a and b.
double crossing(const std::vector<double>& db, std::size_t a, std::size_t b, double thr) {
    const double da = db[a], d_b = db[b];
    if (std::abs(da - d_b) < 1e-12) return static_cast<double>(a);
    const double t = (thr - da) / (d_b - da);
    return static_cast<double>(a) + t * (static_cast<double>(b) - static_cast<double>(a));
}

} // namespace

OffsetEstimate estimate_offset(std::span<const std::complex<float>> x,
                               double sample_rate_hz,
                               bool skip_bw_check) {
    OffsetEstimate est;
    est.found = skip_bw_check;

    const std::size_t nfft = welch_size(x.size());
    if (nfft < kMinWelchSize || !(sample_rate_hz > 0.0)) {
        DRONEID_DEBUGF("offset: %zu samples too short for a spectrum", x.size());
        return est;
    }

    const auto psd = smooth(welch_psd(x, nfft), std::max<std::size_t>(3, nfft / 128));
    std::vector<double> db(nfft);
    for (std::size_t k = 0; k < nfft; ++k) db[k] = 10.0 * std::log10(psd[k] + 1e-30);

    std::vector<double> sorted = db;
    const std::size_t p10 = nfft / 10;
    std::nth_element(sorted.begin(), sorted.begin() + p10, sorted.end());
    const double floor_db = sorted[p10];
    const double peak_db = *std::max_element(db.begin(), db.end());
    if (peak_db - floor_db < kMinPeakToFloorDb) {
        DRONEID_DEBUGF("offset: no band above floor (%.1f dB span)", peak_db - floor_db);
        return est;
    }
    const double thr = 0.5 * (floor_db + peak_db);

    std::size_t lo = 0, hi = nfft - 1;
    while (lo < nfft && db[lo] < thr) ++lo;
    while (hi > lo && db[hi] < thr) --hi;

    const double lo_edge = lo > 0 ? crossing(db, lo - 1, lo, thr) : 0.0;
    const double hi_edge = hi + 1 < nfft ? crossing(db, hi, hi + 1, thr) : static_cast<double>(nfft - 1);

    const double bin_hz = sample_rate_hz / static_cast<double>(nfft);
    const double centre_bin = 0.5 * (lo_edge + hi_edge) - static_cast<double>(nfft / 2);
    est.bandwidth_hz = (hi_edge - lo_edge) * bin_hz;
    est.offset_hz = centre_bin * bin_hz;

    const bool width_ok = est.bandwidth_hz >= kMinOccupiedBandwidthHz &&
                          est.bandwidth_hz <= kMaxOccupiedBandwidthHz;
    est.found = skip_bw_check || width_ok;
    DRONEID_DEBUGF("offset: bw=%.3f MHz centre=%.3f MHz %s", est.bandwidth_hz / 1e6,
                   est.offset_hz / 1e6, width_ok ? "ok" : "mismatch");
    return est;
}

} // namespace droneid::rx
