#include "droneid/rx/receiver.hpp"

#include <algorithm>
#include <cmath>
#include <exception>

#include "droneid/debug.hpp"
#include "droneid/errors.hpp"
#include "droneid/rx/burst_detector.hpp"
#include "droneid/rx/resample.hpp"
#include "droneid/rx/symbol_extractor.hpp"

namespace droneid::rx {

CaptureDecoder::CaptureDecoder(const ReceiverConfig& cfg) : cfg_(cfg) {
    cfg_.validate();
}

std::optional<SymbolFrame> CaptureDecoder::burst_symbols(std::span<const std::complex<float>> burst,
                                                         double offset_hz,
                                                         double sample_rate_hz) const {
    auto centred = frequency_shift(burst, offset_hz, sample_rate_hz);
    std::vector<std::complex<float>> grid;
    if (sample_rate_hz <= kCanonicalSampleRateHz + kGridRateToleranceHz)
        grid = std::move(centred);
    else
        grid = resample(centred, sample_rate_hz, kCanonicalSampleRateHz);

    ExtractorOptions opt;
    opt.legacy = cfg_.legacy;
    opt.skip_zc = true;
    return extract_symbols(grid, opt);
}

std::optional<PhaseDecodeResult> CaptureDecoder::decode_burst(std::span<const std::complex<float>> burst,
                                                              double offset_hz,
                                                              double sample_rate_hz) const {
    const auto symbols = burst_symbols(burst, offset_hz, sample_rate_hz);
    if (!symbols) return std::nullopt;
    return decode_phases(*symbols, cfg_.prefer_crc_valid_phase);
}

CaptureReport CaptureDecoder::decode(const Capture& cap, const RecordCallback& on_record) {
    if (cap.sample_rate_hz < kCanonicalSampleRateHz - kGridRateToleranceHz)
        throw ConfigurationError("capture rate below the 15.36 MHz OFDM grid");

    CaptureReport rep;
    const std::span<const std::complex<float>> all(cap.samples);
    const auto chunk = std::max<std::size_t>(1, static_cast<std::size_t>(cfg_.chunk_seconds * cap.sample_rate_hz));

    for (std::size_t c0 = 0; c0 < all.size(); c0 += chunk) {
        if (rep.bursts_processed >= cfg_.max_packets_per_capture) break;
        const auto part = all.subspan(c0, std::min(chunk, all.size() - c0));

        const auto det = detect_bursts(part, cap.sample_rate_hz, cfg_.packet_type, cfg_.legacy);
        rep.bursts_detected += det.candidates.size();
        if (det.candidates.empty()) continue;
        DRONEID_DEBUGF("chunk @%zu: %zu candidate(s)", c0, det.candidates.size());

        for (const auto& cand : det.candidates) {
            if (rep.bursts_processed >= cfg_.max_packets_per_capture) break;
            debug::clear_fail();

            std::optional<PhaseDecodeResult> res;
            try {
                const auto symbols = burst_symbols(part.subspan(cand.start, cand.length()), cand.offset_hz, cap.sample_rate_hz);
                if (!symbols) {
                    if (cfg_.verbose) DRONEID_LOGF("symbol extraction failed (step %d)", debug::last_fail_step);
                    continue;
                }
                ++rep.bursts_processed;
                res = decode_phases(*symbols, cfg_.prefer_crc_valid_phase);
            } catch (const std::exception& e) {
                DRONEID_LOGF("burst at sample %zu dropped: %s", c0 + cand.start, e.what());
                continue;
            }
            if (!res) {
                if (cfg_.verbose) DRONEID_LOGF("no QPSK phase produced a frame");
                continue;
            }

            if (res->record.crc_valid) ++rep.crc_valid;
            else ++rep.crc_errors;
            if (on_record) on_record(res->record, res->raw, cap.center_freq_hz);
            rep.records.push_back(res->record);
            rep.raw_frames.push_back(res->raw);
        }
    }
    return rep;
}

} // namespace droneid::rx
