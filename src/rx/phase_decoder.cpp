#include "droneid/rx/phase_decoder.hpp"

#include <algorithm>
#include <span>
#include <stdexcept>

#include "droneid/debug.hpp"
#include "droneid/errors.hpp"
#include "droneid/utils/bit_packing.hpp"
#include "droneid/utils/gold.hpp"
#include "droneid/utils/rate_match.hpp"

namespace droneid::rx {

namespace {

// Gray mapping of the reference phase, indexed by quadrant.
constexpr std::array<uint8_t, 4> kPhaseZeroBits = {0b00, 0b01, 0b11, 0b10};

} // namespace

int qpsk_quadrant(std::complex<float> p) {
    const bool re = p.real() >= 0.f;
    const bool im = p.imag() >= 0.f;
    if (re && im) return 0;
    if (re) return 1;
    if (!im) return 2;
    return 3;
}

uint8_t qpsk_bits(int quadrant, int phase) {
    if (phase < 0 || phase >= kPhaseHypotheses)
        throw std::out_of_range("QPSK phase hypothesis must be 0..3");
    return kPhaseZeroBits[static_cast<std::size_t>((quadrant + phase) % 4)];
}

std::vector<uint8_t> get_symbol_bits(const SymbolFrame& frame, int phase) {
    if (phase < 0 || phase >= kPhaseHypotheses)
        throw std::out_of_range("QPSK phase hypothesis must be 0..3");
    std::vector<uint8_t> bits;
    bits.reserve(frame.point_count() * 2);
    for (const auto& sym : frame.symbols) {
        for (const auto& p : sym) {
            const uint8_t v = qpsk_bits(qpsk_quadrant(p), phase);
            bits.push_back(static_cast<uint8_t>((v >> 1) & 1u));
            bits.push_back(static_cast<uint8_t>(v & 1u));
        }
    }
    return bits;
}

std::optional<RawFrame> bits_to_frame(const std::vector<uint8_t>& raw_bits) {
    if (raw_bits.size() < kSystematicBits) {
        debug::set_fail(debug::kShortSymbolStream);
        return std::nullopt;
    }
    const std::span<const uint8_t> sys(raw_bits.data(), kSystematicBits);
    auto natural = utils::rate_dematch(sys);
    utils::descramble(natural, kGoldNc, kScramblerSeed);
    const auto bytes = utils::pack_bits_msb_first(natural);
    if (bytes.size() < kRawFrameBytes) {
        debug::set_fail(debug::kShortSymbolStream);
        return std::nullopt;
    }
    RawFrame raw{};
    std::copy(bytes.begin(), bytes.begin() + kRawFrameBytes, raw.begin());
    return raw;
}

std::optional<PhaseDecodeResult> decode_phases(const SymbolFrame& frame, bool prefer_crc_valid) {
    std::optional<PhaseDecodeResult> first;
    for (int phase = 0; phase < kPhaseHypotheses; ++phase) {
        const auto raw = bits_to_frame(get_symbol_bits(frame, phase));
        if (!raw) {
            DRONEID_DEBUGF("phase %d: not enough bits", phase);
            continue;
        }
        PhaseDecodeResult res;
        res.phase = phase;
        res.raw = *raw;
        try {
            res.record = frame::decode(std::span<const uint8_t>(raw->data(), raw->size()));
        } catch (const TextDecodeError& e) {
            debug::set_fail(debug::kTextDecode);
            DRONEID_DEBUGF("phase %d: %s", phase, e.what());
            continue;
        }
        DRONEID_DEBUGF("phase %d: frame parsed, crc %s", phase, res.record.crc_valid ? "ok" : "bad");
        if (!prefer_crc_valid || res.record.crc_valid)
            return res;
        if (!first) first = std::move(res);
    }
    if (!first) debug::set_fail(debug::kNoPhase);
    return first;
}

} // namespace droneid::rx
