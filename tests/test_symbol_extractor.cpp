#include <gtest/gtest.h>
#include "droneid/debug.hpp"
#include "droneid/rx/ofdm.hpp"
#include "droneid/rx/phase_decoder.hpp"
#include "droneid/rx/symbol_extractor.hpp"
#include "burst_synth.hpp"
#include <cmath>
#include <numbers>
using namespace droneid;
using namespace droneid::rx;

namespace {

const RawFrame& test_frame() {
    static const RawFrame f = frame::encode(test::sample_fields());
    return f;
}

// Burst at the OFDM grid rate with noise guard on both sides.
std::vector<cfloat> grid_burst(bool legacy, double cfo_hz = 0.0, double phase = 0.0) {
    test::SynthOptions opt;
    opt.sample_rate_hz = kCanonicalSampleRateHz;
    opt.legacy = legacy;
    opt.cfo_hz = cfo_hz;
    opt.phase_rad = phase;
    opt.capture_s = 800e-6;
    opt.burst_times_s = {45e-6};
    return test::synth_capture(test_frame(), opt);
}

} // namespace

TEST(Ofdm, NumerologyAndLayouts) {
    const auto& std_layout = frame_layout(false);
    EXPECT_EQ(std_layout.symbol_count(), 9u);
    EXPECT_EQ(std_layout.total_samples(), 9u * 1024u + 80u * 2u + 72u * 7u);
    EXPECT_EQ(std_layout.payload_symbols.size(), 6u);
    const auto& old = frame_layout(true);
    EXPECT_EQ(old.symbol_count(), 8u);
    EXPECT_EQ(old.zc_first, 2u);
    EXPECT_EQ(old.payload_symbols.size(), 6u);

    EXPECT_EQ(carrier_bin(0), 1024u - 300u);
    EXPECT_EQ(carrier_bin(299), 1023u);
    EXPECT_EQ(carrier_bin(300), 1u);
    EXPECT_EQ(carrier_bin(599), 300u);
    EXPECT_THROW(carrier_bin(600), std::out_of_range);

    const auto z = zadoff_chu(kZcRootFirst);
    ASSERT_EQ(z.size(), 601u);
    for (const auto& v : z) EXPECT_NEAR(std::abs(v), 1.0f, 1e-5f);
    EXPECT_EQ(zc_carriers(kZcRootSecond).size(), kDataCarriers);
}

TEST(SymbolExtractor, RecoversPayloadSymbols) {
    ExtractorReport rep;
    const auto frame = extract_symbols(grid_burst(false, 2e3, 0.7), {}, &rep);
    ASSERT_TRUE(frame.has_value());
    ASSERT_EQ(frame->symbols.size(), 6u);
    EXPECT_EQ(frame->point_count(), 3600u);
    EXPECT_GT(rep.correlation, 0.8f);
    EXPECT_NEAR(rep.fine_cfo_hz, 2e3, 300.0);

    const auto expected = test::frame_to_raw_bits(test_frame());
    const auto bits = get_symbol_bits(*frame, 0);
    ASSERT_EQ(bits.size(), expected.size());
    std::size_t errors = 0;
    for (std::size_t i = 0; i < bits.size(); ++i) errors += bits[i] != expected[i];
    EXPECT_EQ(errors, 0u);
}

TEST(SymbolExtractor, LegacyFrameAndReferenceSymbolsOnRequest) {
    ExtractorOptions opt;
    opt.legacy = true;
    const auto frame = extract_symbols(grid_burst(true), opt);
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->symbols.size(), 6u);

    opt.skip_zc = false;
    const auto all = extract_symbols(grid_burst(true), opt);
    ASSERT_TRUE(all.has_value());
    ASSERT_EQ(all->symbols.size(), 8u);
    // Equalised reference symbol equals the reference sequence.
    const auto z = zc_carriers(kZcRootFirst);
    for (std::size_t k = 0; k < kDataCarriers; k += 50)
        EXPECT_LT(std::abs(all->symbols[2][k] - z[k]), 0.3f) << k;
}

TEST(SymbolExtractor, TruncatedBurstFails) {
    auto x = grid_burst(false);
    x.resize(5000);
    debug::clear_fail();
    EXPECT_FALSE(extract_symbols(x).has_value());
    EXPECT_EQ(debug::last_fail_step, debug::kTruncatedBurst);
}

TEST(SymbolExtractor, NoiseFailsOnCorrelation) {
    const auto x = test::noise(12000, 1.0, 17);
    debug::clear_fail();
    EXPECT_FALSE(extract_symbols(x).has_value());
    EXPECT_EQ(debug::last_fail_step, debug::kWeakCorrelation);
}
