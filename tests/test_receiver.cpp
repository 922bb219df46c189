#include <gtest/gtest.h>
#include "droneid/errors.hpp"
#include "droneid/rx/burst_detector.hpp"
#include "droneid/rx/receiver.hpp"
#include "burst_synth.hpp"
#include <chrono>
using namespace droneid;
using namespace droneid::rx;

namespace {

Capture make_capture(const test::SynthOptions& opt, const RawFrame& frame) {
    Capture cap;
    cap.samples = test::synth_capture(frame, opt);
    cap.sample_rate_hz = opt.sample_rate_hz;
    cap.center_freq_hz = 2459.5e6;
    cap.timestamp = std::chrono::system_clock::now();
    return cap;
}

} // namespace

TEST(Receiver, SyntheticCaptureYieldsOneValidRecord) {
    const auto fields = test::sample_fields();
    const RawFrame raw = frame::encode(fields);
    test::SynthOptions opt;
    opt.cfo_hz = 1.25e6;
    opt.phase_rad = 2.0;

    CaptureDecoder dec{ReceiverConfig{}};
    std::size_t callbacks = 0;
    const auto rep = dec.decode(make_capture(opt, raw),
                                [&](const frame::TelemetryRecord& rec, const RawFrame& r, double f) {
                                    ++callbacks;
                                    EXPECT_TRUE(rec.crc_valid);
                                    EXPECT_EQ(r, raw);
                                    EXPECT_DOUBLE_EQ(f, 2459.5e6);
                                });

    EXPECT_EQ(callbacks, 1u);
    EXPECT_EQ(rep.bursts_detected, 1u);
    EXPECT_EQ(rep.bursts_processed, 1u);
    EXPECT_EQ(rep.crc_valid, 1u);
    EXPECT_EQ(rep.crc_errors, 0u);
    ASSERT_EQ(rep.records.size(), 1u);
    EXPECT_TRUE(rep.detected());

    const auto& rec = rep.records[0];
    EXPECT_TRUE(rec.crc_valid);
    EXPECT_EQ(rec.serial_number, fields.serial_number);
    EXPECT_EQ(rec.uuid, fields.uuid);
    EXPECT_NEAR(rec.latitude, fields.latitude / 174533.0, 1e-10);
    EXPECT_NEAR(rec.longitude, fields.longitude / 174533.0, 1e-10);
    EXPECT_DOUBLE_EQ(rec.altitude, 128.01);
    EXPECT_DOUBLE_EQ(rec.height, 49.98);
    EXPECT_EQ(rec.sequence_number, fields.sequence_number);
}

TEST(Receiver, NativeGridRateNeedsNoResampling) {
    const RawFrame raw = frame::encode(test::sample_fields());
    test::SynthOptions opt;
    opt.sample_rate_hz = kCanonicalSampleRateHz;
    opt.cfo_hz = -0.8e6;
    CaptureDecoder dec{ReceiverConfig{}};
    const auto rep = dec.decode(make_capture(opt, raw));
    ASSERT_EQ(rep.records.size(), 1u);
    EXPECT_TRUE(rep.records[0].crc_valid);
}

TEST(Receiver, RateJustBelowTheGridIsUsedAsIs) {
    const RawFrame raw = frame::encode(test::sample_fields());
    test::SynthOptions opt;
    opt.sample_rate_hz = kCanonicalSampleRateHz;
    Capture cap = make_capture(opt, raw);
    cap.sample_rate_hz = kCanonicalSampleRateHz - kGridRateToleranceHz;

    CaptureDecoder dec{ReceiverConfig{}};
    CaptureReport rep;
    ASSERT_NO_THROW(rep = dec.decode(cap));
    EXPECT_EQ(rep.bursts_processed, 1u);
    ASSERT_EQ(rep.records.size(), 1u);
    EXPECT_TRUE(rep.records[0].crc_valid);

    cap.sample_rate_hz = kCanonicalSampleRateHz - 2.0 * kGridRateToleranceHz;
    EXPECT_THROW(dec.decode(cap), ConfigurationError);
}

TEST(Receiver, CorruptFrameCountsAsCrcError) {
    RawFrame raw = frame::encode(test::sample_fields());
    raw[40] ^= 0x01;
    test::SynthOptions opt;
    CaptureDecoder dec{ReceiverConfig{}};
    const auto rep = dec.decode(make_capture(opt, raw));
    EXPECT_EQ(rep.crc_valid, 0u);
    EXPECT_EQ(rep.crc_errors, 1u);
    ASSERT_EQ(rep.records.size(), 1u);
    EXPECT_FALSE(rep.records[0].crc_valid);
    EXPECT_TRUE(rep.detected());
}

TEST(Receiver, NoiseOnlyCapture) {
    Capture cap;
    cap.samples = test::noise(static_cast<std::size_t>(20e-3 * 20e6), 1.0, 41);
    cap.sample_rate_hz = 20e6;
    cap.center_freq_hz = 2444.5e6;
    CaptureDecoder dec{ReceiverConfig{}};
    const auto rep = dec.decode(cap);
    EXPECT_EQ(rep.bursts_detected, 0u);
    EXPECT_FALSE(rep.detected());
}

TEST(Receiver, ProcessedBurstsAreCapped) {
    const RawFrame raw = frame::encode(test::sample_fields());
    test::SynthOptions opt;
    opt.capture_s = 8e-3;
    opt.burst_times_s = {1e-3, 4e-3};
    ReceiverConfig cfg;
    cfg.max_packets_per_capture = 1;
    CaptureDecoder dec(cfg);
    const auto rep = dec.decode(make_capture(opt, raw));
    EXPECT_EQ(rep.bursts_detected, 2u);
    EXPECT_EQ(rep.bursts_processed, 1u);
    EXPECT_EQ(rep.records.size(), 1u);
}

TEST(Receiver, ChunksAreSearchedIndependently) {
    const RawFrame raw = frame::encode(test::sample_fields());
    test::SynthOptions opt;
    opt.capture_s = 8e-3;
    opt.burst_times_s = {1e-3, 5e-3};
    ReceiverConfig cfg;
    cfg.chunk_seconds = 4e-3;
    CaptureDecoder dec(cfg);
    const auto rep = dec.decode(make_capture(opt, raw));
    EXPECT_EQ(rep.bursts_detected, 2u);
    EXPECT_EQ(rep.crc_valid, 2u);
}

TEST(Receiver, RejectsRatesBelowTheGrid) {
    Capture cap;
    cap.samples.assign(1000, {0.f, 0.f});
    cap.sample_rate_hz = 10e6;
    CaptureDecoder dec{ReceiverConfig{}};
    EXPECT_THROW(dec.decode(cap), ConfigurationError);

    ReceiverConfig bad;
    bad.num_workers = 0;
    EXPECT_THROW(CaptureDecoder{bad}, ConfigurationError);
}
