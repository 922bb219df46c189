#include "droneid/pipeline/orchestrator.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <mutex>
#include <utility>

#include "droneid/debug.hpp"
#include "droneid/errors.hpp"
#include "droneid/pipeline/blocking_queue.hpp"

namespace droneid::pipeline {

// Everything the threads touch. Held through a shared_ptr so a thread that
// missed its join deadline still sees valid memory after the orchestrator
// is gone.
struct SharedState {
    SharedState(const ReceiverConfig& c, std::unique_ptr<RadioSource> r, rx::RecordCallback cb)
        : cfg(c), radio(std::move(r)), on_record(std::move(cb)),
          samples(c.sample_queue_capacity()), detections(c.sample_queue_capacity() * 4) {}

    const ReceiverConfig cfg;
    std::unique_ptr<RadioSource> radio;
    rx::RecordCallback on_record;
    std::mutex record_mu; // serialises on_record across workers

    BlockingQueue<CaptureMessage> samples;
    BlockingQueue<WorkerReport> detections;

    std::atomic<bool> stop_capture{false};
    std::atomic<bool> stop_workers{false};
    std::atomic<std::size_t> dispatched{0};
    std::atomic<std::size_t> decoded{0};

    mutable std::mutex mu;
    SessionStatistics stats;
    scan::ScanState state = scan::ScanState::Scanning;
    std::optional<double> locked;

    void merge(const WorkerReport& r) {
        std::lock_guard<std::mutex> lock(mu);
        stats.add(r.bursts, r.crc_valid, r.crc_errors);
    }
};

namespace {

constexpr std::chrono::milliseconds kPushRetry{100};
constexpr std::chrono::milliseconds kSentinelTimeout{1000};

// Apply queued worker feedback to the capture thread's scanner.
void apply_feedback(SharedState& sh, scan::FrequencyScanner& scanner) {
    WorkerReport r;
    while (sh.detections.try_pop(r)) {
        sh.merge(r);
        if (r.detected_frequency) {
            if (scanner.state() == scan::ScanState::Scanning) {
                scanner.lock(*r.detected_frequency);
                DRONEID_LOGF("LOCKED to %.2f MHz - continuous monitoring", *r.detected_frequency / 1e6);
            } else {
                scanner.record_detection(true);
            }
        } else if (scanner.state() == scan::ScanState::Locked) {
            scanner.record_detection(false);
            if (scanner.state() == scan::ScanState::Scanning)
                DRONEID_LOGF("No detections for %zu captures, resuming scan", scan::FrequencyScanner::kUnlockThreshold);
        }
    }
    std::lock_guard<std::mutex> lock(sh.mu);
    sh.state = scanner.state();
    sh.locked = scanner.locked_frequency();
}

void capture_loop(SharedState& sh) {
    scan::FrequencyScanner scanner(sh.cfg.band_2_4_only);
    const double rate = sh.radio->sample_rate();
    const std::size_t n = scan::FrequencyScanner::sample_count(sh.cfg.duration_s, rate);

    while (!sh.stop_capture.load()) {
        apply_feedback(sh, scanner);

        const double freq = scanner.next_channel();
        if (!sh.radio->set_frequency(freq)) {
            DRONEID_LOGF("Unable to set center frequency: %.2f MHz", freq / 1e6);
            continue;
        }
        if (scanner.state() == scan::ScanState::Scanning)
            DRONEID_DEBUGF("Scanning: %.2f MHz @ %.2f MHz", freq / 1e6, rate / 1e6);

        Capture cap;
        cap.samples = sh.radio->receive_samples(n);
        if (cap.samples.empty()) {
            DRONEID_DEBUGF("no samples received at %.2f MHz", freq / 1e6);
            continue;
        }
        cap.sample_rate_hz = rate;
        cap.center_freq_hz = freq;
        cap.timestamp = std::chrono::system_clock::now();

        CaptureMessage msg(std::move(cap));
        while (!sh.stop_capture.load()) {
            if (sh.samples.push(std::move(msg), kPushRetry)) {
                ++sh.dispatched;
                break;
            }
        }
    }
    DRONEID_LOGF("Receiver thread stopped");
}

void worker_loop(SharedState& sh, std::size_t id) {
    rx::CaptureDecoder decoder(sh.cfg);
    // Advisory view of the lock; the capture thread's scanner decides.
    scan::FrequencyScanner local(sh.cfg.band_2_4_only);

    rx::RecordCallback emit;
    if (sh.on_record) {
        emit = [&sh](const frame::TelemetryRecord& rec, const RawFrame& raw, double f) {
            std::lock_guard<std::mutex> lock(sh.record_mu);
            sh.on_record(rec, raw, f);
        };
    }

    for (;;) {
        CaptureMessage msg;
        if (!sh.samples.pop(msg, sh.cfg.worker_poll_timeout)) {
            if (sh.stop_workers.load()) break;
            continue;
        }
        if (!msg) break;

        const Capture& cap = *msg;
        const rx::CaptureReport rep = decoder.decode(cap, emit);
        ++sh.decoded;

        WorkerReport r;
        r.center_freq_hz = cap.center_freq_hz;
        if (rep.detected()) r.detected_frequency = cap.center_freq_hz;
        r.bursts = rep.bursts_detected;
        r.crc_valid = rep.crc_valid;
        r.crc_errors = rep.crc_errors;
        if (!sh.detections.push(r, kSentinelTimeout)) {
            // capture thread gone; keep the tallies
            sh.merge(r);
        }

        if (rep.detected()) {
            local.lock(cap.center_freq_hz);
            DRONEID_DEBUGF("worker %zu: locking frequency to %.2f MHz", id, cap.center_freq_hz / 1e6);
        } else {
            local.record_detection(false);
        }

        if (sh.stop_workers.load()) break;
    }
    DRONEID_DEBUGF("worker %zu stopped", id);
}

} // namespace

Orchestrator::Orchestrator(const ReceiverConfig& cfg,
                           std::unique_ptr<RadioSource> radio,
                           rx::RecordCallback on_record) {
    cfg.validate();
    if (!radio)
        throw ConfigurationError("orchestrator needs a radio source");
    if (radio->sample_rate() < kCanonicalSampleRateHz - kGridRateToleranceHz)
        throw ConfigurationError("radio sample rate below the 15.36 MHz OFDM grid");
    shared_ = std::make_shared<SharedState>(cfg, std::move(radio), std::move(on_record));
}

Orchestrator::~Orchestrator() {
    if (running_) stop();
}

template <typename Fn>
Orchestrator::Thread Orchestrator::spawn(std::string name, Fn&& body) {
    std::promise<void> p;
    Thread t;
    t.name = std::move(name);
    t.done = p.get_future();
    t.handle = std::thread([sh = shared_, p = std::move(p), body = std::forward<Fn>(body)]() mutable {
        try {
            body(*sh);
            p.set_value();
        } catch (...) {
            p.set_exception(std::current_exception());
        }
    });
    return t;
}

bool Orchestrator::join_bounded(Thread& t, std::chrono::milliseconds timeout) {
    if (!t.handle.joinable()) return true;
    if (t.done.wait_for(timeout) != std::future_status::ready) {
        DRONEID_LOGF("Warning: %s did not stop cleanly", t.name.c_str());
        t.handle.detach();
        return false;
    }
    t.handle.join();
    try {
        t.done.get();
    } catch (const std::exception& e) {
        DRONEID_LOGF("%s failed: %s", t.name.c_str(), e.what());
    }
    return true;
}

void Orchestrator::start() {
    if (running_) return;
    running_ = true;
    debug::set_enabled(shared_->cfg.debug || shared_->cfg.verbose);

    capture_ = spawn("receiver thread", [](SharedState& sh) { capture_loop(sh); });
    for (std::size_t i = 0; i < shared_->cfg.num_workers; ++i)
        workers_.push_back(spawn("worker " + std::to_string(i),
                                 [i](SharedState& sh) { worker_loop(sh, i); }));
}

void Orchestrator::request_stop() {
    shared_->stop_capture.store(true);
}

bool Orchestrator::stop() {
    if (!running_) return true;
    DRONEID_LOGF("Stopping threads, please wait");
    request_stop();

    bool clean = join_bounded(capture_, shared_->cfg.capture_join_timeout);
    DRONEID_LOGF("Receiver stopped");

    shared_->stop_workers.store(true);
    for (auto& w : workers_) {
        if (w.done.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) continue;
        DRONEID_DEBUGF("Send stop message to %s", w.name.c_str());
        if (!shared_->samples.push(CaptureMessage{}, kSentinelTimeout))
            DRONEID_LOGF("could not queue stop message for %s", w.name.c_str());
    }
    for (auto& w : workers_)
        clean = join_bounded(w, shared_->cfg.worker_join_timeout) && clean;
    workers_.clear();

    // Reports that arrived after the capture thread stopped.
    WorkerReport r;
    while (shared_->detections.try_pop(r)) shared_->merge(r);
    shared_->samples.close();
    shared_->detections.close();

    if (clean)
        shared_->radio->close();
    running_ = false;
    return clean;
}

SessionStatistics Orchestrator::statistics() const {
    std::lock_guard<std::mutex> lock(shared_->mu);
    return shared_->stats;
}

scan::ScanState Orchestrator::scan_state() const {
    std::lock_guard<std::mutex> lock(shared_->mu);
    return shared_->state;
}

std::optional<double> Orchestrator::locked_frequency() const {
    std::lock_guard<std::mutex> lock(shared_->mu);
    return shared_->locked;
}

std::size_t Orchestrator::captures_dispatched() const {
    return shared_->dispatched.load();
}

std::size_t Orchestrator::captures_decoded() const {
    return shared_->decoded.load();
}

} // namespace droneid::pipeline
