#pragma once

#include <cstddef>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "droneid/capture.hpp"
#include "droneid/config.hpp"
#include "droneid/pipeline/radio.hpp"
#include "droneid/pipeline/statistics.hpp"
#include "droneid/rx/receiver.hpp"
#include "droneid/scan/frequency_scanner.hpp"

namespace droneid::pipeline {

// What a worker sends back for every capture it decoded.
struct WorkerReport {
    double center_freq_hz = 0.0;
    std::optional<double> detected_frequency; // unset: nothing decoded
    std::size_t bursts = 0;
    std::size_t crc_valid = 0;
    std::size_t crc_errors = 0;
};

// Sample-queue message; std::nullopt asks one worker to exit.
using CaptureMessage = std::optional<Capture>;

struct SharedState;

// One capture thread owning the radio, a pool of decode workers, and the
// detection feedback loop that locks the capture thread onto a channel.
class Orchestrator {
public:
    // Throws ConfigurationError on a bad config or a radio rate below the
    // OFDM grid rate.
    Orchestrator(const ReceiverConfig& cfg,
                 std::unique_ptr<RadioSource> radio,
                 rx::RecordCallback on_record = {});
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    void start();
    // Ask the capture thread to stop after its current acquisition.
    void request_stop();
    // Bounded shutdown: capture thread first, then one sentinel per worker,
    // then the workers. Threads that miss their deadline are detached.
    // Returns true when every thread joined in time.
    bool stop();

    bool running() const { return running_; }

    SessionStatistics statistics() const;
    scan::ScanState scan_state() const;
    std::optional<double> locked_frequency() const;
    std::size_t captures_dispatched() const;
    std::size_t captures_decoded() const;

private:
    struct Thread {
        std::string name;
        std::thread handle;
        std::future<void> done;
    };

    template <typename Fn>
    Thread spawn(std::string name, Fn&& body);
    bool join_bounded(Thread& t, std::chrono::milliseconds timeout);

    std::shared_ptr<SharedState> shared_;
    Thread capture_;
    std::vector<Thread> workers_;
    bool running_ = false;
};

} // namespace droneid::pipeline
