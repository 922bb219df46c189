#include "droneid/config.hpp"
#include "droneid/debug.hpp"
#include "droneid/errors.hpp"
#include "droneid/frame/telemetry.hpp"
#include "droneid/pipeline/orchestrator.hpp"
#include "droneid/pipeline/radio.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

// Live DroneID receiver front-end. Runs the capture/worker pipeline against a
// radio source until SIGINT/SIGTERM (or --run-seconds) and prints every
// decoded frame as JSON. Without hardware support compiled in, the radio is a
// cf32 recording replayed in a loop.
// Exit codes:
//   0 -> clean shutdown
//   1 -> radio could not be opened
//   2 -> CLI/argument or configuration error

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop.store(true); }

struct ParsedArgs {
    std::filesystem::path input;
    droneid::ReceiverConfig cfg;
    std::optional<double> on_air_hz;
    double run_seconds = 0.0; // 0 = until signalled
};

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options] <file.cf32>\n"
              << "Options:\n"
              << "  -s, --sample-rate <Hz>  Sample rate (default 20e6)\n"
              << "  -g, --gain <dB>         RX gain 0..76 (default AGC)\n"
              << "  -w, --workers <int>     Decode workers (default 2)\n"
              << "  -t, --duration <s>      Capture length per channel (default 0.5)\n"
              << "  -p, --packettype <name> droneid|c2|beacon|pairing|video\n"
              << "  -l, --legacy            Legacy drones (Mavic Pro, Mavic 2)\n"
              << "  -d, --debug             Debug logging\n"
              << "  -v, --verbose           Verbose per-burst logging\n"
              << "  --band-2-4-only         Scan 2.4 GHz channels only (default)\n"
              << "  --all-bands             Scan 2.4 GHz and 5.8 GHz channels\n"
              << "  --prefer-crc-valid      Try all QPSK phases, keep a CRC-valid one\n"
              << "  --save-files            Append decoded frames to decoded_bits_<MMDD_HHMM>.bin\n"
              << "  --output-dir <dir>      Directory for saved files (default .)\n"
              << "  --on-air-mhz <MHz>      Replay the recording only on this channel\n"
              << "  --run-seconds <s>       Stop after this many seconds\n";
}

ParsedArgs parse_args(int argc, char** argv) {
    ParsedArgs args;
    auto& cfg = args.cfg;
    auto value = [&](int& i, const std::string& opt) -> std::string {
        if (i + 1 >= argc) throw std::runtime_error("Missing value for " + opt);
        return argv[++i];
    };
    for (int i = 1; i < argc; ++i) {
        std::string cur = argv[i];
        if (cur == "-s" || cur == "--sample-rate") {
            cfg.sample_rate_hz = std::stod(value(i, cur));
        } else if (cur == "-g" || cur == "--gain") {
            cfg.gain_db = std::stoi(value(i, cur));
        } else if (cur == "-w" || cur == "--workers") {
            cfg.num_workers = static_cast<std::size_t>(std::stoul(value(i, cur)));
        } else if (cur == "-t" || cur == "--duration") {
            cfg.duration_s = std::stod(value(i, cur));
        } else if (cur == "-p" || cur == "--packettype") {
            cfg.packet_type = droneid::parse_packet_type(value(i, cur));
        } else if (cur == "-l" || cur == "--legacy") {
            cfg.legacy = true;
        } else if (cur == "-d" || cur == "--debug") {
            cfg.debug = true;
        } else if (cur == "-v" || cur == "--verbose") {
            cfg.verbose = true;
        } else if (cur == "--band-2-4-only") {
            cfg.band_2_4_only = true;
        } else if (cur == "--all-bands") {
            cfg.band_2_4_only = false;
        } else if (cur == "--prefer-crc-valid") {
            cfg.prefer_crc_valid_phase = true;
        } else if (cur == "--save-files") {
            cfg.save_files = true;
        } else if (cur == "--output-dir") {
            cfg.output_dir = value(i, cur);
        } else if (cur == "--on-air-mhz") {
            args.on_air_hz = std::stod(value(i, cur)) * 1e6;
        } else if (cur == "--run-seconds") {
            args.run_seconds = std::stod(value(i, cur));
        } else if (cur == "--help" || cur == "-h") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (cur.rfind("-", 0) == 0) {
            throw std::runtime_error("Unrecognized option: " + cur);
        } else {
            args.input = cur;
        }
    }
    if (args.input.empty())
        throw std::runtime_error("Missing input file");
    cfg.validate();
    return args;
}

std::filesystem::path session_file(const droneid::ReceiverConfig& cfg) {
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    char name[64];
    std::strftime(name, sizeof(name), "decoded_bits_%m%d_%H%M.bin", &tm);
    std::filesystem::path dir = cfg.output_dir.empty() ? std::filesystem::current_path()
                                                       : std::filesystem::path(cfg.output_dir);
    std::filesystem::create_directories(dir);
    return dir / name;
}

} // namespace

int main(int argc, char** argv) {
    ParsedArgs parsed;
    try {
        parsed = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
        print_usage(argv[0]);
        return 2;
    }
    const auto& cfg = parsed.cfg;
    droneid::debug::set_enabled(cfg.debug || cfg.verbose);

    std::unique_ptr<droneid::pipeline::RadioSource> radio;
    try {
        radio = std::make_unique<droneid::pipeline::FileReplaySource>(parsed.input, cfg.sample_rate_hz, parsed.on_air_hz);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to open radio: %s\n", e.what());
        return 1;
    }

    // Shared with the callback: a worker that misses its join deadline may
    // still write after main returns.
    auto saved = std::make_shared<std::ofstream>();
    if (cfg.save_files) {
        try {
            const auto path = session_file(cfg);
            saved->open(path, std::ios::binary | std::ios::app);
            if (!*saved) throw std::runtime_error("cannot open " + path.string());
            std::printf("Decoded bits: %s\n", path.string().c_str());
        } catch (const std::exception& e) {
            std::fprintf(stderr, "error: %s\n", e.what());
            return 2;
        }
    }

    auto on_record = [saved](const droneid::frame::TelemetryRecord& rec,
                             const droneid::RawFrame& raw, double freq_hz) {
        if (saved->is_open()) {
            saved->write(reinterpret_cast<const char*>(raw.data()), static_cast<std::streamsize>(raw.size()));
            saved->flush();
        }
        const std::string rule(60, '=');
        std::printf("\n%s\n%s\n%s\n", rule.c_str(), droneid::frame::to_json(rec, freq_hz).c_str(), rule.c_str());
        if (!rec.crc_valid)
            std::printf("CRC validation failed\n");
        else
            std::printf("CRC OK\n");
        std::fflush(stdout);
    };

    std::unique_ptr<droneid::pipeline::Orchestrator> orch;
    try {
        orch = std::make_unique<droneid::pipeline::Orchestrator>(cfg, std::move(radio), on_record);
    } catch (const droneid::ConfigurationError& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
        return 2;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::printf("Receiving @ %.2f MHz sample rate, %zu worker(s), packet type %s%s\n",
                cfg.sample_rate_hz / 1e6, cfg.num_workers, droneid::to_string(cfg.packet_type),
                cfg.legacy ? " (legacy)" : "");
    orch->start();

    const auto t0 = std::chrono::steady_clock::now();
    while (!g_stop.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (parsed.run_seconds > 0.0 &&
            std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count() >= parsed.run_seconds)
            break;
    }

    orch->stop();
    std::printf("%s\n", orch->statistics().format_table().c_str());
    return 0;
}
