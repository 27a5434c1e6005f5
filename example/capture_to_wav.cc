/**
 * @example capture_to_wav.cc
 * @brief Record a capture device to a 16 kHz mono WAV file
 *
 * Usage:
 *   audiotap_capture [--list] [--source input|loopback] [--device ID]
 *                    [--seconds N] [--output FILE]
 *
 * With --seconds 0 the capture runs until interrupted with Ctrl+C.
 */

#include <audiotap/capture_config.hh>
#include <audiotap/capture_session.hh>
#include <audiotap/chunk_broadcaster.hh>
#include <audiotap/error.hh>
#include <audiotap/wav_writer.hh>
#include <audiotap_backends/sdl3/sdl3_backend.hh>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {
    std::atomic<bool> g_interrupted{false};

    void on_signal(int) {
        g_interrupted = true;
    }

    struct options {
        bool list = false;
        double seconds = 10.0;
        std::string output = "capture.wav";
    };

    void usage(const char* prog) {
        std::cerr << "Usage: " << prog
                  << " [--list] [--source input|loopback] [--device ID] [--seconds N] [--output FILE]\n";
    }

    // Returns false on a malformed command line
    bool parse_args(int argc, char* argv[], options& opts, audiotap::capture_config& cfg) {
        for (int i = 1; i < argc; i++) {
            const std::string arg = argv[i];
            const bool has_value = i + 1 < argc;

            if (arg == "--list") {
                opts.list = true;
            } else if (arg == "--source" && has_value) {
                cfg.source = audiotap::parse_capture_source(argv[++i]);
            } else if (arg == "--device" && has_value) {
                cfg.device_id = argv[++i];
            } else if (arg == "--seconds" && has_value) {
                char* end = nullptr;
                opts.seconds = std::strtod(argv[++i], &end);
                if (*end != '\0' || opts.seconds < 0) {
                    std::cerr << "Invalid duration: " << argv[i] << '\n';
                    return false;
                }
            } else if (arg == "--output" && has_value) {
                opts.output = argv[++i];
            } else {
                std::cerr << "Unknown argument: " << arg << '\n';
                return false;
            }
        }
        return true;
    }

    void list_devices(audiotap::capture_backend& backend) {
        for (auto source : {audiotap::capture_source::input, audiotap::capture_source::loopback}) {
            std::cout << "=== " << audiotap::to_string(source) << " devices ===\n";
            const auto devices = backend.enumerate_devices(source);
            if (devices.empty()) {
                std::cout << "  (none)\n";
            }
            for (const auto& info : devices) {
                std::cout << "  " << info.id << ": " << info.name
                          << " (" << static_cast<int>(info.format.channels) << " ch, " << info.format.rate << " Hz";
                if (info.is_default) {
                    std::cout << ", DEFAULT";
                }
                std::cout << ")\n";
            }
        }
    }
}

int main(int argc, char* argv[]) {
    options opts;
    audiotap::capture_config cfg;

    try {
        audiotap::apply_environment(cfg);
        if (!parse_args(argc, argv, opts, cfg)) {
            usage(argv[0]);
            return 1;
        }
        cfg.validate();

        std::shared_ptr<audiotap::capture_backend> backend(audiotap::create_sdl3_backend());
        backend->init();

        if (opts.list) {
            list_devices(*backend);
            backend->shutdown();
            return 0;
        }

        audiotap::wav_writer writer(opts.output, cfg.target_rate);
        auto broadcaster = std::make_shared<audiotap::chunk_broadcaster>(cfg.chunk_size, cfg.sink_slots);
        broadcaster->subscribe([&writer](const std::vector<int16_t>& chunk) {
            writer.write(chunk);
        });

        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);

        {
            audiotap::capture_session session(backend, cfg, broadcaster);
            session.start();
            std::cout << "Capturing from " << session.device().name << " into " << opts.output;
            if (opts.seconds > 0) {
                std::cout << " for " << opts.seconds << " s";
            }
            std::cout << " (Ctrl+C to stop)\n";

            const auto deadline = std::chrono::steady_clock::now() +
                                  std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                      std::chrono::duration<double>(opts.seconds));
            while (!g_interrupted) {
                backend->pump_events();
                broadcaster->dispatch();

                if (broadcaster->stream_failed() || session.stream_failed()) {
                    std::cerr << "Capture device lost\n";
                    break;
                }
                if (opts.seconds > 0 && std::chrono::steady_clock::now() >= deadline) {
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }

            session.stop();
            broadcaster->dispatch();

            const auto st = session.stats();
            std::cout << "Frames received:  " << st.frames_received << '\n'
                      << "Samples dropped:  " << st.samples_dropped << '\n'
                      << "Chunks emitted:   " << st.chunks_emitted << '\n'
                      << "Chunks lost:      " << broadcaster->dropped_chunks() << '\n';
        }

        writer.close();
        std::cout << "Wrote " << writer.samples_written() << " samples ("
                  << static_cast<double>(writer.samples_written()) / cfg.target_rate << " s)\n";

        backend->shutdown();
    } catch (const audiotap::device_error& e) {
        std::cerr << "Device error: " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
