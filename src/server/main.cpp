#include "config.hpp"
#include "hallucination_filter.hpp"
#include "http_server.hpp"
#include "transcriber.hpp"
#include "transcription_service.hpp"
#include "whisper/device.hpp"
#include "whisper/whisper_engine.hpp"

#include <atomic>
#include <charconv>
#include <cstdint>
#include <cstring>
#include <print>
#include <pthread.h>
#include <signal.h>
#include <string>
#include <string_view>
#include <thread>

static void usage(const char* prog) {
    std::println("Usage: {} [options]", prog);
    std::println("Options:");
    std::println("  --host HOST         Listen address (default 127.0.0.1)");
    std::println("  --port PORT         Listen port (default $WHISPER_PORT or 5001)");
    std::println("  -c, --config PATH   Config file path");
    std::println("  -v, --verbose       Log every transcription");
    std::println("  -h, --help          Show this help");
    std::println("Environment:");
    std::println("  WHISPER_MODEL, WHISPER_DEVICE, WHISPER_COMPUTE_TYPE, WHISPER_PORT,");
    std::println("  WHISPER_MODELS_DIR, WHISPER_MODEL_PATH, WHISPER_VAD_MODEL");
}

static bool parse_port(std::string_view s, uint16_t& port) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), port);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

// Blocks SIGINT/SIGTERM in this thread and every thread it starts later, so
// the whisper and httplib workers never take them.
static sigset_t block_shutdown_signals() {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &mask, nullptr);
    return mask;
}

int main(int argc, char* argv[]) {
    sigset_t shutdown_mask = block_shutdown_signals();

    bool verbose = false;
    std::string config_path;
    std::string host;
    std::string port_arg;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--host" && i + 1 < argc) {
            host = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            port_arg = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            std::println(stderr, "Unknown or incomplete option: {}", arg);
            usage(argv[0]);
            return 2;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    config.apply_env();
    if (!host.empty()) config.server.host = host;
    if (!port_arg.empty() && !parse_port(port_arg, config.server.port)) {
        std::println(stderr, "Invalid port: {}", port_arg);
        return 2;
    }

    // Model load failure is fatal for the server.
    auto device = resolve_device(config.model.device, config.model.compute_type, probe_accelerator);
    auto engine = WhisperEngine::load(config.model, config.decode, device);
    if (!engine) {
        std::println(stderr, "[kikitori-server] Failed to load model: {}", engine.error());
        return 1;
    }

    HallucinationFilter filter(config.hallucinations);
    Transcriber transcriber(**engine, &filter, config.server.temp_dir);
    TranscriptionService service(transcriber, (*engine)->info(), verbose);

    HttpServer server(service, config.server.max_body_bytes, config.server.read_timeout_s);
    if (!server.bind(config.server.host, config.server.port)) {
        return 1;
    }

    std::atomic<bool> run_returned{false};
    std::thread signal_thread([&server, &shutdown_mask, &run_returned] {
        int sig = 0;
        if (sigwait(&shutdown_mask, &sig) == 0 && !run_returned.load()) {
            std::println(stderr, "\n[kikitori-server] Received {}, shutting down...",
                         strsignal(sig));
            // stop() is a no-op until the accept loop is up.
            server.wait_until_ready();
            server.stop();
        }
    });

    std::println(stderr, "[kikitori-server] Listening on http://{}:{}", config.server.host,
                 server.port());
    std::println(stderr, "[kikitori-server] Health check: http://{}:{}/health",
                 config.server.host, server.port());
    std::println(stderr, "[kikitori-server] POST audio/wav to transcribe");

    bool ok = server.run();
    if (!ok) {
        std::println(stderr, "[kikitori-server] Server stopped with an error");
        // Wake the signal thread so it can be joined.
        run_returned.store(true);
        pthread_kill(signal_thread.native_handle(), SIGTERM);
    }
    signal_thread.join();
    return ok ? 0 : 1;
}
