#include "audio/CaptureSession.hpp"
#include "audio/PortAudioCapture.hpp"
#include "audio/StopSignal.hpp"
#include "audio/SyntheticAudioCapture.hpp"
#include "config/CaptureConfig.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <memory>
#include <string>
#include <vector>
#include <unistd.h>

static std::string getEnv(const std::string& key,
                          const std::string& defaultVal = "") {
    const char* val = std::getenv(key.c_str());
    return val ? val : defaultVal;
}

static void loadDotEnv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return;

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        // Remove quotes
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
            val = val.substr(1, val.size() - 2);
        setenv(key.c_str(), val.c_str(), 0);  // don't override existing
    }
}

static void setLogLevel(const std::string& level) {
    if (level == "debug")      spdlog::set_level(spdlog::level::debug);
    else if (level == "warn")  spdlog::set_level(spdlog::level::warn);
    else if (level == "error") spdlog::set_level(spdlog::level::err);
    else                       spdlog::set_level(spdlog::level::info);
}

static void printUsage() {
    std::printf(
        "Usage: voxcap [options] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  record [seconds]   Fixed-duration capture (0 = toggle mode)\n"
        "  toggle [max]       Record until SIGUSR1, at most max seconds\n"
        "  devices            List input devices\n"
        "\n"
        "Options:\n"
        "  --config <path>    Config file (default config/capture.json)\n"
        "  --out <path>       Write captured audio as raw f32le mono\n"
        "  --device <name>    Input device (overrides config)\n"
        "  --synthetic        Use the simulated 48 kHz microphone\n");
}

struct CliArgs {
    std::string command;
    std::vector<std::string> positional;
    std::string configPath = "config/capture.json";
    std::string outPath;
    std::string device;
    bool synthetic = false;
    bool help      = false;
};

static CliArgs parseArgs(int argc, char* argv[]) {
    CliArgs args;
    for (int i = 1; i < argc; i++) {
        std::string a = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc)
                throw std::invalid_argument("missing value for " + a);
            return argv[++i];
        };

        if (a == "--config")          args.configPath = next();
        else if (a == "--out")        args.outPath = next();
        else if (a == "--device")     args.device = next();
        else if (a == "--synthetic")  args.synthetic = true;
        else if (a == "-h" || a == "--help") args.help = true;
        else if (a.size() > 1 && a[0] == '-')
            throw std::invalid_argument("unknown option " + a);
        else if (args.command.empty()) args.command = a;
        else                           args.positional.push_back(a);
    }
    return args;
}

static int parseSeconds(const std::vector<std::string>& positional, int fallback) {
    if (positional.empty()) return fallback;
    size_t used = 0;
    int secs = std::stoi(positional[0], &used);
    if (used != positional[0].size() || secs < 0)
        throw std::invalid_argument("invalid duration '" + positional[0] + "'");
    return secs;
}

static bool writeRaw(const std::string& path, const std::vector<float>& samples) {
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        spdlog::error("Cannot open output file: {}", path);
        return false;
    }
    // Host order; every supported target is little-endian
    out.write(reinterpret_cast<const char*>(samples.data()),
              (std::streamsize)(samples.size() * sizeof(float)));
    if (!out) {
        spdlog::error("Failed writing {}", path);
        return false;
    }
    spdlog::info("Wrote {} samples to {}", samples.size(), path);
    return true;
}

static int listDevices(IAudioCapture& capture) {
    auto devices = capture.listDevices();
    if (devices.empty()) {
        spdlog::warn("No {} input devices found", capture.backendName());
        return 1;
    }
    for (const auto& d : devices) {
        std::printf("%c %3d  %-40s %-12s %d ch  %.0f Hz\n",
                    d.isDefault ? '*' : ' ', d.id, d.name.c_str(),
                    d.hostApi.c_str(), d.maxInputChannels, d.defaultSampleRate);
    }
    return 0;
}

static int runCommand(const CliArgs& args, const CaptureConfig& config) {
    ManualClock virtualClock;
    SystemClock systemClock;

    std::unique_ptr<IAudioCapture> capture;
    Clock* clock = &systemClock;
    if (args.synthetic) {
        capture = std::make_unique<SyntheticAudioCapture>(virtualClock);
        clock = &virtualClock;
    } else {
        capture = std::make_unique<PortAudioCapture>();
    }

    if (args.command == "devices")
        return listDevices(*capture);

    CaptureOptions options = config.toCaptureOptions();
    if (!args.device.empty()) options.stream.device = args.device;

    CaptureSession session(*capture, *clock, options);
    std::vector<float> audio;

    int secs = 0;
    bool toggle = false;
    if (args.command == "record") {
        secs = parseSeconds(args.positional, 5);
        toggle = secs == 0;
        if (toggle) secs = config.timeoutSecs;
    } else if (args.command == "toggle") {
        secs = parseSeconds(args.positional, config.timeoutSecs);
        toggle = true;
        if (secs == 0)
            throw std::invalid_argument("toggle needs a positive maximum duration");
    } else {
        printUsage();
        return 1;
    }

    if (toggle) {
        StopSignal::reset();
        if (!StopSignal::install()) return 1;
        spdlog::info("Toggle mode: send SIGUSR1 to pid {} to stop", (long)getpid());
        audio = session.captureToggle(secs, [] { return StopSignal::requested(); });
    } else {
        audio = session.capture(secs);
    }

    const auto& stats = session.lastStats();
    spdlog::info("Stopped: {} after {:.2f}s ({} callbacks, {} dropped)",
                 TerminationController::reasonName(stats.reason), stats.elapsedSecs,
                 stats.callbacks, stats.droppedCallbacks);

    if (audio.empty()) return 2;
    if (!args.outPath.empty() && !writeRaw(args.outPath, audio)) return 1;
    return 0;
}

int main(int argc, char* argv[]) {
    // Load .env file
    loadDotEnv(".env");

    // Setup logging
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto fileSink    = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        "voxcap.log", 1048576 * 5, 3);  // 5MB, 3 files

    auto logger = std::make_shared<spdlog::logger>(
        "voxcap",
        spdlog::sinks_init_list{consoleSink, fileSink});
    spdlog::set_default_logger(logger);
    setLogLevel(getEnv("VOXCAP_LOG_LEVEL", "info"));

    try {
        CliArgs args = parseArgs(argc, argv);
        if (args.help || args.command.empty()) {
            printUsage();
            return args.help ? 0 : 1;
        }

        CaptureConfig config = CaptureConfig::load(args.configPath);

        // Environment wins over the config file
        setLogLevel(getEnv("VOXCAP_LOG_LEVEL", config.logLevel));

        return runCommand(args, config);
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
}
