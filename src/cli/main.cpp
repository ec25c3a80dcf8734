#include "config.hpp"
#include "script/script_source.hpp"
#include "segment.hpp"
#include "whisper/whisper_model.hpp"
#include "whisper/whisper_transcriber.hpp"

#include <format>
#include <memory>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] <audio>...", prog);
    std::println(stderr, "Options:");
    std::println(stderr, "  -c, --config PATH        Config file path");
    std::println(stderr, "  -m, --model NAME         Model name (default base.en)");
    std::println(stderr, "  -d, --device DEVICE      cpu, cuda or auto");
    std::println(stderr, "  -t, --compute-type TYPE  int8, float16, float32, ...");
    std::println(stderr, "  -l, --language CODE      Source language, detected if unset");
    std::println(stderr, "  -p, --persistent         Load the model once for all files");
    std::println(stderr, "  -s, --script PATH        Use an alternative whisper script");
    std::println(stderr, "  -j, --json               Print segments as JSON");
    std::println(stderr, "  -v, --verbose            Enable verbose logging");
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    bool as_json = false;
    std::string config_path;
    std::string script_path;
    std::string model_name, device, compute_type, language;
    bool persistent = false;
    std::vector<std::string> files;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 < argc) out = argv[++i];
        };
        if (arg == "--config" || arg == "-c") {
            next(config_path);
        } else if (arg == "--model" || arg == "-m") {
            next(model_name);
        } else if (arg == "--device" || arg == "-d") {
            next(device);
        } else if (arg == "--compute-type" || arg == "-t") {
            next(compute_type);
        } else if (arg == "--language" || arg == "-l") {
            next(language);
        } else if (arg == "--script" || arg == "-s") {
            next(script_path);
        } else if (arg == "--persistent" || arg == "-p") {
            persistent = true;
        } else if (arg == "--json" || arg == "-j") {
            as_json = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        } else {
            files.push_back(arg);
        }
    }

    if (files.empty()) {
        usage(argv[0]);
        return 1;
    }

    auto log = [verbose](const std::string& msg) {
        if (verbose) std::println(stderr, "[whisper-bridge] {}", msg);
    };

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (!model_name.empty()) config.model.name = model_name;
    if (!device.empty()) config.model.device = device;
    if (!compute_type.empty()) config.model.compute_type = compute_type;
    if (!language.empty()) config.transcribe.language = language;
    if (persistent) config.model.persistent = true;

    std::string source(script::embedded());
    if (!script_path.empty()) {
        auto loaded = script::read_file(script_path);
        if (!loaded) {
            std::println(stderr, "script: {}", loaded.error());
            return 1;
        }
        source = std::move(*loaded);
        log("Using script " + script_path);
    }

    std::unique_ptr<Transcriber> transcriber;
    if (config.model.persistent) {
        log("Loading " + config.model.name + " on " + config.model.device + " (" +
            config.model.compute_type + ")");
        auto model = WhisperModel::create(config.model.name, config.model.device,
                                          config.model.compute_type, config.transcribe, source);
        if (!model) {
            std::println(stderr, "Error: {} failed: {}", to_string(model.error().kind),
                         model.error().message);
            return 1;
        }
        transcriber = std::make_unique<WhisperModel>(std::move(*model));
    } else {
        transcriber = std::make_unique<WhisperTranscriber>(
            config.model.name, config.model.device, config.model.compute_type,
            config.transcribe, std::move(source));
    }

    int status = 0;
    json results = json::array();

    for (const auto& file : files) {
        log("Transcribing " + file);
        auto result = transcriber->transcribe(file);
        if (!result) {
            std::println(stderr, "Error: {}: {} failed: {}", file,
                         to_string(result.error().kind), result.error().message);
            status = 1;
            continue;
        }
        log(std::format("{}: {} segments", file, result->size()));

        if (as_json) {
            auto entry = to_json(*result);
            entry["file"] = file;
            results.push_back(std::move(entry));
        } else {
            std::println("{}", result->text());
        }
    }

    if (as_json) std::println("{}", results.dump(2));
    return status;
}
