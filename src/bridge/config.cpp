#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Missing key keeps the default, null clears it.
template <typename T>
void read_optional(const json& j, const char* key, std::optional<T>& out) {
    if (!j.contains(key)) return;
    if (j[key].is_null()) {
        out.reset();
    } else {
        out = j[key].get<T>();
    }
}

void read_vad(const json& v, VadConfig& vad) {
    if (v.contains("active")) vad.active = v["active"].get<bool>();
    if (v.contains("threshold")) vad.threshold = v["threshold"].get<double>();
    if (v.contains("min_speech_duration_ms"))
        vad.min_speech_duration_ms = v["min_speech_duration_ms"].get<int>();
    read_optional(v, "max_speech_duration_s", vad.max_speech_duration_s);
    if (v.contains("min_silence_duration_ms"))
        vad.min_silence_duration_ms = v["min_silence_duration_ms"].get<int>();
    if (v.contains("speech_pad_ms")) vad.speech_pad_ms = v["speech_pad_ms"].get<int>();
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("model")) {
            auto& m = j["model"];
            if (m.contains("name")) cfg.model.name = m["name"].get<std::string>();
            if (m.contains("device")) cfg.model.device = m["device"].get<std::string>();
            if (m.contains("compute_type")) cfg.model.compute_type = m["compute_type"].get<std::string>();
            if (m.contains("persistent")) cfg.model.persistent = m["persistent"].get<bool>();
        }

        if (j.contains("transcribe")) {
            auto& t = j["transcribe"];
            auto& tc = cfg.transcribe;
            read_optional(t, "initial_prompt", tc.initial_prompt);
            read_optional(t, "prefix", tc.prefix);
            read_optional(t, "language", tc.language);
            if (t.contains("beam_size")) tc.beam_size = t["beam_size"].get<int>();
            if (t.contains("best_of")) tc.best_of = t["best_of"].get<int>();
            if (t.contains("patience")) tc.patience = t["patience"].get<double>();
            if (t.contains("length_penalty")) tc.length_penalty = t["length_penalty"].get<double>();
            read_optional(t, "chunk_length", tc.chunk_length);
            if (t.contains("vad")) read_vad(t["vad"], tc.vad);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
