#pragma once

#include <optional>
#include <string>

struct VadConfig {
    bool active = false;
    double threshold = 0.5;
    int min_speech_duration_ms = 250;
    std::optional<int> max_speech_duration_s; // unbounded when absent
    int min_silence_duration_ms = 2000;
    int speech_pad_ms = 400;

    bool operator==(const VadConfig&) const = default;
};

// Decoding options forwarded to transcribe_audio(). Only the std::optional
// fields may be left unset; they cross into Python as the "None" sentinel.
struct TranscribeConfig {
    std::optional<std::string> initial_prompt;
    std::optional<std::string> prefix;
    std::optional<std::string> language;
    int beam_size = 5;
    int best_of = 5;
    double patience = 1.0;
    double length_penalty = 1.0;
    std::optional<int> chunk_length;
    VadConfig vad;

    bool operator==(const TranscribeConfig&) const = default;
};

struct Config {
    struct Model {
        std::string name = "base.en";
        std::string device = "cpu";
        std::string compute_type = "int8";
        bool persistent = false; // keep one model loaded across files
    } model;

    TranscribeConfig transcribe;

    static Config load(const std::string& path);
    static Config load_default();
};
