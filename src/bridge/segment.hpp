#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// One timestamped span of recognized speech.
struct Segment {
    int32_t id = 0;
    int32_t seek = 0;
    double start = 0.0; // seconds
    double end = 0.0;
    std::string text;
    double temperature = 0.0;
    double avg_logprob = 0.0;
    double compression_ratio = 0.0;
    double no_speech_prob = 0.0;

    bool operator==(const Segment&) const = default;
};

// Result of one transcription: the segments in the order the model produced
// them, and their text joined without separators.
class Segments {
public:
    Segments() = default;
    explicit Segments(std::vector<Segment> segments);

    const std::string& text() const { return text_; }
    const std::string& to_string() const { return text_; }
    const std::vector<Segment>& segments() const { return segments_; }

    size_t size() const { return segments_.size(); }
    bool empty() const { return segments_.empty(); }
    auto begin() const { return segments_.begin(); }
    auto end() const { return segments_.end(); }

    bool operator==(const Segments&) const = default;

private:
    std::string text_;
    std::vector<Segment> segments_;
};

nlohmann::json to_json(const Segment& segment);
nlohmann::json to_json(const Segments& result);
