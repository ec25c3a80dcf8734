#include "segment.hpp"

Segments::Segments(std::vector<Segment> segments)
    : segments_(std::move(segments)) {
    size_t len = 0;
    for (const auto& s : segments_) len += s.text.size();
    text_.reserve(len);
    for (const auto& s : segments_) text_ += s.text;
}

nlohmann::json to_json(const Segment& s) {
    return {
        {"id", s.id},
        {"seek", s.seek},
        {"start", s.start},
        {"end", s.end},
        {"text", s.text},
        {"temperature", s.temperature},
        {"avg_logprob", s.avg_logprob},
        {"compression_ratio", s.compression_ratio},
        {"no_speech_prob", s.no_speech_prob},
    };
}

nlohmann::json to_json(const Segments& result) {
    auto segments = nlohmann::json::array();
    for (const auto& s : result) segments.push_back(to_json(s));
    return {{"text", result.text()}, {"segments", std::move(segments)}};
}
