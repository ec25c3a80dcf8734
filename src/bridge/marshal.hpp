#pragma once

#include "config.hpp"
#include "error.hpp"
#include "python/interpreter.hpp"
#include "python/object.hpp"
#include "segment.hpp"

#include <expected>
#include <string>
#include <vector>

// Positional contract of the script's entry points.
//
//   new_model(model_name, device, compute_type)
//   transcribe_audio(model, path, prompt, prefix, language, beam_size, best_of,
//                    patience, length_penalty, chunk_length,
//                    (active, threshold, min_speech_ms, max_speech_s,
//                     min_silence_ms, speech_pad_ms))
//     -> sequence of (id, seek, start, end, text, temperature, avg_logprob,
//                     compression_ratio, no_speech_prob)
namespace marshal {

inline constexpr const char* kNewModel = "new_model";
inline constexpr const char* kTranscribeAudio = "transcribe_audio";
inline constexpr size_t kSegmentArity = 9;

std::expected<python::Object, std::string>
model_args(const python::Context& ctx, const std::string& model, const std::string& device,
           const std::string& compute_type);

std::expected<python::Object, std::string>
transcribe_args(const python::Context& ctx, const python::Object& model,
                const std::string& path, const TranscribeConfig& config);

// Fails with ErrorKind::Invocation when the value is not a sequence, and with
// ErrorKind::Decoding when any item is not a 9-tuple of the expected types.
std::expected<std::vector<Segment>, TranscribeError>
decode_segments(const python::Context& ctx, const python::Object& value);

} // namespace marshal
