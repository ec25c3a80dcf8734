#include "whisper/whisper_transcriber.hpp"

WhisperTranscriber::WhisperTranscriber(std::string model, std::string device,
                                       std::string compute_type, TranscribeConfig config,
                                       std::string script_source)
    : Transcriber(std::move(config)), model_(std::move(model)), device_(std::move(device)),
      compute_type_(std::move(compute_type)), script_source_(std::move(script_source)) {}

std::expected<python::Object, TranscribeError>
WhisperTranscriber::script_module(const python::Context& ctx) const {
    return load_script(ctx, script_source_);
}

std::expected<python::Object, TranscribeError>
WhisperTranscriber::model_handle(const python::Context& ctx, const python::Object& module) const {
    return construct_model(ctx, module, model_, device_, compute_type_);
}
