#pragma once

#include "script/script_source.hpp"
#include "whisper/transcriber.hpp"

#include <string>

// Ephemeral session: holds no Python state. Each transcribe() loads the
// script and constructs a fresh model inside one critical section, which
// costs a model load per call.
class WhisperTranscriber : public Transcriber {
public:
    WhisperTranscriber(std::string model, std::string device, std::string compute_type,
                       TranscribeConfig config,
                       std::string script_source = std::string(script::embedded()));

    const std::string& model() const { return model_; }
    const std::string& device() const { return device_; }
    const std::string& compute_type() const { return compute_type_; }

protected:
    std::expected<python::Object, TranscribeError>
        script_module(const python::Context& ctx) const override;
    std::expected<python::Object, TranscribeError>
        model_handle(const python::Context& ctx, const python::Object& module) const override;

private:
    std::string model_;
    std::string device_;
    std::string compute_type_;
    std::string script_source_;
};
