#pragma once

#include "script/script_source.hpp"
#include "whisper/transcriber.hpp"

#include <expected>
#include <string>

// Persistent handle: the script module and the model are created once and
// owned for the lifetime of the handle. transcribe() only reacquires the
// execution context for the inference call itself.
//
// Move-only. The stored references are released under the execution
// context, so a WhisperModel must not be destroyed while the destroying
// thread already holds a python::Context.
class WhisperModel : public Transcriber {
public:
    static std::expected<WhisperModel, TranscribeError>
        create(const std::string& model, const std::string& device,
               const std::string& compute_type, TranscribeConfig config,
               const std::string& script_source = std::string(script::embedded()));

    // base.en on cpu with int8 weights and the default config. Aborts the
    // process if the model cannot be constructed; use create() to handle
    // the failure instead.
    static WhisperModel create_default();

    WhisperModel(WhisperModel&& other) noexcept;
    WhisperModel& operator=(WhisperModel&&) = delete;
    WhisperModel(const WhisperModel&) = delete;
    WhisperModel& operator=(const WhisperModel&) = delete;
    ~WhisperModel() override;

protected:
    std::expected<python::Object, TranscribeError>
        script_module(const python::Context& ctx) const override;
    std::expected<python::Object, TranscribeError>
        model_handle(const python::Context& ctx, const python::Object& module) const override;

private:
    WhisperModel(TranscribeConfig config, python::Object module, python::Object model);

    python::Object module_;
    python::Object model_;
};
