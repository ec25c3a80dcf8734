#pragma once

#include "config.hpp"
#include "error.hpp"
#include "python/interpreter.hpp"
#include "python/object.hpp"
#include "segment.hpp"

#include <expected>
#include <string>

// Runs transcribe_audio() from the whisper script. Subclasses decide where
// the script module and the model handle come from; the marshalling and
// decoding are shared so every variant produces identical results for the
// same inputs.
class Transcriber {
public:
    virtual ~Transcriber() = default;

    // Acquires the process-wide python::Context for the whole call.
    std::expected<Segments, TranscribeError> transcribe(const std::string& path) const;

    const TranscribeConfig& config() const { return config_; }

protected:
    explicit Transcriber(TranscribeConfig config) : config_(std::move(config)) {}

    Transcriber(const Transcriber&) = default;
    Transcriber(Transcriber&&) = default;

    // Module defining the entry points, valid while ctx is held.
    virtual std::expected<python::Object, TranscribeError>
        script_module(const python::Context& ctx) const = 0;

    // Model handle to pass to transcribe_audio().
    virtual std::expected<python::Object, TranscribeError>
        model_handle(const python::Context& ctx, const python::Object& module) const = 0;

    // Shared by both variants: load, then call new_model().
    static std::expected<python::Object, TranscribeError>
        load_script(const python::Context& ctx, const std::string& source);
    static std::expected<python::Object, TranscribeError>
        construct_model(const python::Context& ctx, const python::Object& module,
                        const std::string& model, const std::string& device,
                        const std::string& compute_type);

private:
    TranscribeConfig config_;
};
