#include "whisper/whisper_model.hpp"

#include "error.hpp"

#include <cstdlib>
#include <print>

WhisperModel::WhisperModel(TranscribeConfig config, python::Object module, python::Object model)
    : Transcriber(std::move(config)), module_(std::move(module)), model_(std::move(model)) {}

WhisperModel::WhisperModel(WhisperModel&& other) noexcept = default;

WhisperModel::~WhisperModel() {
    if (!module_ && !model_) return; // moved from

    python::Context ctx;
    model_.reset();
    module_.reset();
}

std::expected<WhisperModel, TranscribeError>
WhisperModel::create(const std::string& model, const std::string& device,
                     const std::string& compute_type, TranscribeConfig config,
                     const std::string& script_source) {
    python::Context ctx;

    auto module = load_script(ctx, script_source);
    if (!module) return std::unexpected(std::move(module.error()));

    auto handle = construct_model(ctx, *module, model, device, compute_type);
    if (!handle) return std::unexpected(std::move(handle.error()));

    return WhisperModel(std::move(config), std::move(*module), std::move(*handle));
}

WhisperModel WhisperModel::create_default() {
    auto model = create("base.en", "cpu", "int8", TranscribeConfig{});
    if (!model) {
        std::println(stderr, "whisper: failed to construct default model ({}): {}",
                     to_string(model.error().kind), model.error().message);
        std::abort();
    }
    return std::move(*model);
}

std::expected<python::Object, TranscribeError>
WhisperModel::script_module(const python::Context& /*ctx*/) const {
    return module_;
}

std::expected<python::Object, TranscribeError>
WhisperModel::model_handle(const python::Context& /*ctx*/, const python::Object& /*module*/) const {
    return model_;
}
