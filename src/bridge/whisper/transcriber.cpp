#include "whisper/transcriber.hpp"

#include "marshal.hpp"
#include "python/module.hpp"

namespace {

constexpr const char* kScriptFile = "whisper.py";
constexpr const char* kModuleName = "Whisper";

TranscribeError construction_error(std::string message) {
    return {ErrorKind::Construction, std::move(message)};
}

} // namespace

std::expected<Segments, TranscribeError> Transcriber::transcribe(const std::string& path) const {
    python::Context ctx;

    auto module = script_module(ctx);
    if (!module) return std::unexpected(std::move(module.error()));

    auto model = model_handle(ctx, *module);
    if (!model) return std::unexpected(std::move(model.error()));

    auto entry = python::get_attr(ctx, *module, marshal::kTranscribeAudio);
    if (!entry) return std::unexpected(construction_error(std::move(entry.error())));

    auto args = marshal::transcribe_args(ctx, *model, path, config_);
    if (!args) return std::unexpected(TranscribeError{ErrorKind::Invocation, std::move(args.error())});

    auto result = python::call(ctx, *entry, *args);
    if (!result) return std::unexpected(TranscribeError{ErrorKind::Invocation, std::move(result.error())});

    auto segments = marshal::decode_segments(ctx, *result);
    if (!segments) return std::unexpected(std::move(segments.error()));

    return Segments(std::move(*segments));
}

std::expected<python::Object, TranscribeError>
Transcriber::load_script(const python::Context& ctx, const std::string& source) {
    auto module = python::load_module(ctx, source, kScriptFile, kModuleName);
    if (!module) return std::unexpected(construction_error("loading script: " + module.error()));
    return std::move(*module);
}

std::expected<python::Object, TranscribeError>
Transcriber::construct_model(const python::Context& ctx, const python::Object& module,
                             const std::string& model, const std::string& device,
                             const std::string& compute_type) {
    auto entry = python::get_attr(ctx, module, marshal::kNewModel);
    if (!entry) return std::unexpected(construction_error(std::move(entry.error())));

    auto args = marshal::model_args(ctx, model, device, compute_type);
    if (!args) return std::unexpected(construction_error(std::move(args.error())));

    auto handle = python::call(ctx, *entry, *args);
    if (!handle) return std::unexpected(construction_error(std::move(handle.error())));
    return std::move(*handle);
}
