#include "marshal.hpp"

#include "python/module.hpp"
#include "sentinel.hpp"

#include <cstdint>
#include <format>

namespace marshal {

namespace {

// Field layout of one segment tuple.
enum class Field { Int, Float, Text };

constexpr Field kLayout[kSegmentArity] = {
    Field::Int, Field::Int, Field::Float, Field::Float, Field::Text,
    Field::Float, Field::Float, Field::Float, Field::Float,
};

constexpr const char* kFieldNames[kSegmentArity] = {
    "id", "seek", "start", "end", "text",
    "temperature", "avg_logprob", "compression_ratio", "no_speech_prob",
};

// Strings go through "s#" so embedded NUL bytes survive.
Py_ssize_t length(const std::string& s) {
    return static_cast<Py_ssize_t>(s.size());
}

std::string type_name(PyObject* obj) {
    return Py_TYPE(obj)->tp_name;
}

TranscribeError decode_error(Py_ssize_t index, std::string detail) {
    return {ErrorKind::Decoding, std::format("segment {}: {}", index, detail)};
}

std::expected<int32_t, std::string> to_int(PyObject* obj) {
    if (!PyLong_Check(obj) || PyBool_Check(obj)) {
        return std::unexpected("expected int, got " + type_name(obj));
    }
    int overflow = 0;
    long long v = PyLong_AsLongLongAndOverflow(obj, &overflow);
    if (v == -1 && PyErr_Occurred()) return std::unexpected(python::take_error());
    if (overflow != 0 || v < INT32_MIN || v > INT32_MAX) {
        return std::unexpected("int out of 32-bit range");
    }
    return static_cast<int32_t>(v);
}

std::expected<double, std::string> to_float(PyObject* obj) {
    if (!PyFloat_Check(obj) && !(PyLong_Check(obj) && !PyBool_Check(obj))) {
        return std::unexpected("expected float, got " + type_name(obj));
    }
    double v = PyFloat_AsDouble(obj);
    if (v == -1.0 && PyErr_Occurred()) return std::unexpected(python::take_error());
    return v;
}

std::expected<std::string, std::string> to_text(PyObject* obj) {
    if (!PyUnicode_Check(obj)) {
        return std::unexpected("expected str, got " + type_name(obj));
    }
    Py_ssize_t len = 0;
    const char* utf8 = PyUnicode_AsUTF8AndSize(obj, &len);
    if (!utf8) return std::unexpected(python::take_error());
    return std::string(utf8, static_cast<size_t>(len));
}

std::expected<Segment, TranscribeError> decode_one(PyObject* item, Py_ssize_t index) {
    if (!PyTuple_Check(item)) {
        return std::unexpected(decode_error(index, "expected tuple, got " + type_name(item)));
    }
    Py_ssize_t arity = PyTuple_GET_SIZE(item);
    if (arity != static_cast<Py_ssize_t>(kSegmentArity)) {
        return std::unexpected(decode_error(
            index, std::format("expected {} fields, got {}", kSegmentArity, arity)));
    }

    int32_t ints[kSegmentArity] = {};
    double floats[kSegmentArity] = {};
    std::string text;

    for (size_t i = 0; i < kSegmentArity; i++) {
        PyObject* field = PyTuple_GET_ITEM(item, static_cast<Py_ssize_t>(i)); // borrowed
        std::string err;
        switch (kLayout[i]) {
            case Field::Int:
                if (auto v = to_int(field)) ints[i] = *v; else err = v.error();
                break;
            case Field::Float:
                if (auto v = to_float(field)) floats[i] = *v; else err = v.error();
                break;
            case Field::Text:
                if (auto v = to_text(field)) text = std::move(*v); else err = v.error();
                break;
        }
        if (!err.empty()) {
            return std::unexpected(decode_error(index, std::format("{}: {}", kFieldNames[i], err)));
        }
    }

    return Segment{
        .id = ints[0],
        .seek = ints[1],
        .start = floats[2],
        .end = floats[3],
        .text = std::move(text),
        .temperature = floats[5],
        .avg_logprob = floats[6],
        .compression_ratio = floats[7],
        .no_speech_prob = floats[8],
    };
}

} // namespace

std::expected<python::Object, std::string>
model_args(const python::Context& /*ctx*/, const std::string& model, const std::string& device,
           const std::string& compute_type) {
    auto args = python::Object::steal(
        Py_BuildValue("(s#s#s#)", model.c_str(), length(model), device.c_str(), length(device),
                      compute_type.c_str(), length(compute_type)));
    if (!args) return std::unexpected(python::take_error());
    return args;
}

std::expected<python::Object, std::string>
transcribe_args(const python::Context& /*ctx*/, const python::Object& model,
                const std::string& path, const TranscribeConfig& config) {
    const auto& vad = config.vad;
    auto max_speech = sentinel::encode(vad.max_speech_duration_s);
    auto vad_tuple = python::Object::steal(Py_BuildValue(
        "(Odis#ii)", vad.active ? Py_True : Py_False, vad.threshold,
        vad.min_speech_duration_ms, max_speech.c_str(), length(max_speech),
        vad.min_silence_duration_ms,
        vad.speech_pad_ms));
    if (!vad_tuple) return std::unexpected(python::take_error());

    auto prompt = sentinel::encode(config.initial_prompt);
    auto prefix = sentinel::encode(config.prefix);
    auto language = sentinel::encode(config.language);
    auto chunk_length = sentinel::encode(config.chunk_length);

    auto args = python::Object::steal(Py_BuildValue(
        "(Os#s#s#s#iidds#O)", model.get(), path.c_str(), length(path), prompt.c_str(),
        length(prompt), prefix.c_str(), length(prefix), language.c_str(), length(language),
        config.beam_size, config.best_of, config.patience, config.length_penalty,
        chunk_length.c_str(), length(chunk_length), vad_tuple.get()));
    if (!args) return std::unexpected(python::take_error());
    return args;
}

std::expected<std::vector<Segment>, TranscribeError>
decode_segments(const python::Context& /*ctx*/, const python::Object& value) {
    PyObject* obj = value.get();
    if (!obj || PyUnicode_Check(obj) || PyBytes_Check(obj) || !PySequence_Check(obj)) {
        return std::unexpected(TranscribeError{
            ErrorKind::Invocation,
            "transcribe_audio returned " + (obj ? type_name(obj) : std::string("nothing")) +
                ", expected a sequence of segment tuples"});
    }

    auto seq = python::Object::steal(
        PySequence_Fast(obj, "transcribe_audio result is not a sequence"));
    if (!seq) return std::unexpected(TranscribeError{ErrorKind::Invocation, python::take_error()});

    Py_ssize_t n = PySequence_Fast_GET_SIZE(seq.get());
    std::vector<Segment> segments;
    segments.reserve(static_cast<size_t>(n));

    for (Py_ssize_t i = 0; i < n; i++) {
        auto segment = decode_one(PySequence_Fast_GET_ITEM(seq.get(), i), i);
        if (!segment) return std::unexpected(std::move(segment.error()));
        segments.push_back(std::move(*segment));
    }

    return segments;
}

} // namespace marshal
