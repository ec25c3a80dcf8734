#pragma once

#include <string>

// Stand-ins for whisper.py with the same entry points. The audio path picks
// the behavior of transcribe_audio(); every call is recorded on the
// whisper_bridge_probe module so tests can check that calls never overlap.
namespace fake {

inline const std::string kScript = R"py(
import sys
import time
import types

probe = sys.modules.get("whisper_bridge_probe")
if probe is None:
    probe = types.ModuleType("whisper_bridge_probe")
    probe.active = 0
    probe.overlaps = 0
    probe.calls = 0
    probe.models = 0
    probe.loads = 0
    sys.modules["whisper_bridge_probe"] = probe
probe.loads += 1


class Model:
    def __init__(self, name, device, compute_type):
        self.name = name
        self.device = device
        self.compute_type = compute_type


def _enter():
    probe.active += 1
    probe.calls += 1
    if probe.active > 1:
        probe.overlaps += 1


def _leave():
    probe.active -= 1


def new_model(model_name, device, compute_type):
    _enter()
    try:
        # sleep() drops the GIL, giving other threads a chance to interleave
        time.sleep(0.001)
        if model_name == "missing":
            raise ValueError("unknown model: missing")
        probe.models += 1
        return Model(model_name, device, compute_type)
    finally:
        _leave()


def _args(model, path, prompt, prefix, language, beam_size, best_of, patience,
          length_penalty, chunk_length, vad):
    fields = (model.name, model.device, model.compute_type, prompt, prefix, language,
              beam_size, best_of, patience, length_penalty, chunk_length)
    return [
        (0, 0, 0.0, 1.0, "|".join(str(f) for f in fields), 0.0, 0.0, 1.0, 0.0),
        (1, 0, 1.0, 2.0, repr(vad), 0.0, 0.0, 1.0, 0.0),
    ]


VALID = (0, 0, 0.0, 1.0, "ok", 0.0, -0.1, 1.0, 0.0)

RESULTS = {
    "speech.wav": [
        (0, 0, 0.0, 1.5, " the quick", 0.0, -0.25, 1.25, 0.015625),
        (1, 150, 1.5, 2.75, " brown fox", 0.2, -0.5, 1.125, 0.03125),
    ],
    "unordered.wav": [
        (2, 300, 3.0, 4.0, "c", 0.0, 0.0, 1.0, 0.0),
        (0, 0, 0.0, 1.0, "a", 0.0, 0.0, 1.0, 0.0),
        (1, 0, 1.0, 2.0, "a", 0.0, 0.0, 1.0, 0.0),
    ],
    "silence.wav": [],
    "not_sequence.wav": 42,
    "string.wav": "the quick brown fox",
    "short_tuple.wav": [VALID, (1, 0, 1.0, 2.0, "x", 0.0, 0.0, 1.0)],
    "long_tuple.wav": [VALID + (0.0,)],
    "bad_text.wav": [(0, 0, 0.0, 1.0, 7, 0.0, 0.0, 1.0, 0.0)],
    "bad_id.wav": [(0.5, 0, 0.0, 1.0, "x", 0.0, 0.0, 1.0, 0.0)],
    "list_items.wav": [list(VALID)],
}


def transcribe_audio(model, path, prompt, prefix, language, beam_size, best_of, patience,
                     length_penalty, chunk_length, vad):
    _enter()
    try:
        time.sleep(0.002)
        name = path.rsplit("/", 1)[-1]
        if name == "args.wav":
            return _args(model, path, prompt, prefix, language, beam_size, best_of,
                         patience, length_penalty, chunk_length, vad)
        if name == "generator.wav":
            return (s for s in RESULTS["speech.wav"])
        if name not in RESULTS:
            raise FileNotFoundError("no such audio: " + path)
        return RESULTS[name]
    finally:
        _leave()
)py";

inline const std::string kSyntaxError = R"py(
def new_model(model_name, device, compute_type)
    return None
)py";

inline const std::string kNoEntryPoints = R"py(
VERSION = 1
)py";

inline const std::string kNoTranscribe = R"py(
def new_model(model_name, device, compute_type):
    return object()
)py";

} // namespace fake
