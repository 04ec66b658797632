#pragma once

#include <quadrature/replay/trace.hpp>

#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

#include <cstdint>

namespace quadrature::replay {

enum class StepSetting {
    full,
    half,
    quad,
};

enum class ModeSetting {
    rotary,
    linear,
};

struct ReplayOptions {
    StepSetting steps = StepSetting::full;
    ModeSetting mode = ModeSetting::rotary;
    bool reversed = false;

    // Drive the encoder through its suspending poll path.
    bool suspending = false;
};

struct ReplaySummary {
    std::int32_t position = 0;
    unsigned changes = 0;
    unsigned invalidTransitions = 0;
};

// Feeds every sample of a trace through an encoder configured by options.
//
// Each reported change is written to out as "line <n>: <movement> position=<p>",
// followed by a final "position: <p>" line. Invalid transitions are reported
// on diag and decoding carries on; any other error stops the replay.
llvm::Expected<ReplaySummary> replay(const Trace& trace,
                                     const ReplayOptions& options,
                                     llvm::raw_ostream& out,
                                     llvm::raw_ostream& diag);

}  // namespace quadrature::replay
