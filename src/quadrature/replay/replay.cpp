#include <quadrature/replay/replay.hpp>

#include <quadrature/decoder/errors.hpp>
#include <quadrature/decoder/step_mode.hpp>
#include <quadrature/encoder/incremental_encoder.hpp>
#include <quadrature/encoder/indexed_incremental_encoder.hpp>
#include <quadrature/encoder/modes.hpp>

#include <llvm/Support/Debug.h>
#include <llvm/Support/ErrorHandling.h>
#include <llvm/Support/FormatVariadic.h>

#include <optional>
#include <type_traits>
#include <utility>

#define DEBUG_TYPE "quadrature-replay"

namespace quadrature::replay {

namespace {

template <typename Encoder, typename... Pins>
Encoder makeEncoder(bool reversed, Pins... pins) {
    Encoder enc(std::move(pins)...);
    if (reversed) {
        return std::move(enc).reversed();
    }
    return enc;
}

// Trace pins never keep a read outstanding, so a suspended poll is simply
// resumed until it completes.
template <typename Encoder>
typename Encoder::Result pollOnce(Encoder& enc) {
    if constexpr (std::is_same_v<typename Encoder::PollMode, encoder::Suspending>) {
        for (;;) {
            std::optional<typename Encoder::Result> result = enc.poll();
            if (result) {
                return std::move(*result);
            }
            LLVM_DEBUG(llvm::dbgs() << "poll suspended, resuming\n");
        }
    } else {
        return enc.poll();
    }
}

template <typename Encoder>
llvm::Expected<ReplaySummary> drive(Encoder enc,
                                    TraceCursor& cursor,
                                    const Trace& trace,
                                    llvm::raw_ostream& out,
                                    llvm::raw_ostream& diag) {
    ReplaySummary summary;

    for (const Sample& sample : trace.samples) {
        cursor.moveTo(sample);

        typename Encoder::Result result = pollOnce(enc);
        if (!result) {
            llvm::Error err = llvm::handleErrors(
                result.takeError(), [&](const decoder::InvalidTransitionError& e) {
                    ++summary.invalidTransitions;
                    diag << llvm::formatv("line {0}: ", sample.line);
                    e.log(diag);
                    diag << "\n";
                });
            if (err) {
                return std::move(err);
            }
            continue;
        }

        if (const auto& change = *result) {
            ++summary.changes;
            out << llvm::formatv(
                "line {0}: {1} position={2}\n", sample.line, change->movement, change->position);
        }
    }

    summary.position = enc.position();
    out << llvm::formatv("position: {0}\n", summary.position);

    LLVM_DEBUG(llvm::dbgs() << "replayed " << trace.samples.size() << " samples, "
                            << summary.changes << " changes, " << summary.invalidTransitions
                            << " invalid transitions\n");

    return summary;
}

template <typename Mode, typename Steps>
llvm::Expected<ReplaySummary> replayWithSteps(const Trace& trace,
                                         const ReplayOptions& options,
                                         llvm::raw_ostream& out,
                                         llvm::raw_ostream& diag) {
    using encoder::Channel;

    TraceCursor cursor;
    TracePin clk(cursor, Channel::clk);
    TracePin dt(cursor, Channel::dt);

    if (trace.indexed) {
        using Encoder =
            encoder::IndexedIncrementalEncoder<Mode, TracePin, TracePin, TracePin, Steps>;
        Encoder enc =
            makeEncoder<Encoder>(options.reversed, clk, dt, TracePin(cursor, Channel::idx));
        if (options.suspending) {
            return drive(std::move(enc).intoAsync(), cursor, trace, out, diag);
        }
        return drive(std::move(enc), cursor, trace, out, diag);
    }

    using Encoder = encoder::IncrementalEncoder<Mode, TracePin, TracePin, Steps>;
    Encoder enc = makeEncoder<Encoder>(options.reversed, clk, dt);
    if (options.suspending) {
        return drive(std::move(enc).intoAsync(), cursor, trace, out, diag);
    }
    return drive(std::move(enc), cursor, trace, out, diag);
}

template <typename Mode>
llvm::Expected<ReplaySummary> replayWith(const Trace& trace,
                                         const ReplayOptions& options,
                                         llvm::raw_ostream& out,
                                         llvm::raw_ostream& diag) {
    switch (options.steps) {
        case StepSetting::full:
            return replayWithSteps<Mode, decoder::FullStep>(trace, options, out, diag);
        case StepSetting::half:
            return replayWithSteps<Mode, decoder::HalfStep>(trace, options, out, diag);
        case StepSetting::quad:
            return replayWithSteps<Mode, decoder::QuadStep>(trace, options, out, diag);
    }
    llvm_unreachable("unknown step setting");
}

}  // namespace

llvm::Expected<ReplaySummary> replay(const Trace& trace,
                                     const ReplayOptions& options,
                                     llvm::raw_ostream& out,
                                     llvm::raw_ostream& diag) {
    switch (options.mode) {
        case ModeSetting::rotary:
            return replayWith<encoder::Rotary>(trace, options, out, diag);
        case ModeSetting::linear:
            return replayWith<encoder::Linear>(trace, options, out, diag);
    }
    llvm_unreachable("unknown mode setting");
}

}  // namespace quadrature::replay
