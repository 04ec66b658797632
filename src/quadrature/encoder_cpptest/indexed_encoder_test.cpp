#include <quadrature/decoder/errors.hpp>
#include <quadrature/decoder/step_mode.hpp>
#include <quadrature/encoder/errors.hpp>
#include <quadrature/encoder/indexed_incremental_encoder.hpp>
#include <quadrature/testing/check.hpp>
#include <quadrature/testing/scripted_pin.hpp>

#include <cstdint>
#include <optional>
#include <tuple>
#include <utility>

using namespace quadrature::encoder;
using quadrature::decoder::InvalidTransitionError;
using quadrature::decoder::QuadStep;
using quadrature::testing::failsWith;
using quadrature::testing::PinScript;
using quadrature::testing::ScriptedPin;
using quadrature::testing::takeErrorAs;

namespace {

struct Wires {
    PinScript clk;
    PinScript dt;
    PinScript idx;

    void set(bool a, bool b, bool z) {
        clk.level = a;
        dt.level = b;
        idx.level = z;
    }
};

using Indexed = IndexedRotaryEncoder<ScriptedPin, ScriptedPin, ScriptedPin, QuadStep>;
using AsyncIndexed = IndexedRotaryEncoder<ScriptedPin,
                                          ScriptedPin,
                                          ScriptedPin,
                                          QuadStep,
                                          std::int32_t,
                                          Suspending>;

Indexed makeEncoder(Wires& wires) {
    return Indexed(ScriptedPin(wires.clk), ScriptedPin(wires.dt), ScriptedPin(wires.idx));
}

void indexPulseZeroesPosition() {
    Wires wires;
    Indexed encoder = makeEncoder(wires);

    wires.set(false, false, false);
    CHECK(!CHECK_VALUE(encoder.poll()));
    wires.set(false, true, false);
    CHECK_VALUE(encoder.poll());
    wires.set(true, true, false);
    CHECK_VALUE(encoder.poll());
    CHECK(2 == encoder.position());

    // Movement and index in the same sample: the change carries the reset position.
    wires.set(true, false, true);
    CHECK(CHECK_VALUE(encoder.poll()) == (Indexed::Change{RotaryMovement::clockwise, 0}));
    CHECK(0 == encoder.position());

    wires.set(false, false, true);
    CHECK(CHECK_VALUE(encoder.poll()) == (Indexed::Change{RotaryMovement::clockwise, 1}));
}

void indexStillResetsOnInvalidTransition() {
    Wires wires;
    Indexed encoder = makeEncoder(wires);

    wires.set(false, false, false);
    CHECK_VALUE(encoder.poll());
    encoder.setPosition(9);

    wires.set(true, true, true);
    CHECK(failsWith<InvalidTransitionError>(encoder.poll()));
    CHECK(0 == encoder.position());
}

void idxFailureCommitsNothing() {
    Wires wires;
    Indexed encoder = makeEncoder(wires);

    wires.set(false, false, false);
    CHECK_VALUE(encoder.poll());
    encoder.setPosition(5);

    wires.set(false, true, true);
    wires.idx.failure = "index line stuck";
    auto err = takeErrorAs<PinReadError>(encoder.poll());
    CHECK(err != nullptr);
    CHECK(err->channel() == Channel::idx);
    CHECK(err->message() == "failed to read idx pin: index line stuck");
    CHECK(5 == encoder.position());

    // The rising index edge was not consumed by the failed poll.
    CHECK(CHECK_VALUE(encoder.poll()) == (Indexed::Change{RotaryMovement::clockwise, 0}));
}

void reversedKeepsTheIndexChannel() {
    Wires wires;
    Indexed encoder = makeEncoder(wires).reversed();

    wires.set(false, false, false);
    CHECK_VALUE(encoder.poll());
    wires.set(false, true, false);
    CHECK(CHECK_VALUE(encoder.poll()) ==
          (Indexed::Change{RotaryMovement::counterClockwise, -1}));

    wires.set(false, true, true);
    CHECK(!CHECK_VALUE(encoder.poll()));
    CHECK(0 == encoder.position());
}

void suspendingIndexedEncoder() {
    Wires wires;
    AsyncIndexed encoder = makeEncoder(wires).intoAsync();

    wires.set(false, false, false);
    std::optional<AsyncIndexed::Result> result = encoder.poll();
    CHECK(result.has_value());
    CHECK(!CHECK_VALUE(std::move(*result)));

    wires.set(false, true, true);
    wires.idx.suspendFor = 1;
    CHECK(!encoder.poll());
    encoder.cancel();
    CHECK(1 == wires.idx.cancels);
    CHECK(0 == encoder.position());

    result = encoder.poll();
    CHECK(result.has_value());
    CHECK(CHECK_VALUE(std::move(*result)) ==
          (AsyncIndexed::Change{RotaryMovement::clockwise, 0}));

    Indexed blocking = std::move(encoder).intoBlocking();
    wires.set(true, true, true);
    CHECK(CHECK_VALUE(blocking.poll()) == (Indexed::Change{RotaryMovement::clockwise, 1}));

    std::tuple<ScriptedPin, ScriptedPin, ScriptedPin> pins = std::move(blocking).release();
    CHECK(&std::get<2>(pins).script() == &wires.idx);
}

void resetForgetsIndexLevel() {
    Wires wires;
    Indexed encoder = makeEncoder(wires);

    wires.set(false, false, true);
    CHECK_VALUE(encoder.poll());
    encoder.setPosition(3);

    encoder.reset();
    encoder.setPosition(8);

    // The index is still high, but after a reset it counts as a fresh edge.
    CHECK(!CHECK_VALUE(encoder.poll()));
    CHECK(0 == encoder.position());
}

}  // namespace

int main() {
    static_assert(Indexed::pulsesPerCycle() == 4);

    indexPulseZeroesPosition();
    indexStillResetsOnInvalidTransition();
    idxFailureCommitsNothing();
    reversedKeepsTheIndexChannel();
    suspendingIndexedEncoder();
    resetForgetsIndexLevel();
}
