#include <quadrature/decoder/step_mode.hpp>
#include <quadrature/encoder/errors.hpp>
#include <quadrature/encoder/incremental_encoder.hpp>
#include <quadrature/testing/check.hpp>
#include <quadrature/testing/scripted_pin.hpp>

#include <cstdint>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

using namespace quadrature::encoder;
using quadrature::decoder::HalfStep;
using quadrature::decoder::QuadStep;
using quadrature::testing::PinScript;
using quadrature::testing::ScriptedPin;
using quadrature::testing::takeErrorAs;

namespace {

struct Wires {
    PinScript clk;
    PinScript dt;

    void set(bool a, bool b) {
        clk.level = a;
        dt.level = b;
    }
};

using BlockingRotary = RotaryEncoder<ScriptedPin, ScriptedPin, QuadStep>;
using AsyncRotary = RotaryEncoder<ScriptedPin, ScriptedPin, QuadStep, std::int32_t, Suspending>;

// Polls until the encoder stops suspending.
std::optional<AsyncRotary::Change> complete(AsyncRotary& encoder) {
    for (;;) {
        std::optional<AsyncRotary::Result> result = encoder.poll();
        if (result) {
            return CHECK_VALUE(std::move(*result));
        }
    }
}

void suspendsUntilEveryPinIsRead() {
    Wires wires;
    AsyncRotary encoder(ScriptedPin(wires.clk), ScriptedPin(wires.dt));

    wires.set(false, false);
    CHECK(!complete(encoder));

    wires.set(false, true);
    wires.clk.suspendFor = 2;
    wires.dt.suspendFor = 1;

    CHECK(!encoder.poll());
    CHECK(wires.clk.outstanding);
    CHECK(!encoder.poll());
    CHECK(!encoder.poll());
    CHECK(!wires.clk.outstanding);
    CHECK(wires.dt.outstanding);
    CHECK(0 == encoder.position());

    std::optional<AsyncRotary::Result> result = encoder.poll();
    CHECK(result.has_value());
    CHECK(CHECK_VALUE(std::move(*result)) == (AsyncRotary::Change{RotaryMovement::clockwise, 1}));
    CHECK(1 == encoder.position());

    // Levels that arrived before a suspension are not read again.
    CHECK(2 == wires.clk.reads);
}

void cancelledPollLeavesNoTrace() {
    Wires wires;
    AsyncRotary encoder(ScriptedPin(wires.clk), ScriptedPin(wires.dt));

    wires.set(false, false);
    complete(encoder);

    // clk arrives as 1, dt stays outstanding.
    wires.set(true, false);
    wires.dt.suspendFor = 1;
    CHECK(!encoder.poll());
    CHECK(wires.dt.outstanding);

    encoder.cancel();
    CHECK(1 == wires.dt.cancels);
    CHECK(0 == wires.clk.cancels);
    CHECK(!wires.dt.outstanding);
    CHECK(0 == encoder.position());

    // Had 10 been committed, 01 would now be an invalid transition.
    wires.set(false, true);
    CHECK(complete(encoder) == (AsyncRotary::Change{RotaryMovement::clockwise, 1}));

    // Cancelling with nothing pending does not touch the pins.
    encoder.cancel();
    CHECK(1 == wires.dt.cancels);
}

void pinFailureEndsThePoll() {
    Wires wires;
    AsyncRotary encoder(ScriptedPin(wires.clk), ScriptedPin(wires.dt));

    wires.set(false, false);
    complete(encoder);

    wires.set(false, true);
    wires.dt.suspendFor = 1;
    wires.dt.failure = "nack";
    CHECK(!encoder.poll());

    std::optional<AsyncRotary::Result> result = encoder.poll();
    CHECK(result.has_value());
    auto err = takeErrorAs<PinReadError>(std::move(*result));
    CHECK(err != nullptr);
    CHECK(err->channel() == Channel::dt);
    CHECK(0 == encoder.position());

    // The next poll starts over from clk.
    const unsigned clkReads = wires.clk.reads;
    CHECK(complete(encoder) == (AsyncRotary::Change{RotaryMovement::clockwise, 1}));
    CHECK(clkReads + 1 == wires.clk.reads);
}

void conversionsKeepState() {
    Wires wires;
    Wires reference;
    BlockingRotary original(ScriptedPin(wires.clk), ScriptedPin(wires.dt));
    BlockingRotary untouched(ScriptedPin(reference.clk), ScriptedPin(reference.dt));

    const bool trace[][2] = {{false, false}, {false, true}, {true, true}, {true, false},
                             {false, false}, {true, false}, {true, true}, {false, true}};

    for (int i = 0; i < 3; ++i) {
        wires.set(trace[i][0], trace[i][1]);
        reference.set(trace[i][0], trace[i][1]);
        CHECK(CHECK_VALUE(original.poll()) == CHECK_VALUE(untouched.poll()));
    }

    AsyncRotary async = std::move(original).intoAsync();
    CHECK(async.position() == untouched.position());

    wires.set(trace[3][0], trace[3][1]);
    reference.set(trace[3][0], trace[3][1]);
    CHECK(complete(async) == CHECK_VALUE(untouched.poll()));

    BlockingRotary converted = std::move(async).intoBlocking();
    CHECK(converted.position() == untouched.position());

    for (int i = 4; i < 8; ++i) {
        wires.set(trace[i][0], trace[i][1]);
        reference.set(trace[i][0], trace[i][1]);
        CHECK(CHECK_VALUE(converted.poll()) == CHECK_VALUE(untouched.poll()));
    }
    CHECK(converted.position() == untouched.position());
}

void intoBlockingAbandonsPendingRead() {
    Wires wires;
    AsyncRotary encoder = AsyncRotary(ScriptedPin(wires.clk), ScriptedPin(wires.dt)).reversed();

    wires.set(false, false);
    complete(encoder);

    wires.clk.suspendFor = 1;
    CHECK(!encoder.poll());

    auto blocking = std::move(encoder).intoBlocking();
    static_assert(std::is_same_v<decltype(blocking)::PollMode, quadrature::encoder::Blocking>);
    CHECK(1 == wires.clk.cancels);
    CHECK(blocking.isReversed());

    // Reversed: dt plays clk, so 10 counts clockwise.
    wires.set(true, false);
    CHECK(CHECK_VALUE(blocking.poll()) == (BlockingRotary::Change{RotaryMovement::clockwise, 1}));
}

void resetAndReleaseCancel() {
    Wires wires;
    RotaryEncoder<ScriptedPin, ScriptedPin, HalfStep, std::int32_t, Suspending> encoder(
        ScriptedPin(wires.clk), ScriptedPin(wires.dt));

    wires.clk.suspendFor = 1;
    CHECK(!encoder.poll());
    encoder.reset();
    CHECK(1 == wires.clk.cancels);
    CHECK(0 == encoder.position());

    wires.dt.suspendFor = 1;
    CHECK(!encoder.poll());
    std::tuple<ScriptedPin, ScriptedPin> pins = std::move(encoder).release();
    CHECK(1 == wires.dt.cancels);
    CHECK(!std::get<1>(pins).script().outstanding);
}

}  // namespace

int main() {
    static_assert(std::is_same_v<AsyncRotary::PollMode, Suspending>);

    suspendsUntilEveryPinIsRead();
    cancelledPollLeavesNoTrace();
    pinFailureEndsThePoll();
    conversionsKeepState();
    intoBlockingAbandonsPendingRead();
    resetAndReleaseCancel();
}
