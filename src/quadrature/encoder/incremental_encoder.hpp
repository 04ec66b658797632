#pragma once

#include <quadrature/decoder/incremental_decoder.hpp>
#include <quadrature/decoder/step_mode.hpp>
#include <quadrature/encoder/change.hpp>
#include <quadrature/encoder/modes.hpp>
#include <quadrature/encoder/pin_group.hpp>

#include <llvm/Support/Error.h>

#include <cstdint>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

namespace quadrature::encoder {

// An incremental encoder driven through its clk (A) and dt (B) pins.
//
// With the Blocking poll mode poll() reads both pins and decodes before it
// returns. With the Suspending poll mode poll() returns std::nullopt while a
// pin read is outstanding and is called again to resume; the decoder only
// sees a sample once both reads completed.
template <typename Mode,
          typename Clk,
          typename Dt,
          typename Steps = decoder::FullStep,
          typename T = std::int32_t,
          typename PM = Blocking>
class IncrementalEncoder {
    static_assert(is_operation_mode_v<Mode>, "Mode must be Rotary or Linear");
    static_assert(is_poll_mode_v<PM>, "PM must be Blocking or Suspending");

   public:
    using Movement = typename Mode::Movement;
    using Change = encoder::Change<Movement, T>;
    using Result = llvm::Expected<std::optional<Change>>;
    using PollMode = PM;

    IncrementalEncoder(Clk clk, Dt dt) : pins_(std::move(clk), std::move(dt)) {}

    IncrementalEncoder(IncrementalEncoder&&) = default;
    IncrementalEncoder& operator=(IncrementalEncoder&&) = default;

    IncrementalEncoder(const IncrementalEncoder&) = delete;
    IncrementalEncoder& operator=(const IncrementalEncoder&) = delete;

    // Swaps the roles of clk and dt, mirroring movements and position changes.
    // Meant to be applied right after construction.
    IncrementalEncoder reversed() && {
        reversed_ = true;
        return std::move(*this);
    }

    bool isReversed() const {
        return reversed_;
    }

    template <typename P = PM, std::enable_if_t<std::is_same_v<P, Blocking>, int> = 0>
    Result poll() {
        llvm::Expected<Levels> levels = pins_.readAll();
        if (!levels) {
            return levels.takeError();
        }
        return decode(*levels);
    }

    template <typename P = PM, std::enable_if_t<std::is_same_v<P, Suspending>, int> = 0>
    std::optional<Result> poll() {
        std::optional<llvm::Expected<Levels>> levels = pins_.resumeRead();
        if (!levels) {
            return std::nullopt;
        }
        if (!*levels) {
            return Result(levels->takeError());
        }
        return decode(**levels);
    }

    // Abandons a suspended poll. The decoder is left as it was before the poll.
    template <typename P = PM, std::enable_if_t<std::is_same_v<P, Suspending>, int> = 0>
    void cancel() {
        pins_.cancel();
    }

    template <typename P = PM, std::enable_if_t<std::is_same_v<P, Blocking>, int> = 0>
    IncrementalEncoder<Mode, Clk, Dt, Steps, T, Suspending> intoAsync() && {
        static_assert(has_suspending_read_v<Clk> && has_suspending_read_v<Dt>,
                      "intoAsync() needs pins providing pollHigh() and cancelRead()");
        return IncrementalEncoder<Mode, Clk, Dt, Steps, T, Suspending>(
            std::move(decoder_), std::move(pins_), reversed_);
    }

    template <typename P = PM, std::enable_if_t<std::is_same_v<P, Suspending>, int> = 0>
    IncrementalEncoder<Mode, Clk, Dt, Steps, T, Blocking> intoBlocking() && {
        pins_.cancel();
        return IncrementalEncoder<Mode, Clk, Dt, Steps, T, Blocking>(
            std::move(decoder_), std::move(pins_), reversed_);
    }

    T position() const {
        return decoder_.counter();
    }

    void setPosition(T position) {
        decoder_.setCounter(position);
    }

    void reset() {
        if constexpr (std::is_same_v<PM, Suspending>) {
            pins_.cancel();
        }
        decoder_.reset();
    }

    std::tuple<Clk, Dt>& pins() {
        return pins_.pins();
    }

    std::tuple<Clk, Dt> release() && {
        if constexpr (std::is_same_v<PM, Suspending>) {
            pins_.cancel();
        }
        return std::move(pins_).release();
    }

    static constexpr int pulsesPerCycle() {
        return Steps::pulsesPerCycle;
    }

   private:
    template <typename, typename, typename, typename, typename, typename>
    friend class IncrementalEncoder;

    using Decoder = decoder::IncrementalDecoder<Steps, T>;
    using Pins = PinGroup<Clk, Dt>;
    using Levels = typename Pins::Levels;

    IncrementalEncoder(Decoder decoder, Pins pins, bool reversed)
        : decoder_(std::move(decoder)), pins_(std::move(pins)), reversed_(reversed) {}

    // Shared by both poll modes.
    Result decode(const Levels& levels) {
        const bool a = reversed_ ? levels[1] : levels[0];
        const bool b = reversed_ ? levels[0] : levels[1];

        llvm::Expected<std::optional<decoder::Direction>> direction = decoder_.update(a, b);
        if (!direction) {
            return direction.takeError();
        }
        return makeChange<Mode>(*direction, decoder_.counter());
    }

    Decoder decoder_;
    Pins pins_;
    bool reversed_ = false;
};

template <typename Clk,
          typename Dt,
          typename Steps = decoder::FullStep,
          typename T = std::int32_t,
          typename PM = Blocking>
using RotaryEncoder = IncrementalEncoder<Rotary, Clk, Dt, Steps, T, PM>;

template <typename Clk,
          typename Dt,
          typename Steps = decoder::FullStep,
          typename T = std::int32_t,
          typename PM = Blocking>
using LinearEncoder = IncrementalEncoder<Linear, Clk, Dt, Steps, T, PM>;

}  // namespace quadrature::encoder
