#pragma once

#include <quadrature/decoder/indexed_incremental_decoder.hpp>
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

// An IncrementalEncoder with an index (Z) channel. A rising edge on idx zeroes
// the position after the clk/dt sample of the same poll was counted.
template <typename Mode,
          typename Clk,
          typename Dt,
          typename Idx,
          typename Steps = decoder::FullStep,
          typename T = std::int32_t,
          typename PM = Blocking>
class IndexedIncrementalEncoder {
    static_assert(is_operation_mode_v<Mode>, "Mode must be Rotary or Linear");
    static_assert(is_poll_mode_v<PM>, "PM must be Blocking or Suspending");

   public:
    using Movement = typename Mode::Movement;
    using Change = encoder::Change<Movement, T>;
    using Result = llvm::Expected<std::optional<Change>>;
    using PollMode = PM;

    IndexedIncrementalEncoder(Clk clk, Dt dt, Idx idx)
        : pins_(std::move(clk), std::move(dt), std::move(idx)) {}

    IndexedIncrementalEncoder(IndexedIncrementalEncoder&&) = default;
    IndexedIncrementalEncoder& operator=(IndexedIncrementalEncoder&&) = default;

    IndexedIncrementalEncoder(const IndexedIncrementalEncoder&) = delete;
    IndexedIncrementalEncoder& operator=(const IndexedIncrementalEncoder&) = delete;

    // Swaps the roles of clk and dt. The index channel is unaffected.
    IndexedIncrementalEncoder reversed() && {
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

    template <typename P = PM, std::enable_if_t<std::is_same_v<P, Suspending>, int> = 0>
    void cancel() {
        pins_.cancel();
    }

    template <typename P = PM, std::enable_if_t<std::is_same_v<P, Blocking>, int> = 0>
    IndexedIncrementalEncoder<Mode, Clk, Dt, Idx, Steps, T, Suspending> intoAsync() && {
        static_assert(has_suspending_read_v<Clk> && has_suspending_read_v<Dt> &&
                          has_suspending_read_v<Idx>,
                      "intoAsync() needs pins providing pollHigh() and cancelRead()");
        return IndexedIncrementalEncoder<Mode, Clk, Dt, Idx, Steps, T, Suspending>(
            std::move(decoder_), std::move(pins_), reversed_);
    }

    template <typename P = PM, std::enable_if_t<std::is_same_v<P, Suspending>, int> = 0>
    IndexedIncrementalEncoder<Mode, Clk, Dt, Idx, Steps, T, Blocking> intoBlocking() && {
        pins_.cancel();
        return IndexedIncrementalEncoder<Mode, Clk, Dt, Idx, Steps, T, Blocking>(
            std::move(decoder_), std::move(pins_), reversed_);
    }

    T position() const {
        return decoder_.counter();
    }

    void setPosition(T position) {
        decoder_.setCounter(position);
    }

    // Clears the position and forgets both the last A/B reading and the last
    // index level.
    void reset() {
        if constexpr (std::is_same_v<PM, Suspending>) {
            pins_.cancel();
        }
        decoder_.reset();
    }

    std::tuple<Clk, Dt, Idx>& pins() {
        return pins_.pins();
    }

    std::tuple<Clk, Dt, Idx> release() && {
        if constexpr (std::is_same_v<PM, Suspending>) {
            pins_.cancel();
        }
        return std::move(pins_).release();
    }

    static constexpr int pulsesPerCycle() {
        return Steps::pulsesPerCycle;
    }

   private:
    template <typename, typename, typename, typename, typename, typename, typename>
    friend class IndexedIncrementalEncoder;

    using Decoder = decoder::IndexedIncrementalDecoder<Steps, T>;
    using Pins = PinGroup<Clk, Dt, Idx>;
    using Levels = typename Pins::Levels;

    IndexedIncrementalEncoder(Decoder decoder, Pins pins, bool reversed)
        : decoder_(std::move(decoder)), pins_(std::move(pins)), reversed_(reversed) {}

    Result decode(const Levels& levels) {
        const bool a = reversed_ ? levels[1] : levels[0];
        const bool b = reversed_ ? levels[0] : levels[1];

        llvm::Expected<std::optional<decoder::Direction>> direction =
            decoder_.update(a, b, levels[2]);
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
          typename Idx,
          typename Steps = decoder::FullStep,
          typename T = std::int32_t,
          typename PM = Blocking>
using IndexedRotaryEncoder = IndexedIncrementalEncoder<Rotary, Clk, Dt, Idx, Steps, T, PM>;

template <typename Clk,
          typename Dt,
          typename Idx,
          typename Steps = decoder::FullStep,
          typename T = std::int32_t,
          typename PM = Blocking>
using IndexedLinearEncoder = IndexedIncrementalEncoder<Linear, Clk, Dt, Idx, Steps, T, PM>;

}  // namespace quadrature::encoder
