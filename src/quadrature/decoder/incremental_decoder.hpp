#pragma once

#include <quadrature/decoder/errors.hpp>
#include <quadrature/decoder/signal.hpp>
#include <quadrature/decoder/step_mode.hpp>
#include <quadrature/decoder/transition_classifier.hpp>

#include <llvm/Support/Error.h>
#include <llvm/Support/ErrorHandling.h>

#include <cstdint>
#include <optional>
#include <type_traits>

namespace quadrature::decoder {

// Turns consecutive A/B readings into a signed position count.
//
// Steps selects how many counts one full quadrature cycle produces (see
// step_mode.hpp). The counter wraps around on overflow.
template <typename Steps, typename T = std::int32_t>
class IncrementalDecoder {
    static_assert(is_step_mode_v<Steps>, "Steps must be FullStep, HalfStep or QuadStep");
    static_assert(std::is_integral_v<T> && std::is_signed_v<T>,
                  "the counter must be a signed integer type");

   public:
    using Counter = T;

    // Returns the direction of a counted movement, std::nullopt if nothing was
    // counted, or an InvalidTransitionError if both channels changed at once.
    // The counter is left alone on error.
    llvm::Expected<std::optional<Direction>> update(bool a, bool b) {
        const Reading next{a, b};
        const std::optional<Reading> previous = classifier_.previous();

        switch (classifier_.classify(next)) {
            case Transition::stationary:
                return std::nullopt;
            case Transition::forward:
                return step(Direction::forward);
            case Transition::backward:
                return step(Direction::backward);
            case Transition::invalid:
                // The new reading starts a fresh cycle.
                filter_.reset();
                return llvm::make_error<InvalidTransitionError>(*previous, next);
        }
        llvm_unreachable("unhandled quadrature transition");
    }

    T counter() const {
        return counter_;
    }

    void setCounter(T counter) {
        counter_ = counter;
    }

    // Forgets the last reading and clears the counter.
    void reset() {
        classifier_.reset();
        filter_.reset();
        counter_ = 0;
    }

    static constexpr int pulsesPerCycle() {
        return Steps::pulsesPerCycle;
    }

   private:
    std::optional<Direction> step(Direction direction) {
        std::optional<Direction> counted = filter_.advance(direction);
        if (counted) {
            using U = std::make_unsigned_t<T>;
            const U delta = static_cast<U>(static_cast<T>(*counted));
            counter_ = static_cast<T>(static_cast<U>(static_cast<U>(counter_) + delta));
        }
        return counted;
    }

    TransitionClassifier classifier_;
    detail::StepFilter<Steps> filter_;
    T counter_ = 0;
};

}  // namespace quadrature::decoder
