#pragma once

#include <quadrature/decoder/signal.hpp>

#include <cstdint>
#include <optional>
#include <type_traits>

namespace quadrature::decoder {

// One count per quadrature cycle. Most robust against noise.
struct FullStep {
    static constexpr int pulsesPerCycle = 1;
};

// Two counts per quadrature cycle.
struct HalfStep {
    static constexpr int pulsesPerCycle = 2;
};

// Four counts per quadrature cycle, one per valid edge.
struct QuadStep {
    static constexpr int pulsesPerCycle = 4;
};

template <typename Steps>
struct is_step_mode : std::false_type {};

template <>
struct is_step_mode<FullStep> : std::true_type {};

template <>
struct is_step_mode<HalfStep> : std::true_type {};

template <>
struct is_step_mode<QuadStep> : std::true_type {};

template <typename Steps>
inline constexpr bool is_step_mode_v = is_step_mode<Steps>::value;

namespace detail {

// Accumulates valid edges and lets one through for every 4 / pulsesPerCycle
// edges taken in the same direction. The accumulator's parity flips on every
// edge; reaching the threshold means the reading is back at its cycle start.
template <typename Steps>
class StepFilter {
    static_assert(is_step_mode_v<Steps>, "Steps must be FullStep, HalfStep or QuadStep");

   public:
    std::optional<Direction> advance(Direction direction) {
        phase_ = static_cast<std::int8_t>(phase_ + static_cast<std::int8_t>(direction));
        if (phase_ == kThreshold || phase_ == -kThreshold) {
            phase_ = 0;
            return direction;
        }
        return std::nullopt;
    }

    std::int8_t phase() const {
        return phase_;
    }

    void reset() {
        phase_ = 0;
    }

   private:
    static constexpr std::int8_t kThreshold = 4 / Steps::pulsesPerCycle;

    std::int8_t phase_ = 0;
};

}  // namespace detail

}  // namespace quadrature::decoder
