#pragma once

#include <quadrature/decoder/signal.hpp>

#include <cstdint>
#include <type_traits>

namespace quadrature::encoder {

enum class RotaryMovement : std::int8_t {
    clockwise = 1,
    counterClockwise = -1,
};

enum class LinearMovement : std::int8_t {
    forward = 1,
    backward = -1,
};

// Operation modes: how a decoded direction reads physically.
struct Rotary {
    using Movement = RotaryMovement;
};

struct Linear {
    using Movement = LinearMovement;
};

// Poll modes, fixed when an encoder is built and switched with
// intoAsync() / intoBlocking().
struct Blocking {};

struct Suspending {};

template <typename Mode>
struct is_operation_mode : std::false_type {};

template <>
struct is_operation_mode<Rotary> : std::true_type {};

template <>
struct is_operation_mode<Linear> : std::true_type {};

template <typename Mode>
inline constexpr bool is_operation_mode_v = is_operation_mode<Mode>::value;

template <typename PM>
struct is_poll_mode : std::false_type {};

template <>
struct is_poll_mode<Blocking> : std::true_type {};

template <>
struct is_poll_mode<Suspending> : std::true_type {};

template <typename PM>
inline constexpr bool is_poll_mode_v = is_poll_mode<PM>::value;

// Forward maps to clockwise / forward, backward to counter-clockwise / backward.
template <typename Mode>
constexpr typename Mode::Movement toMovement(decoder::Direction direction) {
    return static_cast<typename Mode::Movement>(static_cast<std::int8_t>(direction));
}

llvm::raw_ostream& operator<<(llvm::raw_ostream& os, RotaryMovement movement);

llvm::raw_ostream& operator<<(llvm::raw_ostream& os, LinearMovement movement);

}  // namespace quadrature::encoder
