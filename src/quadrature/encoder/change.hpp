#pragma once

#include <quadrature/decoder/signal.hpp>
#include <quadrature/encoder/modes.hpp>

#include <optional>

namespace quadrature::encoder {

// A counted movement together with the position it left the encoder at.
template <typename Movement, typename T>
struct Change {
    Movement movement;
    T position;

    friend bool operator==(const Change& lhs, const Change& rhs) {
        return lhs.movement == rhs.movement && lhs.position == rhs.position;
    }

    friend bool operator!=(const Change& lhs, const Change& rhs) {
        return !(lhs == rhs);
    }
};

template <typename Mode, typename T>
std::optional<Change<typename Mode::Movement, T>> makeChange(
    std::optional<decoder::Direction> direction, T position) {
    if (!direction) {
        return std::nullopt;
    }
    return Change<typename Mode::Movement, T>{toMovement<Mode>(*direction), position};
}

}  // namespace quadrature::encoder
