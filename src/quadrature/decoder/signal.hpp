#pragma once

#include <cstdint>

namespace llvm {
class raw_ostream;
}  // namespace llvm

namespace quadrature::decoder {

// The levels of the A and B channels sampled at one instant.
struct Reading {
    bool a;
    bool b;

    // a is the high bit, b the low one.
    constexpr std::uint8_t bits() const {
        return static_cast<std::uint8_t>((a ? 0b10 : 0b00) | (b ? 0b01 : 0b00));
    }

    friend constexpr bool operator==(Reading lhs, Reading rhs) {
        return lhs.a == rhs.a && lhs.b == rhs.b;
    }

    friend constexpr bool operator!=(Reading lhs, Reading rhs) {
        return !(lhs == rhs);
    }
};

// The direction of a detected movement, valued as the counter delta it causes.
enum class Direction : std::int8_t {
    forward = 1,
    backward = -1,
};

llvm::raw_ostream& operator<<(llvm::raw_ostream& os, Reading reading);

llvm::raw_ostream& operator<<(llvm::raw_ostream& os, Direction direction);

}  // namespace quadrature::decoder
