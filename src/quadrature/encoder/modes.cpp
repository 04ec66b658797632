#include <quadrature/encoder/modes.hpp>

#include <llvm/Support/raw_ostream.h>

namespace quadrature::encoder {

llvm::raw_ostream& operator<<(llvm::raw_ostream& os, RotaryMovement movement) {
    switch (movement) {
        case RotaryMovement::clockwise:
            return os << "clockwise";
        case RotaryMovement::counterClockwise:
            return os << "counter-clockwise";
    }
    return os << "unknown";
}

llvm::raw_ostream& operator<<(llvm::raw_ostream& os, LinearMovement movement) {
    switch (movement) {
        case LinearMovement::forward:
            return os << "forward";
        case LinearMovement::backward:
            return os << "backward";
    }
    return os << "unknown";
}

}  // namespace quadrature::encoder
