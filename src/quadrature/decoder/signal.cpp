#include <quadrature/decoder/signal.hpp>

#include <llvm/Support/raw_ostream.h>

namespace quadrature::decoder {

llvm::raw_ostream& operator<<(llvm::raw_ostream& os, Reading reading) {
    return os << (reading.a ? '1' : '0') << (reading.b ? '1' : '0');
}

llvm::raw_ostream& operator<<(llvm::raw_ostream& os, Direction direction) {
    switch (direction) {
        case Direction::forward:
            return os << "forward";
        case Direction::backward:
            return os << "backward";
    }
    return os << "unknown";
}

}  // namespace quadrature::decoder
