#include <quadrature/decoder/transition_classifier.hpp>

#include <llvm/Support/Debug.h>
#include <llvm/Support/raw_ostream.h>

#define DEBUG_TYPE "quadrature-classifier"

namespace quadrature::decoder {

// State Transition Table (state bits are a << 1 | b)
//     +---------------+----+----+----+----+
//     | pState/nState | 00 | 01 | 10 | 11 |
//     +---------------+----+----+----+----+
//     |       00      | 0  | +1 | -1 | x  |
//     +---------------+----+----+----+----+
//     |       01      | -1 | 0  | x  | +1 |
//     +---------------+----+----+----+----+
//     |       10      | +1 | x  | 0  | -1 |
//     +---------------+----+----+----+----+
//     |       11      | x  | -1 | +1 | 0  |
//     +---------------+----+----+----+----+
// 0 -> same state
// x -> both channels changed
Transition classifyTransition(Reading previous, Reading next) {
    if (previous == next) {
        return Transition::stationary;
    }
    switch ((previous.bits() << 2) | next.bits()) {
        case 0b0001:
        case 0b0111:
        case 0b1110:
        case 0b1000:
            return Transition::forward;
        case 0b0010:
        case 0b1011:
        case 0b1101:
        case 0b0100:
            return Transition::backward;
        default:
            return Transition::invalid;
    }
}

Transition TransitionClassifier::classify(Reading next) {
    if (!previous_) {
        previous_ = next;
        return Transition::stationary;
    }

    const Transition transition = classifyTransition(*previous_, next);

    LLVM_DEBUG(if (transition == Transition::invalid) {
        llvm::dbgs() << "invalid transition " << *previous_ << " -> " << next << "\n";
    });

    previous_ = next;
    return transition;
}

llvm::raw_ostream& operator<<(llvm::raw_ostream& os, Transition transition) {
    switch (transition) {
        case Transition::stationary:
            return os << "stationary";
        case Transition::forward:
            return os << "forward";
        case Transition::backward:
            return os << "backward";
        case Transition::invalid:
            return os << "invalid";
    }
    return os << "unknown";
}

}  // namespace quadrature::decoder
