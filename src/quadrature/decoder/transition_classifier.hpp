#pragma once

#include <quadrature/decoder/signal.hpp>

#include <cstdint>
#include <optional>

namespace quadrature::decoder {

enum class Transition : std::uint8_t {
    stationary,
    forward,
    backward,
    invalid,
};

// Classifies the edge between two consecutive readings. Total over all 16 pairs.
Transition classifyTransition(Reading previous, Reading next);

// Remembers the last reading and classifies each new one against it.
class TransitionClassifier {
   public:
    // The first reading is always stationary. The stored reading is replaced
    // on every call, including invalid ones, so a glitch costs one sample.
    Transition classify(Reading next);

    std::optional<Reading> previous() const {
        return previous_;
    }

    void reset() {
        previous_.reset();
    }

   private:
    std::optional<Reading> previous_;
};

llvm::raw_ostream& operator<<(llvm::raw_ostream& os, Transition transition);

}  // namespace quadrature::decoder
