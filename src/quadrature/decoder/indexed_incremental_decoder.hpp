#pragma once

#include <quadrature/decoder/incremental_decoder.hpp>
#include <quadrature/decoder/index_decoder.hpp>

#include <llvm/Support/Error.h>

#include <cstdint>
#include <optional>

namespace quadrature::decoder {

// An IncrementalDecoder whose counter snaps back to 0 on every rising edge of
// the index channel.
template <typename Steps, typename T = std::int32_t>
class IndexedIncrementalDecoder {
   public:
    using Counter = T;

    // The A/B movement is applied first, then the index edge. A rising edge
    // zeroes the counter even if the same call counted a movement (which is
    // still returned) or hit an invalid transition (which is still returned).
    llvm::Expected<std::optional<Direction>> update(bool a, bool b, bool z) {
        llvm::Expected<std::optional<Direction>> result = decoder_.update(a, b);

        if (index_.update(z)) {
            decoder_.setCounter(0);
        }

        return result;
    }

    T counter() const {
        return decoder_.counter();
    }

    void setCounter(T counter) {
        decoder_.setCounter(counter);
    }

    void reset() {
        decoder_.reset();
        index_.reset();
    }

    static constexpr int pulsesPerCycle() {
        return IncrementalDecoder<Steps, T>::pulsesPerCycle();
    }

   private:
    IncrementalDecoder<Steps, T> decoder_;
    IndexDecoder index_;
};

}  // namespace quadrature::decoder
