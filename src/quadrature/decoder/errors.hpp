#pragma once

#include <quadrature/decoder/signal.hpp>

#include <llvm/Support/Error.h>

namespace quadrature::decoder {

// Both channels changed between two consecutive readings. Genuine quadrature
// signals never do this; it points at under-sampling or noise.
class InvalidTransitionError : public llvm::ErrorInfo<InvalidTransitionError> {
   public:
    static char ID;

    InvalidTransitionError(Reading from, Reading to) : from_(from), to_(to) {}

    Reading from() const {
        return from_;
    }

    Reading to() const {
        return to_;
    }

    void log(llvm::raw_ostream& os) const override;

    std::error_code convertToErrorCode() const override;

   private:
    Reading from_;
    Reading to_;
};

}  // namespace quadrature::decoder
