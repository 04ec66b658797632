#include <quadrature/decoder/errors.hpp>

#include <quadrature/error_code.hpp>

#include <llvm/Support/raw_ostream.h>

namespace quadrature::decoder {

char InvalidTransitionError::ID;

void InvalidTransitionError::log(llvm::raw_ostream& os) const {
    os << "invalid quadrature transition " << from_ << " -> " << to_;
}

std::error_code InvalidTransitionError::convertToErrorCode() const {
    return make_error_code(errc::invalid_transition);
}

}  // namespace quadrature::decoder
