#include <quadrature/encoder/errors.hpp>

#include <quadrature/error_code.hpp>

#include <llvm/Support/raw_ostream.h>

namespace quadrature::encoder {

char PinReadError::ID;

llvm::raw_ostream& operator<<(llvm::raw_ostream& os, Channel channel) {
    switch (channel) {
        case Channel::clk:
            return os << "clk";
        case Channel::dt:
            return os << "dt";
        case Channel::idx:
            return os << "idx";
    }
    return os << "unknown";
}

PinReadError::PinReadError(Channel channel, llvm::Error cause) : channel_(channel) {
    llvm::handleAllErrors(std::move(cause), [&](std::unique_ptr<llvm::ErrorInfoBase> info) {
        causes_.push_back(std::move(info));
    });
}

llvm::Error PinReadError::takeCause() {
    llvm::Error cause = llvm::Error::success();
    for (std::unique_ptr<llvm::ErrorInfoBase>& payload : causes_) {
        cause = llvm::joinErrors(std::move(cause), llvm::Error(std::move(payload)));
    }
    causes_.clear();
    return cause;
}

void PinReadError::log(llvm::raw_ostream& os) const {
    os << "failed to read " << channel_ << " pin";
    const char* separator = ": ";
    for (const std::unique_ptr<llvm::ErrorInfoBase>& payload : causes_) {
        os << separator;
        payload->log(os);
        separator = "; ";
    }
}

std::error_code PinReadError::convertToErrorCode() const {
    return make_error_code(errc::pin_read);
}

}  // namespace quadrature::encoder
