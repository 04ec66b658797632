#pragma once

#include <llvm/Support/Error.h>

#include <cstdint>
#include <memory>
#include <vector>

namespace quadrature::encoder {

// The signal channel an encoder pin feeds.
enum class Channel : std::uint8_t {
    clk,
    dt,
    idx,
};

llvm::raw_ostream& operator<<(llvm::raw_ostream& os, Channel channel);

// A pin failed to report its level. Carries every payload of the pin's own
// error untouched.
class PinReadError final : public llvm::ErrorInfo<PinReadError> {
   public:
    static char ID;

    PinReadError(Channel channel, llvm::Error cause);

    Channel channel() const {
        return channel_;
    }

    // Hands back the error the pin reported, joined again if it had several
    // payloads.
    llvm::Error takeCause();

    void log(llvm::raw_ostream& os) const override;

    std::error_code convertToErrorCode() const override;

   private:
    Channel channel_;
    std::vector<std::unique_ptr<llvm::ErrorInfoBase>> causes_;
};

}  // namespace quadrature::encoder
