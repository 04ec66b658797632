#include <quadrature/decoder/index_decoder.hpp>

#include <llvm/Support/Debug.h>
#include <llvm/Support/raw_ostream.h>

#define DEBUG_TYPE "quadrature-index"

namespace quadrature::decoder {

bool IndexDecoder::update(bool z) {
    const bool rising = z && !z_;
    z_ = z;

    LLVM_DEBUG(if (rising) { llvm::dbgs() << "index rising edge\n"; });

    return rising;
}

}  // namespace quadrature::decoder
