#pragma once

namespace quadrature::decoder {

// Detects rising edges on the index (Z) channel.
class IndexDecoder {
   public:
    IndexDecoder() = default;

    explicit IndexDecoder(bool z) : z_(z) {}

    // Returns true iff z went from low to high since the previous call.
    bool update(bool z);

    void reset() {
        z_ = false;
    }

   private:
    bool z_ = false;
};

}  // namespace quadrature::decoder
