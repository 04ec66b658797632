#pragma once

#include <quadrature/encoder/errors.hpp>

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <optional>
#include <vector>

namespace quadrature::replay {

// One sampled instant of a captured trace.
struct Sample {
    unsigned line;
    bool a;
    bool b;
    std::optional<bool> z;
};

struct Trace {
    std::vector<Sample> samples;

    // Set when every sample carries an index level.
    bool indexed = false;
};

// Parses a text trace. Each non-blank line that does not start with '#' holds
// one sample, written either as separate tokens ("0 1" or "0 1 1") or as one
// compact bit string ("01" or "011"). Every sample must have the same number
// of channels.
llvm::Expected<Trace> parseTrace(llvm::StringRef text);

// The sample the trace pins currently report.
class TraceCursor {
   public:
    void moveTo(const Sample& sample) {
        current_ = &sample;
    }

    const Sample* current() const {
        return current_;
    }

   private:
    const Sample* current_ = nullptr;
};

// A pin reporting one channel of the sample under a cursor. Reads complete
// immediately in both blocking and suspending use.
class TracePin {
   public:
    TracePin(const TraceCursor& cursor, encoder::Channel channel)
        : cursor_(&cursor), channel_(channel) {}

    llvm::Expected<bool> isHigh();

    std::optional<llvm::Expected<bool>> pollHigh() {
        return isHigh();
    }

    void cancelRead() {}

   private:
    const TraceCursor* cursor_;
    encoder::Channel channel_;
};

}  // namespace quadrature::replay
