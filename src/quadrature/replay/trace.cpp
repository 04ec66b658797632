#include <quadrature/replay/trace.hpp>

#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringExtras.h>
#include <llvm/Support/Debug.h>
#include <llvm/Support/ErrorHandling.h>

#include <system_error>
#include <tuple>

#define DEBUG_TYPE "quadrature-trace"

namespace quadrature::replay {

namespace {

std::error_code malformed() {
    return std::make_error_code(std::errc::invalid_argument);
}

llvm::Expected<bool> parseLevel(llvm::StringRef token, unsigned line) {
    if (token == "0") {
        return false;
    }
    if (token == "1") {
        return true;
    }
    return llvm::createStringError(
        malformed(), "line %u: expected 0 or 1, got '%s'", line, token.str().c_str());
}

llvm::Expected<llvm::SmallVector<bool, 3>> parseLevels(llvm::StringRef text, unsigned line) {
    llvm::SmallVector<llvm::StringRef, 3> tokens;
    llvm::SplitString(text, tokens);

    // A single token longer than one character is a compact bit string.
    if (tokens.size() == 1 && tokens.front().size() > 1) {
        const llvm::StringRef bits = tokens.front();
        tokens.clear();
        for (size_t i = 0; i < bits.size(); ++i) {
            tokens.push_back(bits.substr(i, 1));
        }
    }

    if (tokens.size() != 2 && tokens.size() != 3) {
        return llvm::createStringError(
            malformed(), "line %u: expected 2 or 3 channels, got %zu", line, tokens.size());
    }

    llvm::SmallVector<bool, 3> levels;
    for (llvm::StringRef token : tokens) {
        llvm::Expected<bool> level = parseLevel(token, line);
        if (!level) {
            return level.takeError();
        }
        levels.push_back(*level);
    }
    return levels;
}

}  // namespace

llvm::Expected<Trace> parseTrace(llvm::StringRef text) {
    Trace trace;
    std::optional<size_t> channels;

    unsigned line = 0;
    while (!text.empty()) {
        llvm::StringRef current;
        std::tie(current, text) = text.split('\n');
        ++line;

        current = current.trim();
        if (current.empty() || current.startswith("#")) {
            continue;
        }

        llvm::Expected<llvm::SmallVector<bool, 3>> levels = parseLevels(current, line);
        if (!levels) {
            return levels.takeError();
        }

        if (!channels) {
            channels = levels->size();
        } else if (*channels != levels->size()) {
            return llvm::createStringError(malformed(),
                                           "line %u: expected %zu channels like the first "
                                           "sample, got %zu",
                                           line,
                                           *channels,
                                           levels->size());
        }

        Sample sample{line, (*levels)[0], (*levels)[1], std::nullopt};
        if (levels->size() == 3) {
            sample.z = (*levels)[2];
        }
        trace.samples.push_back(sample);
    }

    trace.indexed = channels == 3u;

    LLVM_DEBUG(llvm::dbgs() << "parsed " << trace.samples.size() << " samples"
                            << (trace.indexed ? " with index\n" : "\n"));

    return trace;
}

llvm::Expected<bool> TracePin::isHigh() {
    const Sample* sample = cursor_->current();
    if (!sample) {
        return llvm::createStringError(std::make_error_code(std::errc::no_message_available),
                                       "no sample under the trace cursor");
    }

    switch (channel_) {
        case encoder::Channel::clk:
            return sample->a;
        case encoder::Channel::dt:
            return sample->b;
        case encoder::Channel::idx:
            return sample->z.value_or(false);
    }
    llvm_unreachable("unknown encoder channel");
}

}  // namespace quadrature::replay
