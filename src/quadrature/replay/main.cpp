#include <quadrature/replay/replay.hpp>
#include <quadrature/replay/trace.hpp>

#include <llvm/Support/CommandLine.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/FormatVariadic.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/raw_ostream.h>

#include <exception>
#include <memory>
#include <string>
#include <system_error>

using namespace quadrature::replay;

namespace cl = llvm::cl;

static cl::OptionCategory opts("quadrature-replay options");

static cl::extrahelp moreHelp(
    "\nReplays a captured quadrature trace through an encoder. Each line of the\n"
    "trace holds one sample: 'a b', 'a b z', or the compact forms '01' / '011'.\n");

static cl::opt<std::string> TracePath(cl::Positional,
                                      cl::desc("<trace file, - for stdin>"),
                                      cl::init("-"),
                                      cl::cat(opts));

static cl::opt<std::string> outfile("o",
                                    cl::init("-"),
                                    cl::desc("Output file, default stdout"),
                                    cl::cat(opts));

static cl::opt<StepSetting> steps("steps",
                                  cl::desc("Counts per quadrature cycle"),
                                  cl::values(clEnumValN(StepSetting::full, "full", "1 per cycle"),
                                             clEnumValN(StepSetting::half, "half", "2 per cycle"),
                                             clEnumValN(StepSetting::quad, "quad", "4 per cycle")),
                                  cl::init(StepSetting::full),
                                  cl::cat(opts));

static cl::opt<ModeSetting> mode("mode",
                                 cl::desc("How movements are reported"),
                                 cl::values(clEnumValN(ModeSetting::rotary,
                                                       "rotary",
                                                       "clockwise / counter-clockwise"),
                                            clEnumValN(ModeSetting::linear,
                                                       "linear",
                                                       "forward / backward")),
                                 cl::init(ModeSetting::rotary),
                                 cl::cat(opts));

static cl::opt<bool> reversed("reversed",
                              cl::desc("Swap the clk and dt channels"),
                              cl::cat(opts));

static cl::opt<bool> suspending("suspending",
                                cl::desc("Drive the encoder through its suspending poll path"),
                                cl::cat(opts));

static cl::opt<bool> failOnInvalid(
    "fail-on-invalid",
    cl::desc("Exit with status 2 if the trace contains an invalid transition"),
    cl::cat(opts));

int main(int argc, const char** argv) try {
    cl::HideUnrelatedOptions(opts);
    cl::ParseCommandLineOptions(argc, argv);

    if (TracePath.empty()) {
        llvm::errs() << "A trace path is mandatory, use - to read stdin\n";
        cl::PrintHelpMessage();
        return 1;
    }

    llvm::ErrorOr<std::unique_ptr<llvm::MemoryBuffer>> buffer =
        llvm::MemoryBuffer::getFileOrSTDIN(TracePath);
    if (std::error_code ec = buffer.getError()) {
        llvm::errs() << "Cannot read trace " << TracePath << ": " << ec.message() << "\n";
        return 1;
    }

    llvm::Expected<Trace> trace = parseTrace((*buffer)->getBuffer());
    if (!trace) {
        llvm::logAllUnhandledErrors(trace.takeError(), llvm::errs(), TracePath.getValue() + ": ");
        return 1;
    }

    std::error_code ec;
    llvm::raw_fd_ostream out(outfile, ec, llvm::sys::fs::CD_CreateAlways);

    if (ec != std::error_code{}) {
        throw std::system_error(ec);
    }

    ReplayOptions options;
    options.steps = steps;
    options.mode = mode;
    options.reversed = reversed;
    options.suspending = suspending;

    llvm::Expected<ReplaySummary> summary = replay(*trace, options, out, llvm::errs());
    if (!summary) {
        llvm::errs() << "Replay failed: " << llvm::toString(summary.takeError()) << "\n";
        return 1;
    }

    if (failOnInvalid && summary->invalidTransitions != 0) {
        llvm::errs() << llvm::formatv("{0} invalid transition(s) in {1}\n",
                                      summary->invalidTransitions,
                                      TracePath.getValue());
        return 2;
    }

    return 0;
} catch (const std::exception& e) {
    llvm::errs() << "quadrature-replay failed with exception: " << e.what() << "\n";
    return 1;
}
