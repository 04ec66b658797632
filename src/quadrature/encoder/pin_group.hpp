#pragma once

#include <quadrature/encoder/errors.hpp>

#include <llvm/Support/Error.h>

#include <array>
#include <cstddef>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

namespace quadrature::encoder {

// A pin usable by a blocking encoder provides
//
//     llvm::Expected<bool> isHigh();
//
// A pin usable by a suspending encoder additionally provides
//
//     std::optional<llvm::Expected<bool>> pollHigh();
//     void cancelRead();
//
// pollHigh() returns std::nullopt while its read is outstanding; calling it
// again resumes that read. cancelRead() abandons an outstanding read.
template <typename Pin, typename = void>
struct has_blocking_read : std::false_type {};

template <typename Pin>
struct has_blocking_read<Pin, std::void_t<decltype(std::declval<Pin&>().isHigh())>>
    : std::is_same<decltype(std::declval<Pin&>().isHigh()), llvm::Expected<bool>> {};

template <typename Pin>
inline constexpr bool has_blocking_read_v = has_blocking_read<Pin>::value;

template <typename Pin, typename = void>
struct has_suspending_read : std::false_type {};

template <typename Pin>
struct has_suspending_read<Pin,
                           std::void_t<decltype(std::declval<Pin&>().pollHigh()),
                                       decltype(std::declval<Pin&>().cancelRead())>>
    : std::is_same<decltype(std::declval<Pin&>().pollHigh()),
                   std::optional<llvm::Expected<bool>>> {};

template <typename Pin>
inline constexpr bool has_suspending_read_v = has_suspending_read<Pin>::value;

// The channel pins of one encoder, in clk, dt, idx order. A group hands out
// levels only once every pin was read successfully, so a failed or abandoned
// read never leaks a partial sample.
template <typename... Pins>
class PinGroup {
   public:
    static constexpr std::size_t size = sizeof...(Pins);

    static_assert(size == 2 || size == 3, "an encoder has two or three channels");

    using Levels = std::array<bool, size>;

    explicit PinGroup(Pins... pins) : pins_(std::move(pins)...) {}

    // Reads every pin in order, stopping at the first failure.
    llvm::Expected<Levels> readAll() {
        static_assert((has_blocking_read_v<Pins> && ...),
                      "blocking reads need pins providing llvm::Expected<bool> isHigh()");

        Levels levels{};
        if (llvm::Error err = readFrom<0>(levels)) {
            return std::move(err);
        }
        return levels;
    }

    // Starts or resumes reading the pins. Returns std::nullopt while a read is
    // outstanding; levels that already arrived are kept for the next call.
    std::optional<llvm::Expected<Levels>> resumeRead() {
        static_assert((has_suspending_read_v<Pins> && ...),
                      "suspending reads need pins providing pollHigh() and cancelRead()");

        return resumeFrom<0>();
    }

    // Drops the levels of a pending read and abandons the outstanding pin read.
    void cancel() {
        if (awaiting_) {
            cancelAt<0>(next_);
        }
        next_ = 0;
        awaiting_ = false;
    }

    bool pending() const {
        return next_ != 0 || awaiting_;
    }

    std::tuple<Pins...>& pins() {
        return pins_;
    }

    std::tuple<Pins...> release() && {
        return std::move(pins_);
    }

   private:
    static constexpr Channel channelAt(std::size_t index) {
        constexpr Channel channels[] = {Channel::clk, Channel::dt, Channel::idx};
        return channels[index];
    }

    template <std::size_t I>
    llvm::Error readFrom(Levels& levels) {
        if constexpr (I == size) {
            return llvm::Error::success();
        } else {
            llvm::Expected<bool> level = std::get<I>(pins_).isHigh();
            if (!level) {
                return llvm::make_error<PinReadError>(channelAt(I), level.takeError());
            }
            levels[I] = *level;
            return readFrom<I + 1>(levels);
        }
    }

    template <std::size_t I>
    std::optional<llvm::Expected<Levels>> resumeFrom() {
        if constexpr (I == size) {
            next_ = 0;
            return llvm::Expected<Levels>(levels_);
        } else {
            if (I < next_) {
                return resumeFrom<I + 1>();
            }

            std::optional<llvm::Expected<bool>> level = std::get<I>(pins_).pollHigh();
            if (!level) {
                awaiting_ = true;
                return std::nullopt;
            }
            awaiting_ = false;

            if (!*level) {
                next_ = 0;
                return llvm::Expected<Levels>(
                    llvm::make_error<PinReadError>(channelAt(I), level->takeError()));
            }
            levels_[I] = **level;
            next_ = I + 1;
            return resumeFrom<I + 1>();
        }
    }

    template <std::size_t I>
    void cancelAt(std::size_t index) {
        if constexpr (I < size) {
            if (I == index) {
                std::get<I>(pins_).cancelRead();
                return;
            }
            cancelAt<I + 1>(index);
        }
    }

    std::tuple<Pins...> pins_;

    // Pending suspending read: levels_[0, next_) arrived, pin next_ is
    // outstanding when awaiting_ is set.
    Levels levels_{};
    std::size_t next_ = 0;
    bool awaiting_ = false;
};

}  // namespace quadrature::encoder
