#pragma once

#include <chrono>

namespace ftr {

/**
 * @brief Absolute point in time after which a request must stop doing I/O
 */
class Deadline {
public:
    using clock = std::chrono::steady_clock;

    Deadline() : when_(clock::time_point::max()) {}
    explicit Deadline(clock::time_point when) : when_(when) {}

    /// Saturates to never() when now + timeout is not representable
    template <typename Rep, typename Period>
    static Deadline after(std::chrono::duration<Rep, Period> timeout) {
        using Duration = std::chrono::duration<Rep, Period>;
        const auto now = clock::now();
        const auto headroom = std::chrono::duration_cast<Duration>(clock::time_point::max() - now);
        if (timeout >= headroom) {
            return never();
        }
        return Deadline(now + std::chrono::duration_cast<clock::duration>(timeout));
    }

    static Deadline never() { return Deadline(); }

    /// The earlier of this deadline and now + timeout
    template <typename Rep, typename Period>
    Deadline capped(std::chrono::duration<Rep, Period> timeout) const {
        const Deadline limit = after(timeout);
        return limit.when_ < when_ ? limit : *this;
    }

    [[nodiscard]] bool expired() const { return clock::now() >= when_; }

    [[nodiscard]] clock::duration remaining() const {
        const auto now = clock::now();
        return now >= when_ ? clock::duration::zero() : when_ - now;
    }

    [[nodiscard]] clock::time_point time_point() const noexcept { return when_; }
    [[nodiscard]] bool is_infinite() const noexcept { return when_ == clock::time_point::max(); }

private:
    clock::time_point when_;
};

} // namespace ftr
