#ifndef RATE_LIMITER_HPP
#define RATE_LIMITER_HPP

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace static_server {
    // Sliding-window limiter keyed by client address. Only admitted requests
    // are recorded, so a rejected request never consumes a slot.
    class RateLimiter {
    public:
        using Clock = std::chrono::steady_clock;

        RateLimiter(std::size_t max_requests, std::chrono::milliseconds window);

        // True when the client has fewer than max_requests admissions inside the
        // trailing window. Fails open if the lock cannot be taken.
        bool allow(const std::string &client);

        std::size_t tracked_clients() const;

    private:
        // Caller holds mutex
        void sweep(Clock::time_point now);

        std::size_t max_requests;
        std::chrono::milliseconds window;
        std::unordered_map<std::string, std::deque<Clock::time_point>> windows;
        Clock::time_point last_sweep;
        mutable std::mutex mutex;
    };
}

#endif
