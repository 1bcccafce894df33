#include <static_server/rate_limiter.hpp>
#include <iostream>
#include <system_error>

static_server::RateLimiter::RateLimiter(std::size_t max_requests, std::chrono::milliseconds window)
    : max_requests(max_requests), window(window), last_sweep(Clock::now()) {
}

bool static_server::RateLimiter::allow(const std::string &client) {
    std::unique_lock<std::mutex> lock(mutex, std::defer_lock);
    try {
        lock.lock();
    } catch (const std::system_error& e) {
        std::cerr << "Failed to acquire lock for rate limiting: " << e.what() << std::endl;
        return true;
    }

    auto now = Clock::now();
    if (now - last_sweep >= window) {
        sweep(now);
    }

    auto &timestamps = windows[client];
    while (!timestamps.empty() && now - timestamps.front() >= window) {
        timestamps.pop_front();
    }

    if (timestamps.size() >= max_requests) {
        return false;
    }

    timestamps.push_back(now);
    return true;
}

std::size_t static_server::RateLimiter::tracked_clients() const {
    std::lock_guard<std::mutex> lock(mutex);
    return windows.size();
}

void static_server::RateLimiter::sweep(Clock::time_point now) {
    // Timestamps are appended in order, so the newest sits at the back
    for (auto it = windows.begin(); it != windows.end();) {
        if (it->second.empty() || now - it->second.back() >= window) {
            it = windows.erase(it);
        } else {
            ++it;
        }
    }
    last_sweep = now;
}
