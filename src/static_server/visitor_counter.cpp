#include <static_server/visitor_counter.hpp>

std::uint64_t static_server::VisitorCounter::increment_and_get() {
    std::lock_guard<std::mutex> lock(mutex);
    return ++count;
}

std::uint64_t static_server::VisitorCounter::current() const {
    std::lock_guard<std::mutex> lock(mutex);
    return count;
}
