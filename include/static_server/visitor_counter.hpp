#ifndef VISITOR_COUNTER_HPP
#define VISITOR_COUNTER_HPP

#include <cstdint>
#include <mutex>

namespace static_server {
    class VisitorCounter {
    public:
        virtual ~VisitorCounter() = default;

        // Returns the post-increment value. Throws std::system_error if the
        // lock cannot be taken; the count is left untouched in that case.
        virtual std::uint64_t increment_and_get();

        std::uint64_t current() const;

    private:
        std::uint64_t count = 0;
        mutable std::mutex mutex;
    };
}

#endif
