#ifndef CONNECTION_SLOTS_HPP
#define CONNECTION_SLOTS_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace static_server {
    // Counting semaphore bounding how many connection handlers run at once.
    class ConnectionSlots {
    public:
        // Owns one slot and gives it back on destruction
        class Slot {
        public:
            Slot() = default;
            explicit Slot(ConnectionSlots *owner) : owner(owner) {}
            Slot(Slot &&other) noexcept : owner(other.owner) { other.owner = nullptr; }
            Slot &operator=(Slot &&other) noexcept;
            Slot(const Slot &) = delete;
            Slot &operator=(const Slot &) = delete;
            ~Slot();

        private:
            ConnectionSlots *owner = nullptr;
        };

        explicit ConnectionSlots(std::size_t capacity);

        // Blocks until a slot is free
        Slot acquire();

        // Blocks until every slot has been returned
        void wait_idle();

        std::size_t active() const;
        std::size_t capacity() const { return max_slots; }

    private:
        void release();

        std::size_t max_slots;
        std::size_t in_use = 0;
        mutable std::mutex mutex;
        std::condition_variable cv;
    };
}

#endif
