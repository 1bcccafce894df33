#include <static_server/connection_slots.hpp>

static_server::ConnectionSlots::ConnectionSlots(std::size_t capacity)
    : max_slots(capacity == 0 ? 1 : capacity) {
}

static_server::ConnectionSlots::Slot static_server::ConnectionSlots::acquire() {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [this]() { return in_use < max_slots; });
    ++in_use;
    return Slot(this);
}

void static_server::ConnectionSlots::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [this]() { return in_use == 0; });
}

std::size_t static_server::ConnectionSlots::active() const {
    std::lock_guard<std::mutex> lock(mutex);
    return in_use;
}

void static_server::ConnectionSlots::release() {
    // Notify under the lock so a waiter in wait_idle() cannot destroy us first
    std::lock_guard<std::mutex> lock(mutex);
    --in_use;
    cv.notify_all();
}

static_server::ConnectionSlots::Slot &static_server::ConnectionSlots::Slot::operator=(Slot &&other) noexcept {
    if (this != &other) {
        if (owner) {
            owner->release();
        }
        owner = other.owner;
        other.owner = nullptr;
    }
    return *this;
}

static_server::ConnectionSlots::Slot::~Slot() {
    if (owner) {
        owner->release();
    }
}
