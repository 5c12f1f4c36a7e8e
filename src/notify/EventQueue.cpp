#include "notify/EventQueue.hpp"

using namespace lc::notify;

void EventQueue::notify(const Event& event) {
    std::scoped_lock lock(mutex_);
    events_.push_back(event);
}

std::vector<Event> EventQueue::drain() {
    std::scoped_lock lock(mutex_);
    std::vector<Event> out;
    out.swap(events_);
    return out;
}

std::size_t EventQueue::size() const {
    std::scoped_lock lock(mutex_);
    return events_.size();
}
