#pragma once

#include "notify/Notifier.hpp"

#include <mutex>
#include <vector>

namespace lc::notify {

// Buffers events until the caller drains them.
class EventQueue : public Observer {
public:
    void notify(const Event& event) override;

    [[nodiscard]] std::vector<Event> drain();

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<Event> events_;
};

}
