#pragma once

#include "notify/Event.hpp"

#include <memory>
#include <vector>

namespace lc::notify {

class Observer {
public:
    virtual ~Observer() = default;
    virtual void notify(const Event& event) = 0;
};

// Fans events out to every subscribed observer. An observer that throws is logged and skipped.
class Notifier {
public:
    void subscribe(std::shared_ptr<Observer> observer);

    void publish(const Event& event) const;

    [[nodiscard]] bool empty() const { return observers_.empty(); }

private:
    std::vector<std::shared_ptr<Observer>> observers_;
};

}
