#include "notify/Notifier.hpp"
#include "logging/LogRegistry.hpp"

using namespace lc::notify;
using namespace lc::logging;

void Notifier::subscribe(std::shared_ptr<Observer> observer) {
    if (observer) observers_.push_back(std::move(observer));
}

void Notifier::publish(const Event& event) const {
    for (const auto& observer : observers_) {
        try {
            observer->notify(event);
        } catch (const std::exception& e) {
            LogRegistry::notify()->warn("[Notifier] Observer failed handling {}: {}", eventName(event), e.what());
        }
    }
}
