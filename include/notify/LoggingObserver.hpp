#pragma once

#include "notify/Notifier.hpp"

namespace lc::notify {

class LoggingObserver : public Observer {
public:
    void notify(const Event& event) override;
};

}
