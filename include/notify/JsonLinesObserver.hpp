#pragma once

#include "notify/Notifier.hpp"

#include <mutex>
#include <ostream>

namespace lc::notify {

// One JSON object per line, e.g. {"event":"copy_progress","file":"a.raw","percent":40.0}
class JsonLinesObserver : public Observer {
public:
    explicit JsonLinesObserver(std::ostream& out) : out_(out) {}

    void notify(const Event& event) override;

private:
    std::ostream& out_;
    std::mutex mutex_;
};

}
