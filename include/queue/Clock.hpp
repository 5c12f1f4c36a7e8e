#pragma once

#include "util/timestamp.hpp"

#include <chrono>
#include <thread>

namespace lc::queue {

class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual util::TimePoint now() const = 0;
    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

class SystemClock : public Clock {
public:
    [[nodiscard]] util::TimePoint now() const override { return std::chrono::system_clock::now(); }
    void sleepFor(const std::chrono::milliseconds duration) override { std::this_thread::sleep_for(duration); }
};

}
