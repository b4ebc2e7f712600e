#pragma once

#include <chrono>

// Hold, settle and typing delays go through this so tests need not wait.
class Sleeper {
public:
    virtual ~Sleeper() = default;
    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

class ThreadSleeper : public Sleeper {
public:
    void sleepFor(std::chrono::milliseconds duration) override;
};
