#include "sleeper.hpp"

#include <thread>

void ThreadSleeper::sleepFor(std::chrono::milliseconds duration)
{
    if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
}
