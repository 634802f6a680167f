#pragma once
#include <chrono>
#include <thread>

namespace convergence {

// Wall-clock suspension. Not cancellable.
class Sleeper {
public:
    virtual ~Sleeper() = default;
    virtual void sleepFor(std::chrono::seconds duration) = 0;
};

class ThreadSleeper : public Sleeper {
public:
    void sleepFor(std::chrono::seconds duration) override {
        if (duration.count() > 0)
            std::this_thread::sleep_for(duration);
    }
};

} // namespace convergence
