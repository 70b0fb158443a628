#include "wait_group.hpp"
#include <stdexcept>

using namespace server;

void WaitGroup::add(int delta)
{
    std::lock_guard lock(mutex);
    if (counter + delta < 0) {
        throw std::logic_error("WaitGroup counter is negative");
    }
    counter += delta;
    if (counter == 0) {
        zero.notify_all();
    }
}

void WaitGroup::wait()
{
    std::unique_lock lock(mutex);
    zero.wait(lock, [this] { return counter == 0; });
}

bool WaitGroup::waitWithTimeout(std::chrono::milliseconds timeout)
{
    std::unique_lock lock(mutex);
    return !zero.wait_for(lock, timeout, [this] { return counter == 0; });
}

int WaitGroup::pending()
{
    std::lock_guard lock(mutex);
    return counter;
}
