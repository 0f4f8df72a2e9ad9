#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

using namespace std;

// Transfer-mode flag of one session. While it is set a transfer task owns the
// socket and the command loop must not read from it.
class TransferGate {
public:
    void enter();
    void leave();

    bool active() const;

    void wait_idle();
    bool wait_idle_for(chrono::milliseconds timeout);

private:
    mutable mutex mtx_;
    condition_variable cv_;
    bool active_ = false;
};
