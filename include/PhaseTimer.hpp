#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

// Runs at most one pending task after a delay, on its own worker thread.
// schedule() replaces the pending task, cancel() drops it. Neither waits
// for a task that is already running, so tasks may call back into the owner.
class PhaseTimer {
public:
    using Task = std::function<void()>;

    PhaseTimer();
    ~PhaseTimer();

    PhaseTimer(const PhaseTimer&) = delete;
    PhaseTimer& operator=(const PhaseTimer&) = delete;

    void schedule(std::chrono::milliseconds delay, Task task);
    void cancel();
    bool isPending();

    // Stops the worker. Pending tasks never run.
    void shutdown();

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    Task m_task;
    std::chrono::steady_clock::time_point m_deadline;
    bool m_pending;
    bool m_shutdown;
    std::thread m_worker; // last: started after the state above is initialized

    void run();
};
