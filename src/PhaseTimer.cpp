#include "PhaseTimer.hpp"
#include <iostream>
#include <stdexcept>

PhaseTimer::PhaseTimer()
    : m_pending(false),
      m_shutdown(false),
      m_worker(&PhaseTimer::run, this)
{}

PhaseTimer::~PhaseTimer() {
    shutdown();
}

/**
 * @brief Replaces the pending task with `task`, due `delay` from now.
 */
void PhaseTimer::schedule(std::chrono::milliseconds delay, Task task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) return;
        m_task = std::move(task);
        m_deadline = std::chrono::steady_clock::now() + delay;
        m_pending = true;
    }
    m_cv.notify_all();
}

void PhaseTimer::cancel() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_task = nullptr;
        m_pending = false;
    }
    m_cv.notify_all();
}

bool PhaseTimer::isPending() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending;
}

void PhaseTimer::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutdown = true;
        m_pending = false;
        m_task = nullptr;
    }
    m_cv.notify_all();
    if (!m_worker.joinable()) return;
    if (m_worker.get_id() == std::this_thread::get_id()) {
        m_worker.detach(); // called from inside a task
    } else {
        m_worker.join();
    }
}

void PhaseTimer::run() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_shutdown) {
        if (!m_pending) {
            m_cv.wait(lock);
            continue;
        }
        if (std::chrono::steady_clock::now() < m_deadline) {
            // Woken early by schedule/cancel/shutdown or spuriously: re-check everything
            m_cv.wait_until(lock, m_deadline);
            continue;
        }

        Task task = std::move(m_task);
        m_task = nullptr;
        m_pending = false;

        lock.unlock();
        try {
            if (task) task();
        } catch (const std::logic_error& e) {
            std::cerr << "PhaseTimer: fatal: " << e.what() << std::endl;
            throw;
        } catch (const std::exception& e) {
            std::cerr << "PhaseTimer: task failed: " << e.what() << std::endl;
        }
        lock.lock();
    }
}
