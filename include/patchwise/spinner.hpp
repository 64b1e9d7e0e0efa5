#pragma once

#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <ostream>
#include <thread>

namespace patchwise {

// Animated progress glyph drawn on its own thread while tool calls stream in.
// stop() signals the thread, waits until it has erased its line, then joins, so
// nothing printed after stop() can interleave with a frame.
class Spinner {
public:
    explicit Spinner(std::ostream& out, std::chrono::milliseconds interval = std::chrono::milliseconds(100))
        : m_out(out), m_interval(interval) {}
    ~Spinner();

    Spinner(const Spinner&) = delete;
    Spinner& operator=(const Spinner&) = delete;

    void start();
    void stop();
    bool running() const noexcept { return m_thread.joinable(); }

    // Frames drawn since the last start(); used by tests.
    std::size_t frames() const;

private:
    void run(std::promise<void> cleared);

    std::ostream& m_out;
    std::chrono::milliseconds m_interval;
    std::thread m_thread;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_cancel = false;
    std::size_t m_frames = 0;
    std::future<void> m_cleared;
};

} // namespace patchwise
