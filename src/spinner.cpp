#include "../include/patchwise/spinner.hpp"

#include <array>
#include <string_view>

namespace patchwise {

namespace {

constexpr std::array<std::string_view, 10> kFrames = {
    "⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏",
};

} // namespace

Spinner::~Spinner() {
    stop();
}

void Spinner::start() {
    if (running()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancel = false;
        m_frames = 0;
    }
    std::promise<void> cleared;
    m_cleared = cleared.get_future();
    m_thread = std::thread(&Spinner::run, this, std::move(cleared));
}

void Spinner::stop() {
    if (!running()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancel = true;
    }
    m_cv.notify_one();
    m_cleared.wait();
    m_thread.join();
}

std::size_t Spinner::frames() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_frames;
}

void Spinner::run(std::promise<void> cleared) {
    std::unique_lock<std::mutex> lock(m_mutex);
    std::size_t index = 0;
    while (!m_cancel) {
        m_out << '\r' << kFrames[index % kFrames.size()] << ' ' << std::flush;
        ++index;
        ++m_frames;
        m_cv.wait_for(lock, m_interval, [this] { return m_cancel; });
    }
    m_out << "\r\033[K" << std::flush;
    cleared.set_value();
}

} // namespace patchwise
