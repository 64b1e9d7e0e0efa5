// spinner_test.cpp - background progress glyph lifecycle

#include <patchwise/spinner.hpp>

#include <gtest/gtest.h>

#include <sstream>
#include <thread>

using namespace std::chrono_literals;
using patchwise::Spinner;

TEST(Spinner, draws_frames_until_stopped_then_clears_line) {
    std::ostringstream out;
    Spinner spinner(out, 5ms);
    spinner.start();
    EXPECT_TRUE(spinner.running());
    std::this_thread::sleep_for(60ms);
    spinner.stop();

    EXPECT_FALSE(spinner.running());
    EXPECT_GE(spinner.frames(), 2u);
    const std::string text = out.str();
    ASSERT_GE(text.size(), 4u);
    EXPECT_EQ(text.substr(text.size() - 4), "\r\033[K");

    // Nothing is drawn once stop() has returned.
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(out.str(), text);
}

TEST(Spinner, stop_without_start_and_double_stop_are_harmless) {
    std::ostringstream out;
    Spinner spinner(out);
    spinner.stop();
    spinner.start();
    spinner.stop();
    spinner.stop();
    EXPECT_FALSE(spinner.running());
}

TEST(Spinner, restart_resets_frame_count) {
    std::ostringstream out;
    Spinner spinner(out, 5ms);
    spinner.start();
    std::this_thread::sleep_for(40ms);
    spinner.stop();
    EXPECT_GE(spinner.frames(), 2u);

    spinner.start();
    spinner.stop();
    EXPECT_LE(spinner.frames(), 1u);
}

TEST(Spinner, destructor_stops_running_thread) {
    std::ostringstream out;
    {
        Spinner spinner(out, 1ms);
        spinner.start();
    }
    const std::string text = out.str();
    EXPECT_EQ(text.substr(text.size() - 4), "\r\033[K");
}
