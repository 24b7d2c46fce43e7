/**
 * @file stop_signal.hpp
 * @brief SIGINT/SIGTERM latch polled by long-running tools
 *
 * The handler only sets a flag; whoever polls stop_requested() does the
 * actual shutdown on its own thread.
 */

#pragma once

#include <chrono>
#include <csignal>
#include <thread>

namespace Driftwatch {

namespace detail {
inline volatile std::sig_atomic_t g_stop_requested = 0;

inline void on_stop_signal(int) {
    g_stop_requested = 1;
}
} // namespace detail

inline void install_stop_handlers() {
    detail::g_stop_requested = 0;
    std::signal(SIGINT, detail::on_stop_signal);
    std::signal(SIGTERM, detail::on_stop_signal);
}

inline bool stop_requested() {
    return detail::g_stop_requested != 0;
}

/// Block the calling thread until SIGINT or SIGTERM arrives
inline void wait_for_stop_signal(std::chrono::milliseconds poll = std::chrono::milliseconds(200)) {
    while (!stop_requested()) {
        std::this_thread::sleep_for(poll);
    }
}

} // namespace Driftwatch
