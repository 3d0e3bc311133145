#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace gw::debug {
    inline std::atomic<bool> enabled{false}; // master switch
    inline std::atomic<bool> raw{false}; // print truncated raw frames
    inline std::atomic<int> raw_max{512}; // truncate raw output

    inline bool dbg_on() noexcept {
        return gw::debug::enabled.load(std::memory_order_relaxed);
    }

    /// Prints one frame as "-> f0|f1|" or "<- f0|f1|". `simple` is the '|' rendering.
    inline void dbg_raw(std::string_view direction, std::string_view simple) {
        if (!gw::debug::raw.load(std::memory_order_relaxed)) return;
        const int maxc = gw::debug::raw_max.load(std::memory_order_relaxed);
        if (maxc <= 0) return;
        if (static_cast<int>(simple.size()) > maxc) simple = simple.substr(0, static_cast<std::size_t>(maxc));
        static std::mutex mu;
        std::lock_guard lk(mu);
        std::cerr << "  " << direction << " raw=\"" << simple << "\"\n";
    }
} // namespace gw::debug
