// filename: progress.hpp
// part of PCB to FEMM Mesh Converter
// MIT License

#pragma once

#include <atomic>
#include <chrono>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

namespace pcbfem {

/**
 * @brief Stage banner with a text spinner, alive for one scope.
 *
 * Prints `title`, turns a |/-\ spinner on a background thread while the scope
 * runs, and on destruction joins the thread and prints the elapsed seconds.
 * A scope left by an exception prints "failed" instead of "done".
 * It only writes to `out`; quiet mode prints nothing and starts no thread.
 */
class ScopedProgress {
public:
    explicit ScopedProgress(std::string title, bool quiet = false, std::ostream& out = std::cout);

    ScopedProgress(const ScopedProgress&) = delete;
    ScopedProgress& operator=(const ScopedProgress&) = delete;

    ~ScopedProgress() { finish(std::uncaught_exceptions() > uncaughtAtStart_); }

    // Idempotent; the destructor calls it on every exit path.
    void stop() { finish(false); }

    [[nodiscard]] bool is_spinning() const { return worker_.joinable() && !stopped_.load(); }

    static std::string formatSeconds(double seconds);

private:
    using Clock = std::chrono::steady_clock;

    void run();
    void finish(bool failed);

    std::string title_;
    bool quiet_{false};
    std::ostream& out_;
    Clock::time_point start_;
    int uncaughtAtStart_{0};
    std::atomic<bool> stopped_{false};
    std::thread worker_{};
};

}  // namespace pcbfem
