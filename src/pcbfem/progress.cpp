// filename: progress.cpp
// part of PCB to FEMM Mesh Converter
// MIT License

#include "pcbfem/progress.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace pcbfem {
namespace {

constexpr std::chrono::milliseconds kSpinInterval{100};
constexpr char kSpinFrames[] = {'|', '/', '-', '\\'};

}  // namespace

ScopedProgress::ScopedProgress(std::string title, bool quiet, std::ostream& out)
    : title_(std::move(title)),
      quiet_(quiet),
      out_(out),
      start_(Clock::now()),
      uncaughtAtStart_(std::uncaught_exceptions()) {
    if (quiet_) {
        stopped_.store(true);
        return;
    }
    out_ << title_ << ' ';
    out_.flush();
    worker_ = std::thread([this]() { run(); });
}

void ScopedProgress::run() {
    std::size_t frame = 0;
    out_ << kSpinFrames[frame];
    out_.flush();
    while (!stopped_.load()) {
        std::this_thread::sleep_for(kSpinInterval);
        if (stopped_.load()) {
            break;
        }
        frame = (frame + 1) % sizeof(kSpinFrames);
        out_ << '\b' << kSpinFrames[frame];
        out_.flush();
    }
    out_ << '\b';
}

void ScopedProgress::finish(bool failed) {
    const bool wasRunning = !stopped_.exchange(true);
    if (worker_.joinable()) {
        worker_.join();
    }
    if (wasRunning && !quiet_) {
        const double elapsed = std::chrono::duration<double>(Clock::now() - start_).count();
        out_ << (failed ? "failed (" : "done (") << formatSeconds(elapsed) << ")\n";
        out_.flush();
    }
}

std::string ScopedProgress::formatSeconds(double seconds) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << seconds << 's';
    return oss.str();
}

}  // namespace pcbfem
