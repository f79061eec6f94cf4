// filename: progress_test.cpp
// part of PCB to FEMM Mesh Converter
// MIT License

#include "pcbfem/progress.hpp"

#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

int main() {
    using namespace pcbfem;

    if (ScopedProgress::formatSeconds(0.1234) != "0.123s" || ScopedProgress::formatSeconds(2.0) != "2.000s") {
        std::cerr << "Elapsed time formatted as " << ScopedProgress::formatSeconds(0.1234) << "\n";
        return 1;
    }

    std::ostringstream quietOut;
    {
        ScopedProgress quiet("Quiet stage...", true, quietOut);
        if (quiet.is_spinning()) {
            std::cerr << "Quiet progress started a spinner\n";
            return 1;
        }
    }
    if (!quietOut.str().empty()) {
        std::cerr << "Quiet progress wrote output: " << quietOut.str() << "\n";
        return 1;
    }

    std::ostringstream out;
    {
        ScopedProgress progress("Finding pads...", false, out);
        if (!progress.is_spinning()) {
            std::cerr << "Progress spinner not running\n";
            return 1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
        progress.stop();
        progress.stop();
        if (progress.is_spinning()) {
            std::cerr << "Progress spinner still running after stop\n";
            return 1;
        }
    }

    const std::string text = out.str();
    const std::string prefix = "Finding pads... |";
    const std::string::size_type done = text.find("done (");
    if (text.compare(0, prefix.size(), prefix) != 0 || done == std::string::npos ||
        text.find("done (", done + 1) != std::string::npos || text.size() < 3 ||
        text.compare(text.size() - 3, 3, "s)\n") != 0) {
        std::cerr << "Unexpected progress output: " << text << "\n";
        return 1;
    }

    // A stage that throws reports failure rather than completion.
    std::ostringstream failedOut;
    try {
        ScopedProgress failing("Merging points...", false, failedOut);
        throw std::runtime_error("stage failed");
    } catch (const std::runtime_error&) {
    }
    const std::string failedText = failedOut.str();
    if (failedText.find("failed (") == std::string::npos || failedText.find("done (") != std::string::npos) {
        std::cerr << "Unexpected output for a failed stage: " << failedText << "\n";
        return 1;
    }

    std::cout << "Progress reporting validated successfully\n";
    return 0;
}
