#pragma once

#include "forge/utility.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace forge {

struct ProcessStatus {
    int code = 0;                               // Exit code when the child exited normally
    std::optional<int> signal = std::nullopt;   // Set when the child was killed by a signal
    std::optional<int> interrupt = std::nullopt; // Signal forwarded to the child while it ran

    bool success() const {
        return !signal && code == 0;
    }
    int exit_code() const {
        return signal ? 128 + *signal : code;
    }
};

// Runs `args` (argv[0] looked up on PATH) with inherited standard streams and waits for it.
// Termination signals that arrive meanwhile are forwarded to the child.
Result<ProcessStatus> process_exec(const std::vector<std::string> &args, const std::filesystem::path &cwd = {});

} // namespace forge
