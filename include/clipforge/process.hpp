/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace clipforge {

enum class OutputCapture : uint8_t {
    Combined,     // stdout and stderr interleaved into output
    StdoutOnly,   // stderr discarded
    Discard       // both discarded
};

struct ProcessResult {
    bool started = false;
    int exitCode = -1;      // 128 + signal when killed by a signal
    std::string output;
    std::string error;      // why the process could not be started
    [[nodiscard]] bool succeeded() const noexcept { return started && exitCode == 0; }
};

// Runs argv[0] (PATH lookup) with argv directly, no shell involved.
// Blocks the calling thread until the child exits. stdin is /dev/null.
[[nodiscard]] ProcessResult runProcess(const std::vector<std::string>& argv,
                                       OutputCapture capture = OutputCapture::Combined) noexcept;

// Human-readable command line for logs.
[[nodiscard]] std::string formatCommand(const std::vector<std::string>& argv);

}
