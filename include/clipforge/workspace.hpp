/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>

namespace clipforge {

// Private temporary directory owned by one render or combine invocation.
// Created with mkdtemp under the system temp dir, removed recursively on destruction.
class ScopedWorkspace final {
public:
    explicit ScopedWorkspace(const std::string& prefix) noexcept;
    ~ScopedWorkspace();

    ScopedWorkspace(const ScopedWorkspace&) = delete;
    ScopedWorkspace& operator=(const ScopedWorkspace&) = delete;
    ScopedWorkspace(ScopedWorkspace&&) = delete;
    ScopedWorkspace& operator=(ScopedWorkspace&&) = delete;

    [[nodiscard]] bool valid() const noexcept { return !path_.empty(); }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& error() const noexcept { return error_; }

private:
    std::filesystem::path path_;
    std::string error_;
};

}
