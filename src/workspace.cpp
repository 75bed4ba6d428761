/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "clipforge/workspace.hpp"
#include "clipforge/logger.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>

namespace clipforge {

namespace {
std::string sanitizePrefix(const std::string& prefix) {
    std::string safe;
    for (char c : prefix) {
        unsigned char uc = static_cast<unsigned char>(c);
        safe += (std::isalnum(uc) || c == '_' || c == '-') ? c : '_';
    }
    return safe;
}
}

ScopedWorkspace::ScopedWorkspace(const std::string& prefix) noexcept {
    try {
        std::error_code ec;
        auto base = std::filesystem::temp_directory_path(ec);
        if (ec) {
            base = "/tmp";
        }

        std::string pattern = (base / (sanitizePrefix(prefix) + "XXXXXX")).string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');

        if (::mkdtemp(buffer.data()) == nullptr) {
            error_ = "mkdtemp failed for " + pattern + ": " + std::strerror(errno);
            LOG_ERROR(error_);
            return;
        }
        path_ = buffer.data();
        LOG_TRACE("Workspace created: " + path_.string());
    } catch (const std::exception& e) {
        error_ = std::string("Failed to create workspace: ") + e.what();
        LOG_ERROR(error_);
        path_.clear();
    }
}

ScopedWorkspace::~ScopedWorkspace() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        LOG_WARN("Failed to remove workspace " + path_.string() + ": " + ec.message());
    } else {
        LOG_TRACE("Workspace removed: " + path_.string());
    }
}

}
