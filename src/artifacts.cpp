/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "clipforge/artifacts.hpp"
#include "clipforge/logger.hpp"
#include <atomic>
#include <chrono>
#include <unistd.h>

namespace clipforge {

namespace {
std::filesystem::path absoluteOrSelf(const std::filesystem::path& path) {
    std::error_code ec;
    auto abs = std::filesystem::absolute(path, ec);
    return ec ? path : abs.lexically_normal();
}
}

ArtifactStore::ArtifactStore(const std::filesystem::path& outputDir, const std::filesystem::path& uploadDir)
    : outputDir_(absoluteOrSelf(outputDir)), uploadDir_(absoluteOrSelf(uploadDir)) {
}

bool ArtifactStore::ensureDirectories() const noexcept {
    try {
        std::filesystem::create_directories(outputDir_);
        std::filesystem::create_directories(uploadDir_);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create artifact directories: " + std::string(e.what()));
        return false;
    }
}

std::filesystem::path ArtifactStore::outputPath(const std::string& filename) const {
    return outputDir_ / filename;
}

std::string ArtifactStore::outputLocator(const std::string& filename) const {
    return kOutputPrefix + filename;
}

std::string ArtifactStore::uploadLocator(const std::string& filename) const {
    return kUploadPrefix + filename;
}

std::optional<std::filesystem::path> ArtifactStore::resolveOutput(const std::string& locator) const noexcept {
    return resolveIn(outputDir_, locator);
}

std::optional<std::filesystem::path> ArtifactStore::resolveUpload(const std::string& locator) const noexcept {
    return resolveIn(uploadDir_, locator);
}

std::optional<std::filesystem::path> ArtifactStore::resolveIn(const std::filesystem::path& dir,
                                                              const std::string& locator) noexcept {
    try {
        std::string name = std::filesystem::path(locator).filename().string();
        if (name.empty() || name == "." || name == "..") {
            return std::nullopt;
        }
        auto path = dir / name;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec) || ec) {
            return std::nullopt;
        }
        return path;
    } catch (...) {
        return std::nullopt;
    }
}

std::optional<std::string> ArtifactStore::importUpload(const std::filesystem::path& source) const noexcept {
    static std::atomic<uint64_t> counter{0};
    try {
        if (!std::filesystem::is_regular_file(source)) {
            LOG_ERROR("Audio file not found: " + source.string());
            return std::nullopt;
        }
        std::string ext = source.extension().string();
        if (ext.empty()) {
            ext = ".mp3";
        }

        auto now = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        std::string filename = "audio_" + std::to_string(now) + "_" + std::to_string(getpid()) + "_" +
                               std::to_string(counter.fetch_add(1)) + ext;

        std::filesystem::create_directories(uploadDir_);
        std::filesystem::copy_file(source, uploadDir_ / filename,
                                   std::filesystem::copy_options::overwrite_existing);
        LOG_DEBUG("Imported upload " + source.string() + " as " + filename);
        return uploadLocator(filename);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to import upload " + source.string() + ": " + e.what());
        return std::nullopt;
    }
}

}
