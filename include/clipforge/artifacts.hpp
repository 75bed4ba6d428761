/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace clipforge {

// Persistent output and upload stores, addressed by locators of the form
// "/outputs/<filename>" and "/uploads/<filename>". Only the basename of a
// locator is used to resolve it, so a locator cannot point outside its store.
class ArtifactStore {
public:
    static constexpr const char* kOutputPrefix = "/outputs/";
    static constexpr const char* kUploadPrefix = "/uploads/";

    ArtifactStore(const std::filesystem::path& outputDir, const std::filesystem::path& uploadDir);

    [[nodiscard]] bool ensureDirectories() const noexcept;

    [[nodiscard]] const std::filesystem::path& outputDir() const noexcept { return outputDir_; }
    [[nodiscard]] const std::filesystem::path& uploadDir() const noexcept { return uploadDir_; }

    [[nodiscard]] std::filesystem::path outputPath(const std::string& filename) const;
    [[nodiscard]] std::string outputLocator(const std::string& filename) const;
    [[nodiscard]] std::string uploadLocator(const std::string& filename) const;

    // Absolute path of an existing regular file, or nullopt.
    [[nodiscard]] std::optional<std::filesystem::path> resolveOutput(const std::string& locator) const noexcept;
    [[nodiscard]] std::optional<std::filesystem::path> resolveUpload(const std::string& locator) const noexcept;

    // Copies a local audio file into the upload store under a generated name.
    [[nodiscard]] std::optional<std::string> importUpload(const std::filesystem::path& source) const noexcept;

private:
    [[nodiscard]] static std::optional<std::filesystem::path> resolveIn(const std::filesystem::path& dir,
                                                                        const std::string& locator) noexcept;

    std::filesystem::path outputDir_;
    std::filesystem::path uploadDir_;
};

}
