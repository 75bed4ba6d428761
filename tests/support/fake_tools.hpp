/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "clipforge/config.hpp"

namespace clipforge::test {

// Behaviour switches for the generated tool scripts.
struct FakeToolOptions {
    bool failConcat = false;
    bool failMux = false;
    bool failThumbnail = false;
    std::string probeOutput = "3.5";
    int probeExit = 0;
};

// Stand-ins for the render engine, ffmpeg and ffprobe, written as shell
// scripts into a private temp directory. Each script appends its argument
// list to <root>/<tool>.log.
//
// The engine writes <media_dir>/videos/scene/480p15/<name>.mp4 holding
// "<name>\n", next to a cached segment under partial_movie_files/ holding
// "partial\n". A script containing CLASS_NAMED_OUTPUT names the movie
// GeneratedScene.mp4 instead. FAIL_RENDER makes it exit 1, NO_OUTPUT makes
// it exit 0 without writing anything.
// Concat writes the listed files back to back; mux appends "audio\n".
class FakeTools {
public:
    explicit FakeTools(const FakeToolOptions& options = {});
    ~FakeTools();

    FakeTools(const FakeTools&) = delete;
    FakeTools& operator=(const FakeTools&) = delete;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    // Binaries point at the scripts; output and upload stores live under root.
    [[nodiscard]] Config config() const;

    // One entry per invocation: the arguments joined by single spaces.
    [[nodiscard]] std::vector<std::string> calls(const std::string& tool) const;

private:
    void writeTool(const std::string& name, const std::string& body) const;

    std::filesystem::path root_;
};

[[nodiscard]] std::filesystem::path makeTempDir(const std::string& prefix);
void writeFile(const std::filesystem::path& path, const std::string& content);
[[nodiscard]] std::string readFile(const std::filesystem::path& path);

// Minimal script that passes validation.
[[nodiscard]] std::string validSceneCode(const std::string& marker = "");

}
