/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>

namespace clipforge {

struct Config {
    std::filesystem::path outputDir = "outputs";
    std::filesystem::path uploadDir = "uploads";

    std::string engineBinary = "manim";
    std::string ffmpegBinary = "ffmpeg";
    std::string ffprobeBinary = "ffprobe";

    // Scene class the engine is asked to render.
    std::string entryClass = "GeneratedScene";
    std::string videoExtension = ".mp4";

    // Share of job progress spent rendering scenes in render-all jobs.
    int renderBudget = 80;
    double fallbackDuration = 5.0;

    // Progress at which the combine phase of a render-all job begins.
    [[nodiscard]] int combineProgress() const noexcept { return renderBudget + (100 - renderBudget) / 4; }

    // Reads CLIPFORGE_* variables; anything missing or malformed keeps its default.
    [[nodiscard]] static Config fromEnv();
};

}
