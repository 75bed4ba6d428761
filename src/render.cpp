/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "clipforge/render.hpp"
#include "clipforge/logger.hpp"
#include "clipforge/process.hpp"
#include "clipforge/workspace.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <vector>

namespace clipforge {

namespace {

RenderResult renderFailure(RenderError error, const std::string& message) {
    RenderResult result;
    result.ok = false;
    result.error = error;
    result.message = message;
    return result;
}

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

// Cached segments the engine stitches into the final movie
constexpr const char* kPartialSegmentsDir = "partial_movie_files";

// A directory's own files (sorted) come before its subdirectories (sorted).
void collectTopDown(const std::filesystem::path& dir, const std::string& extension,
                    std::vector<std::filesystem::path>& out) {
    std::vector<std::filesystem::path> files;
    std::vector<std::filesystem::path> subdirs;
    std::error_code ec;
    for (auto it = std::filesystem::directory_iterator(dir, ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        std::error_code typeEc;
        if (it->is_directory(typeEc)) {
            if (it->path().filename() != kPartialSegmentsDir) {
                subdirs.push_back(it->path());
            }
        } else if (it->is_regular_file(typeEc) && it->path().extension() == extension) {
            files.push_back(it->path());
        }
    }
    std::sort(files.begin(), files.end());
    std::sort(subdirs.begin(), subdirs.end());
    out.insert(out.end(), files.begin(), files.end());
    for (const auto& subdir : subdirs) {
        collectTopDown(subdir, extension, out);
    }
}

}

EngineRenderer::EngineRenderer(const Config& config, const ArtifactStore& artifacts)
    : config_(config), artifacts_(artifacts) {
    LOG_DEBUG("EngineRenderer created - engine: " + config_.engineBinary + ", output: " +
              artifacts_.outputDir().string());
}

RenderResult EngineRenderer::render(const std::string& code, const SceneId& sceneId) noexcept {
    try {
        auto startTime = std::chrono::steady_clock::now();

        // Step 1: private workspace, removed on every return below
        ScopedWorkspace workspace("clipforge_render_" + sceneId + "_");
        if (!workspace.valid()) {
            return renderFailure(RenderError::WorkspaceError, workspace.error());
        }

        // Step 2: persist the script
        auto scriptPath = workspace.path() / "scene.py";
        {
            std::ofstream file(scriptPath, std::ios::binary);
            if (!file) {
                return renderFailure(RenderError::WorkspaceError, "Failed to write scene script");
            }
            file << code;
            file.flush();
            if (!file.good()) {
                return renderFailure(RenderError::WorkspaceError, "Failed to write scene script");
            }
        }

        // Step 3: run the engine
        auto mediaDir = workspace.path() / "media";
        std::vector<std::string> argv = {
            config_.engineBinary, "render", "-ql",
            "-o", sceneId,
            "--media_dir", mediaDir.string(),
            scriptPath.string(),
            config_.entryClass
        };
        LOG_DEBUG("Render command: " + formatCommand(argv));
        ProcessResult engine = runProcess(argv, OutputCapture::Combined);

        // Step 4
        if (!engine.succeeded()) {
            std::string detail = engine.started ? engine.output : engine.error;
            if (detail.empty()) detail = "Unknown render error";
            LOG_WARN("Engine failed for scene " + sceneId + " (exit " + std::to_string(engine.exitCode) + ")");
            return renderFailure(RenderError::EngineFailed, "Manim render failed: " + detail);
        }

        // Step 5
        auto artifact = findArtifact(mediaDir, sceneId);
        if (!artifact) {
            return renderFailure(RenderError::NoArtifact, "No video file generated");
        }

        // Step 6: publish under a deterministic name
        std::string videoName = sceneId + config_.videoExtension;
        auto outputPath = artifacts_.outputPath(videoName);
        {
            std::error_code ec;
            std::filesystem::create_directories(artifacts_.outputDir(), ec);
            std::filesystem::copy_file(*artifact, outputPath,
                                       std::filesystem::copy_options::overwrite_existing, ec);
            if (ec) {
                return renderFailure(RenderError::WorkspaceError,
                                     "Failed to copy video to output store: " + ec.message());
            }
        }

        RenderResult result;
        result.ok = true;
        result.videoLocator = artifacts_.outputLocator(videoName);

        // Steps 7 and 8 never fail the render
        result.thumbnailLocator = extractThumbnail(outputPath, sceneId);
        result.durationSeconds = probeDuration(outputPath);

        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
        LOG_INFO("Scene rendered: " + sceneId + " -> " + result.videoLocator + " (" +
                 std::to_string(result.durationSeconds) + "s clip, " + std::to_string(elapsed) + "s wall)");
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("Exception rendering scene " + sceneId + ": " + std::string(e.what()));
        return renderFailure(RenderError::WorkspaceError, "Internal render error: " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR("Unknown exception rendering scene: " + sceneId);
        return renderFailure(RenderError::WorkspaceError, "Unknown internal render error");
    }
}

std::optional<std::filesystem::path> EngineRenderer::findArtifact(const std::filesystem::path& mediaDir,
                                                                  const SceneId& sceneId) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(mediaDir, ec)) {
        return std::nullopt;
    }

    // Engine layout varies by version and quality. The movie named after the
    // scene wins; otherwise the first candidate in top-down order.
    std::vector<std::filesystem::path> candidates;
    collectTopDown(mediaDir, config_.videoExtension, candidates);
    if (candidates.empty()) {
        return std::nullopt;
    }
    for (const auto& candidate : candidates) {
        if (candidate.stem() == sceneId) {
            return candidate;
        }
    }
    return candidates.front();
}

std::optional<std::string> EngineRenderer::extractThumbnail(const std::filesystem::path& video,
                                                            const SceneId& sceneId) const noexcept {
    try {
        std::string thumbName = sceneId + "_thumb.png";
        auto thumbPath = artifacts_.outputPath(thumbName);
        std::vector<std::string> argv = {
            config_.ffmpegBinary,
            "-i", video.string(),
            "-ss", "00:00:01",
            "-vframes", "1",
            "-y",
            thumbPath.string()
        };
        ProcessResult probe = runProcess(argv, OutputCapture::Discard);
        if (!probe.succeeded()) {
            LOG_DEBUG("Thumbnail extraction failed for " + sceneId + ": " +
                      (probe.started ? "exit " + std::to_string(probe.exitCode) : probe.error));
        }

        std::error_code ec;
        if (std::filesystem::is_regular_file(thumbPath, ec)) {
            return artifacts_.outputLocator(thumbName);
        }
        return std::nullopt;
    } catch (const std::exception& e) {
        LOG_WARN("Thumbnail extraction error for " + sceneId + ": " + e.what());
        return std::nullopt;
    }
}

double EngineRenderer::probeDuration(const std::filesystem::path& video) const noexcept {
    try {
        std::vector<std::string> argv = {
            config_.ffprobeBinary,
            "-v", "error",
            "-show_entries", "format=duration",
            "-of", "default=noprint_wrappers=1:nokey=1",
            video.string()
        };
        ProcessResult probe = runProcess(argv, OutputCapture::StdoutOnly);
        if (!probe.succeeded()) {
            LOG_DEBUG("Duration probe failed for " + video.string() + ", using fallback");
            return config_.fallbackDuration;
        }

        std::string text = trim(probe.output);
        std::size_t used = 0;
        double duration = std::stod(text, &used);
        if (used != text.size()) {
            LOG_DEBUG("Unexpected duration output '" + text + "', using fallback");
            return config_.fallbackDuration;
        }
        return duration;
    } catch (const std::exception&) {
        // non-numeric output ("N/A", empty)
        return config_.fallbackDuration;
    }
}

const char* toString(RenderError error) noexcept {
    switch (error) {
        case RenderError::None: return "none";
        case RenderError::EngineFailed: return "engine-failed";
        case RenderError::NoArtifact: return "no-artifact";
        case RenderError::WorkspaceError: return "workspace-error";
        default: return "unknown";
    }
}

}
