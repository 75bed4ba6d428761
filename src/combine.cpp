/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "clipforge/combine.hpp"
#include "clipforge/logger.hpp"
#include "clipforge/process.hpp"
#include "clipforge/workspace.hpp"
#include <fstream>

namespace clipforge {

namespace {

CombineResult combineFailure(CombineError error, const std::string& message) {
    CombineResult result;
    result.ok = false;
    result.error = error;
    result.message = message;
    return result;
}

}

MediaCombiner::MediaCombiner(const Config& config, const ArtifactStore& artifacts)
    : config_(config), artifacts_(artifacts) {
    LOG_DEBUG("MediaCombiner created - ffmpeg: " + config_.ffmpegBinary);
}

std::string MediaCombiner::manifestEntry(const std::string& path) {
    std::string quoted;
    quoted.reserve(path.size() + 8);
    for (char c : path) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    return "file '" + quoted + "'";
}

CombineResult MediaCombiner::combine(const std::vector<Scene>& scenes, const ProjectId& projectId,
                                     const std::optional<std::string>& audioLocator) noexcept {
    try {
        if (scenes.empty()) {
            return combineFailure(CombineError::NoScenes, "No scenes to combine");
        }

        ScopedWorkspace workspace("clipforge_combine_" + projectId + "_");
        if (!workspace.valid()) {
            return combineFailure(CombineError::WorkspaceError, workspace.error());
        }

        // Manifest in scene order; scenes without a resolvable artifact are skipped
        auto manifestPath = workspace.path() / "files.txt";
        std::size_t entries = 0;
        {
            std::ofstream manifest(manifestPath);
            if (!manifest) {
                return combineFailure(CombineError::WorkspaceError, "Failed to write concat manifest");
            }
            for (const auto& scene : scenes) {
                if (!scene.videoLocator) continue;
                auto video = artifacts_.resolveOutput(*scene.videoLocator);
                if (!video) {
                    LOG_DEBUG("Skipping scene " + scene.id + ": artifact missing for " + *scene.videoLocator);
                    continue;
                }
                manifest << manifestEntry(video->string()) << "\n";
                ++entries;
            }
            manifest.flush();
            if (!manifest.good()) {
                return combineFailure(CombineError::WorkspaceError, "Failed to write concat manifest");
            }
        }

        if (entries == 0) {
            return combineFailure(CombineError::NoArtifacts, "No video files found to combine");
        }
        LOG_DEBUG("Combining " + std::to_string(entries) + " of " + std::to_string(scenes.size()) +
                  " scenes for project " + projectId);

        auto combinedPath = workspace.path() / "combined.mp4";
        std::vector<std::string> concat = {
            config_.ffmpegBinary,
            "-f", "concat",
            "-safe", "0",
            "-i", manifestPath.string(),
            "-c", "copy",
            "-y",
            combinedPath.string()
        };
        LOG_DEBUG("Concat command: " + formatCommand(concat));
        ProcessResult joined = runProcess(concat, OutputCapture::Combined);
        if (!joined.succeeded()) {
            std::string detail = joined.started ? joined.output : joined.error;
            return combineFailure(CombineError::ConcatFailed, "Failed to combine videos: " + detail);
        }

        std::string finalName = projectId + "_final" + config_.videoExtension;
        auto finalPath = artifacts_.outputPath(finalName);
        std::error_code ec;
        std::filesystem::create_directories(artifacts_.outputDir(), ec);

        bool muxed = false;
        if (audioLocator) {
            auto audio = artifacts_.resolveUpload(*audioLocator);
            if (!audio) {
                LOG_WARN("Audio " + *audioLocator + " not found, exporting video only");
            } else {
                std::vector<std::string> mux = {
                    config_.ffmpegBinary,
                    "-i", combinedPath.string(),
                    "-i", audio->string(),
                    "-c:v", "copy",
                    "-c:a", "aac",
                    "-shortest",
                    "-y",
                    finalPath.string()
                };
                LOG_DEBUG("Mux command: " + formatCommand(mux));
                ProcessResult withAudio = runProcess(mux, OutputCapture::Combined);
                if (withAudio.succeeded()) {
                    muxed = true;
                } else {
                    LOG_WARN("Audio mux failed for project " + projectId + ", exporting video only: " +
                             (withAudio.started ? withAudio.output : withAudio.error));
                }
            }
        }

        if (!muxed) {
            std::filesystem::copy_file(combinedPath, finalPath,
                                       std::filesystem::copy_options::overwrite_existing, ec);
            if (ec) {
                return combineFailure(CombineError::WorkspaceError,
                                      "Failed to copy combined video to output store: " + ec.message());
            }
        }

        CombineResult result;
        result.ok = true;
        result.videoLocator = artifacts_.outputLocator(finalName);
        LOG_INFO("Project combined: " + projectId + " -> " + result.videoLocator +
                 (muxed ? " (with audio)" : ""));
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("Exception combining project " + projectId + ": " + std::string(e.what()));
        return combineFailure(CombineError::WorkspaceError, "Internal combine error: " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR("Unknown exception combining project: " + projectId);
        return combineFailure(CombineError::WorkspaceError, "Unknown internal combine error");
    }
}

const char* toString(CombineError error) noexcept {
    switch (error) {
        case CombineError::None: return "none";
        case CombineError::NoScenes: return "no-scenes";
        case CombineError::NoArtifacts: return "no-artifacts";
        case CombineError::ConcatFailed: return "concat-failed";
        case CombineError::WorkspaceError: return "workspace-error";
        default: return "unknown";
    }
}

}
