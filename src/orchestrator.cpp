/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "clipforge/orchestrator.hpp"
#include "clipforge/artifacts.hpp"
#include "clipforge/logger.hpp"
#include "clipforge/validator.hpp"
#include <stdexcept>

namespace clipforge {

namespace {

SubmitResult rejected(PreconditionError error, const std::string& message) {
    SubmitResult result;
    result.ok = false;
    result.error = error;
    result.message = message;
    return result;
}

SceneResult sceneRejected(PreconditionError error, const std::string& message) {
    SceneResult result;
    result.ok = false;
    result.error = error;
    result.message = message;
    return result;
}

}

Orchestrator::Orchestrator(Store& store, Renderer& renderer, Combiner& combiner, const Config& config,
                           CodeGenerator generator)
    : store_(store), renderer_(renderer), combiner_(combiner), config_(config),
      generator_(std::move(generator)) {
    ArtifactStore artifacts(config_.outputDir, config_.uploadDir);
    if (!artifacts.ensureDirectories()) {
        LOG_WARN("Output or upload directory unavailable: " + artifacts.outputDir().string() + ", " +
                 artifacts.uploadDir().string());
    }
    LOG_DEBUG("Orchestrator created (render budget " + std::to_string(config_.renderBudget) + "%)");
}

Orchestrator::~Orchestrator() {
    shutdown();
}

void Orchestrator::shutdown() noexcept {
    dispatcher_.shutdown();
}

bool Orchestrator::wait(const JobId& jobId) {
    TaskHandle handle;
    {
        std::lock_guard<std::mutex> lock(handlesMutex_);
        auto it = handles_.find(jobId);
        if (it == handles_.end()) {
            // Untracked but known: its task already finished and was pruned
            return store_.job(jobId).has_value();
        }
        handle = it->second;
    }
    handle.wait();

    std::lock_guard<std::mutex> lock(handlesMutex_);
    handles_.erase(jobId);
    return true;
}

std::size_t Orchestrator::trackedJobs() const {
    std::lock_guard<std::mutex> lock(handlesMutex_);
    return handles_.size();
}

SubmitResult Orchestrator::submitSceneRender(const SceneId& sceneId) noexcept {
    try {
        auto scene = store_.scene(sceneId);
        if (!scene) {
            return rejected(PreconditionError::SceneNotFound, "Scene not found");
        }
        if (!scene->hasCode()) {
            return rejected(PreconditionError::MissingCode, "Scene has no code to render");
        }

        Job job = store_.createJob(JobKind::SceneRender, sceneId, std::nullopt);
        return launch(std::move(job), [this, sceneId](const Job& job) {
            setPhase(job.id, "Rendering scene", 0);

            auto current = store_.scene(sceneId);
            if (!current) {
                failJob(job.id, "Scene not found");
                return;
            }

            Outcome outcome = renderScene(*current);
            if (!outcome.ok) {
                failJob(job.id, outcome.message);
                return;
            }
            auto rendered = store_.scene(sceneId);
            completeJob(job.id, rendered && rendered->videoLocator ? *rendered->videoLocator : "");
        });
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to submit scene render: " + std::string(e.what()));
        return rejected(PreconditionError::DispatchFailed, e.what());
    }
}

SubmitResult Orchestrator::submitExport(const ProjectId& projectId) noexcept {
    try {
        auto project = store_.project(projectId);
        if (!project) {
            return rejected(PreconditionError::ProjectNotFound, "Project not found");
        }
        if (project->sceneIds.empty()) {
            return rejected(PreconditionError::NoScenes, "Project has no scenes");
        }
        for (const auto& sceneId : project->sceneIds) {
            auto scene = store_.scene(sceneId);
            if (scene && scene->status != SceneStatus::Completed) {
                return rejected(PreconditionError::SceneNotReady, "Scene " + sceneId + " is not rendered yet");
            }
        }

        Job job = store_.createJob(JobKind::ExportCombine, std::nullopt, projectId);
        return launch(std::move(job), [this, projectId](const Job& job) {
            setPhase(job.id, "Combining scenes", 10);

            auto current = store_.project(projectId);
            if (!current) {
                failJob(job.id, "Project not found");
                return;
            }

            CombineResult combined = combiner_.combine(store_.scenesOf(projectId), projectId,
                                                       current->audioLocator);
            if (!combined) {
                failJob(job.id, combined.message);
                return;
            }
            completeJob(job.id, combined.videoLocator);
        });
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to submit export: " + std::string(e.what()));
        return rejected(PreconditionError::DispatchFailed, e.what());
    }
}

SubmitResult Orchestrator::submitRenderAll(const ProjectId& projectId) noexcept {
    try {
        auto project = store_.project(projectId);
        if (!project) {
            return rejected(PreconditionError::ProjectNotFound, "Project not found");
        }
        if (project->sceneIds.empty()) {
            return rejected(PreconditionError::NoScenes, "Project has no scenes to render");
        }
        for (const auto& sceneId : project->sceneIds) {
            auto scene = store_.scene(sceneId);
            if (scene && !scene->hasCode()) {
                const std::string& label = scene->prompt.empty() ? scene->id : scene->prompt;
                return rejected(PreconditionError::MissingCode, "Scene '" + label + "' has no code");
            }
        }

        Job job = store_.createJob(JobKind::RenderAllAndCombine, std::nullopt, projectId);
        return launch(std::move(job), [this, projectId](const Job& job) {
            std::vector<Scene> scenes = store_.scenesOf(projectId);
            const std::size_t total = scenes.size();
            if (total == 0) {
                failJob(job.id, "Project has no scenes to render");
                return;
            }

            // Phase 1: scenes in order, sharing the render budget
            for (std::size_t i = 0; i < total; ++i) {
                const std::string ordinal = std::to_string(i + 1);
                setPhase(job.id, "Rendering scene " + ordinal + "/" + std::to_string(total),
                         static_cast<int>(i * static_cast<std::size_t>(config_.renderBudget) / total));

                auto current = store_.scene(scenes[i].id);
                if (!current) {
                    failJob(job.id, "Failed to render scene " + ordinal + ": Scene not found");
                    return;
                }
                if (current->hasArtifact()) {
                    LOG_DEBUG("Scene " + current->id + " already rendered, skipping");
                    continue;
                }

                Outcome outcome = renderScene(*current);
                if (!outcome.ok) {
                    failJob(job.id, "Failed to render scene " + ordinal + ": " + outcome.message);
                    return;
                }
            }

            // Phase 2: combine
            setPhase(job.id, "Combining scenes", config_.combineProgress());

            auto current = store_.project(projectId);
            if (!current) {
                failJob(job.id, "Project not found");
                return;
            }

            CombineResult combined = combiner_.combine(store_.scenesOf(projectId), projectId,
                                                       current->audioLocator);
            if (!combined) {
                failJob(job.id, combined.message);
                return;
            }
            completeJob(job.id, combined.videoLocator);
        });
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to submit render-all: " + std::string(e.what()));
        return rejected(PreconditionError::DispatchFailed, e.what());
    }
}

SubmitResult Orchestrator::launch(Job job, std::function<void(const Job&)> body) noexcept {
    try {
        const JobId jobId = job.id;
        LOG_INFO("Job submitted: " + jobId + " (" + toString(job.kind) + ")");

        TaskHandle handle = dispatcher_.dispatch(jobId, [this, job, body](const CancelToken&) {
            try {
                body(job);
            } catch (const std::exception& e) {
                LOG_ERROR("Job " + job.id + " raised: " + std::string(e.what()));
                failJob(job.id, "Internal error: " + std::string(e.what()));
            } catch (...) {
                LOG_ERROR("Job " + job.id + " raised an unknown error");
                failJob(job.id, "Internal error");
            }
        });

        if (!handle.valid()) {
            failJob(jobId, "Failed to start job");
            return rejected(PreconditionError::DispatchFailed, "Failed to start job");
        }

        {
            std::lock_guard<std::mutex> lock(handlesMutex_);
            for (auto it = handles_.begin(); it != handles_.end();) {
                if (it->second.finished()) {
                    it = handles_.erase(it);
                } else {
                    ++it;
                }
            }
            handles_[jobId] = handle;
        }

        SubmitResult result;
        result.ok = true;
        result.job = std::move(job);
        result.handle = std::move(handle);
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to launch job: " + std::string(e.what()));
        return rejected(PreconditionError::DispatchFailed, e.what());
    }
}

Orchestrator::Outcome Orchestrator::renderScene(const Scene& scene) noexcept {
    Outcome outcome;
    try {
        const SceneId& sceneId = scene.id;
        store_.updateScene(sceneId, [](Scene& s) {
            s.status = SceneStatus::Rendering;
            s.error.reset();
        });

        auto markFailed = [this, &sceneId](const std::string& message) {
            store_.updateScene(sceneId, [&message](Scene& s) {
                s.status = SceneStatus::Failed;
                s.error = message;
            });
        };

        const std::string code = scene.code.value_or("");
        ValidationResult validation = validateCode(code);
        if (!validation) {
            LOG_WARN("Scene " + sceneId + " rejected by validator (" + toString(validation.error) + "): " +
                     validation.message);
            markFailed(validation.message);
            outcome.message = validation.message;
            return outcome;
        }

        RenderResult rendered = renderer_.render(code, sceneId);
        if (!rendered) {
            markFailed(rendered.message);
            outcome.message = rendered.message;
            return outcome;
        }

        bool applied = store_.updateScene(sceneId, [&rendered](Scene& s) {
            s.status = SceneStatus::Completed;
            s.videoLocator = rendered.videoLocator;
            s.thumbnailLocator = rendered.thumbnailLocator;
            s.durationSeconds = rendered.durationSeconds;
            s.error.reset();
        });
        if (!applied) {
            outcome.message = "Scene not found";
            return outcome;
        }

        outcome.ok = true;
        return outcome;
    } catch (const std::exception& e) {
        outcome.message = "Internal render error: " + std::string(e.what());
        return outcome;
    }
}

void Orchestrator::setPhase(const JobId& jobId, const std::string& label, int progress) noexcept {
    try {
        store_.updateJob(jobId, [&label, progress](Job& j) {
            j.status = JobStatus::Running;
            j.phaseLabel = label;
            j.progress = progress;
        });
        LOG_DEBUG("Job " + jobId + ": " + label + " (" + std::to_string(progress) + "%)");
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to update job " + jobId + ": " + std::string(e.what()));
    }
}

void Orchestrator::failJob(const JobId& jobId, const std::string& message) noexcept {
    try {
        store_.updateJob(jobId, [&message](Job& j) {
            j.status = JobStatus::Failed;
            j.phaseLabel = "failed";
            j.error = message;
        });
        LOG_ERROR("Job failed: " + jobId + " - " + message);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to record failure of job " + jobId + ": " + std::string(e.what()));
    }
}

void Orchestrator::completeJob(const JobId& jobId, const std::string& outputLocator) noexcept {
    try {
        store_.updateJob(jobId, [&outputLocator](Job& j) {
            j.status = JobStatus::Completed;
            j.phaseLabel = "completed";
            j.progress = 100;
            j.outputLocator = outputLocator;
        });
        LOG_INFO("Job completed: " + jobId + " -> " + outputLocator);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to record completion of job " + jobId + ": " + std::string(e.what()));
    }
}

std::string Orchestrator::generateCode(const std::string& prompt) const {
    if (!generator_) {
        throw std::runtime_error("No code generator configured");
    }
    return generator_(prompt);
}

SceneResult Orchestrator::createScene(const ProjectId& projectId, const std::string& prompt,
                                      const std::optional<std::string>& code) noexcept {
    try {
        if (!store_.project(projectId)) {
            return sceneRejected(PreconditionError::ProjectNotFound, "Project not found");
        }

        if (code && !code->empty()) {
            auto scene = store_.addScene(projectId, prompt, code, SceneStatus::Pending);
            if (!scene) {
                return sceneRejected(PreconditionError::ProjectNotFound, "Project not found");
            }
            SceneResult result;
            result.ok = true;
            result.message = "Scene created successfully";
            result.scene = *scene;
            return result;
        }

        auto scene = store_.addScene(projectId, prompt, std::nullopt, SceneStatus::Generating);
        if (!scene) {
            return sceneRejected(PreconditionError::ProjectNotFound, "Project not found");
        }

        // A generator failure still creates the scene, marked failed
        try {
            std::string generated = generateCode(prompt);
            store_.updateScene(scene->id, [&generated](Scene& s) {
                s.code = generated;
                s.status = SceneStatus::Pending;
            });
        } catch (const std::exception& e) {
            LOG_WARN("Code generation failed for scene " + scene->id + ": " + e.what());
            const std::string message = e.what();
            store_.updateScene(scene->id, [&message](Scene& s) {
                s.status = SceneStatus::Failed;
                s.error = message;
            });
        }

        SceneResult result;
        result.ok = true;
        result.message = "Scene created successfully";
        result.scene = store_.scene(scene->id).value_or(*scene);
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create scene: " + std::string(e.what()));
        return sceneRejected(PreconditionError::DispatchFailed, e.what());
    }
}

SceneResult Orchestrator::regenerateScene(const SceneId& sceneId, const std::optional<std::string>& prompt) noexcept {
    try {
        auto scene = store_.scene(sceneId);
        if (!scene) {
            return sceneRejected(PreconditionError::SceneNotFound, "Scene not found");
        }
        const std::string nextPrompt = (prompt && !prompt->empty()) ? *prompt : scene->prompt;

        store_.updateScene(sceneId, [](Scene& s) { s.status = SceneStatus::Generating; });

        try {
            std::string generated = generateCode(nextPrompt);
            store_.updateScene(sceneId, [&generated, &nextPrompt](Scene& s) {
                s.code = generated;
                s.prompt = nextPrompt;
                s.status = SceneStatus::Pending;
                s.videoLocator.reset();
                s.thumbnailLocator.reset();
                s.durationSeconds = 0.0;
                s.error.reset();
            });
            LOG_INFO("Scene regenerated: " + sceneId);
        } catch (const std::exception& e) {
            LOG_WARN("Code generation failed for scene " + sceneId + ": " + e.what());
            const std::string message = e.what();
            store_.updateScene(sceneId, [&message](Scene& s) {
                s.status = SceneStatus::Failed;
                s.error = message;
            });
        }

        SceneResult result;
        result.ok = true;
        result.message = "Scene regenerated successfully";
        result.scene = store_.scene(sceneId).value_or(*scene);
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to regenerate scene: " + std::string(e.what()));
        return sceneRejected(PreconditionError::DispatchFailed, e.what());
    }
}

const char* toString(PreconditionError error) noexcept {
    switch (error) {
        case PreconditionError::None: return "none";
        case PreconditionError::SceneNotFound: return "scene-not-found";
        case PreconditionError::ProjectNotFound: return "project-not-found";
        case PreconditionError::MissingCode: return "missing-code";
        case PreconditionError::NoScenes: return "no-scenes";
        case PreconditionError::SceneNotReady: return "scene-not-ready";
        case PreconditionError::DispatchFailed: return "dispatch-failed";
        default: return "unknown";
    }
}

}
