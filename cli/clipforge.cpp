/*
 * clipforge - Render tool (clipforge)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "clipforge/artifacts.hpp"
#include "clipforge/combine.hpp"
#include "clipforge/config.hpp"
#include "clipforge/logger.hpp"
#include "clipforge/orchestrator.hpp"
#include "clipforge/render.hpp"
#include "clipforge/store.hpp"
#include "clipforge/validator.hpp"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace clipforge;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "clipforge Render Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " validate <script.py>...\n";
    std::cout << "       " << progName << " render [--audio <file>] [--output-dir <dir>] <script.py>...\n";
    std::cout << "       " << progName << " scene [--output-dir <dir>] <script.py>\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Commands:\n";
    std::cout << "  validate      Check scene scripts without running them\n";
    std::cout << "  render        Render every script in order and combine into one video\n";
    std::cout << "  scene         Render a single script\n\n";
    std::cout << "Options:\n";
    std::cout << "  --audio <file>       Audio track muxed onto the combined video\n";
    std::cout << "  --output-dir <dir>   Output store (overrides CLIPFORGE_OUTPUT_DIR)\n";
    std::cout << "  -h, --help           Show this help message\n";
    std::cout << "  -v, --version        Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  CLIPFORGE_OUTPUT_DIR          Output store (default: ./outputs)\n";
    std::cout << "  CLIPFORGE_UPLOAD_DIR          Upload store (default: ./uploads)\n";
    std::cout << "  CLIPFORGE_ENGINE              Render engine binary (default: manim)\n";
    std::cout << "  CLIPFORGE_FFMPEG              ffmpeg binary (default: ffmpeg)\n";
    std::cout << "  CLIPFORGE_FFPROBE             ffprobe binary (default: ffprobe)\n";
    std::cout << "  CLIPFORGE_ENTRY_CLASS         Scene class to render (default: GeneratedScene)\n";
    std::cout << "  CLIPFORGE_RENDER_BUDGET       Progress share of the render phase (default: 80)\n";
    std::cout << "  CLIPFORGE_FALLBACK_DURATION   Clip duration when probing fails (default: 5.0)\n";
    std::cout << "  CLIPFORGE_LOG_LEVEL           Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " validate intro.py outro.py\n";
    std::cout << "  " << progName << " render --audio voice.mp3 intro.py body.py outro.py\n";
}

std::optional<std::string> readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

int runValidate(const std::vector<std::string>& scripts) {
    int failures = 0;
    for (const auto& script : scripts) {
        auto code = readFile(script);
        if (!code) {
            std::cerr << "Error: Cannot read " << script << "\n";
            ++failures;
            continue;
        }
        ValidationResult result = validateCode(*code);
        if (result.ok) {
            std::cout << "OK " << script << " (" << result.sceneClass << ")\n";
        } else {
            std::cout << "FAIL " << script << " [" << toString(result.error) << "] " << result.message << "\n";
            ++failures;
        }
    }
    return failures == 0 ? 0 : 1;
}

// Polls the job record, printing each phase change, until it is terminal.
Job followJob(Orchestrator& orchestrator, const JobId& jobId) {
    std::string lastPhase;
    int lastProgress = -1;
    while (true) {
        auto job = orchestrator.job(jobId);
        if (!job) {
            throw std::runtime_error("Job disappeared: " + jobId);
        }
        if (job->phaseLabel != lastPhase || job->progress != lastProgress) {
            lastPhase = job->phaseLabel;
            lastProgress = job->progress;
            std::cout << "[" << std::setw(3) << job->progress << "%] " << job->phaseLabel << std::endl;
        }
        if (isTerminal(job->status)) {
            orchestrator.wait(jobId);
            return *job;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

int report(const Job& job, const ArtifactStore& artifacts) {
    if (job.status != JobStatus::Completed) {
        std::cerr << "Error: " << job.error.value_or("Job failed") << std::endl;
        return 1;
    }
    std::string locator = job.outputLocator.value_or("");
    std::cout << locator;
    if (auto path = artifacts.resolveOutput(locator)) {
        std::cout << " (" << path->string() << ")";
    }
    std::cout << std::endl;
    return 0;
}

int main(int argc, char* argv[]) {
    // Default to WARN so progress output stays readable; CLIPFORGE_LOG_LEVEL overrides
    if (!std::getenv("CLIPFORGE_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);
    else
        Logger::initFromEnv();

    // Handle --help and --version before anything else
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::optional<std::string> audioPath;
    std::optional<std::string> outputDir;
    std::vector<std::string> scripts;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--audio") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --audio requires a path\n";
                return 1;
            }
            audioPath = argv[++i];
        } else if (arg == "--output-dir") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --output-dir requires a path\n";
                return 1;
            }
            outputDir = argv[++i];
        } else {
            scripts.push_back(arg);
        }
    }

    if (scripts.empty()) {
        std::cerr << "Error: No scene scripts given\n";
        return 1;
    }

    if (command == "validate") {
        return runValidate(scripts);
    }
    if (command != "render" && command != "scene") {
        std::cerr << "Error: Unknown command '" << command << "'\n";
        printUsage(argv[0]);
        return 1;
    }
    if (command == "scene" && (scripts.size() != 1 || audioPath)) {
        std::cerr << "Error: scene takes exactly one script and no audio\n";
        return 1;
    }

    try {
        setThreadName("Main");

        Config config = Config::fromEnv();
        if (outputDir) {
            config.outputDir = *outputDir;
        }

        ArtifactStore artifacts(config.outputDir, config.uploadDir);
        EngineRenderer renderer(config, artifacts);
        MediaCombiner combiner(config, artifacts);
        Store store;
        Orchestrator orchestrator(store, renderer, combiner, config);

        Project project = store.createProject("clipforge", "Command line render");
        for (const auto& script : scripts) {
            auto code = readFile(script);
            if (!code) {
                std::cerr << "Error: Cannot read " << script << "\n";
                return 1;
            }
            SceneResult created = orchestrator.createScene(project.id,
                                                           std::filesystem::path(script).stem().string(), *code);
            if (!created) {
                std::cerr << "Error: " << created.message << std::endl;
                return 1;
            }
        }

        if (audioPath) {
            auto locator = artifacts.importUpload(*audioPath);
            if (!locator) {
                std::cerr << "Error: Cannot import audio " << *audioPath << "\n";
                return 1;
            }
            store.setProjectAudio(project.id, *locator);
        }

        SubmitResult submitted;
        if (command == "scene") {
            auto scenes = store.scenesOf(project.id);
            submitted = orchestrator.submitSceneRender(scenes.front().id);
        } else {
            submitted = orchestrator.submitRenderAll(project.id);
        }
        if (!submitted) {
            std::cerr << "Error: " << submitted.message << std::endl;
            return 1;
        }

        Job finished = followJob(orchestrator, submitted.job.id);
        return report(finished, artifacts);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (...) {
        std::cerr << "Error: Unknown error running render\n";
        return 1;
    }
}
