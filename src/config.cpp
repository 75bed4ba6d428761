/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "clipforge/config.hpp"
#include "clipforge/logger.hpp"
#include <cstdlib>

namespace clipforge {

namespace {
std::string env_string(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    return val;
}

int env_int(const char* name, int defv, int minv, int maxv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        std::size_t used = 0;
        int parsed = std::stoi(val, &used);
        if (used != std::string(val).size() || parsed < minv || parsed > maxv) {
            LOG_WARN(std::string("Ignoring out-of-range ") + name + "=" + val);
            return defv;
        }
        return parsed;
    } catch (...) {
        LOG_WARN(std::string("Ignoring malformed ") + name + "=" + val);
        return defv;
    }
}

double env_double(const char* name, double defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        std::size_t used = 0;
        double parsed = std::stod(val, &used);
        if (used != std::string(val).size() || !(parsed > 0.0)) {
            LOG_WARN(std::string("Ignoring out-of-range ") + name + "=" + val);
            return defv;
        }
        return parsed;
    } catch (...) {
        LOG_WARN(std::string("Ignoring malformed ") + name + "=" + val);
        return defv;
    }
}
}

Config Config::fromEnv() {
    Config config;
    config.outputDir = env_string("CLIPFORGE_OUTPUT_DIR", config.outputDir.string());
    config.uploadDir = env_string("CLIPFORGE_UPLOAD_DIR", config.uploadDir.string());
    config.engineBinary = env_string("CLIPFORGE_ENGINE", config.engineBinary);
    config.ffmpegBinary = env_string("CLIPFORGE_FFMPEG", config.ffmpegBinary);
    config.ffprobeBinary = env_string("CLIPFORGE_FFPROBE", config.ffprobeBinary);
    config.entryClass = env_string("CLIPFORGE_ENTRY_CLASS", config.entryClass);
    config.renderBudget = env_int("CLIPFORGE_RENDER_BUDGET", config.renderBudget, 1, 99);
    config.fallbackDuration = env_double("CLIPFORGE_FALLBACK_DURATION", config.fallbackDuration);
    return config;
}

}
