/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "clipforge/validator.hpp"
#include "clipforge/source.hpp"
#include "clipforge/logger.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <utility>

namespace clipforge {

namespace {

constexpr const char* kEngineModule = "manim";
constexpr const char* kSceneBase = "Scene";
constexpr const char* kEntryMethod = "construct";

struct CompiledPattern {
    std::string source;
    std::regex regex;
};

const std::vector<CompiledPattern>& compiledPatterns() {
    static const std::vector<CompiledPattern> compiled = [] {
        std::vector<CompiledPattern> out;
        for (const auto& pattern : dangerousPatterns()) {
            out.push_back({pattern, std::regex(pattern, std::regex::ECMAScript)});
        }
        return out;
    }();
    return compiled;
}

bool isBlank(const std::string& code) {
    return std::all_of(code.begin(), code.end(),
        [](unsigned char c) { return std::isspace(c) != 0; });
}

std::vector<std::string> scanDangerous(const std::string& code) {
    std::vector<std::string> found;
    for (const auto& pattern : compiledPatterns()) {
        if (std::regex_search(code, pattern.regex)) {
            found.push_back(pattern.source);
        }
    }
    return found;
}

std::string joinPatterns(const std::vector<std::string>& patterns) {
    std::string joined;
    for (const auto& p : patterns) {
        if (!joined.empty()) joined += ", ";
        joined += p;
    }
    return joined;
}

ValidationResult fail(ValidationError error, std::string message) {
    ValidationResult result;
    result.ok = false;
    result.error = error;
    result.message = std::move(message);
    return result;
}

ValidationResult checkStructure(const SourceTree& tree) {
    bool hasEngineImport = false;
    bool hasSceneClass = false;
    bool hasConstruct = false;
    std::string firstSceneClass;
    std::string entryClass;

    walk(tree, [&](const Statement& stmt) {
        if (stmt.kind == StatementKind::Import || stmt.kind == StatementKind::FromImport) {
            for (const auto& module : stmt.modules) {
                if (module == kEngineModule) hasEngineImport = true;
            }
            return;
        }
        if (stmt.kind != StatementKind::ClassDef) return;
        if (std::find(stmt.bases.begin(), stmt.bases.end(), kSceneBase) == stmt.bases.end()) return;

        hasSceneClass = true;
        if (firstSceneClass.empty()) firstSceneClass = stmt.name;
        for (const auto& member : stmt.body) {
            if (member.kind == StatementKind::FunctionDef && !member.isAsync && member.name == kEntryMethod) {
                hasConstruct = true;
                if (entryClass.empty()) entryClass = stmt.name;
                break;
            }
        }
    });

    if (!hasEngineImport) {
        auto result = fail(ValidationError::StructureInvalid,
                           "Code must import from manim (e.g., 'from manim import *')");
        result.missing = MissingElement::EngineImport;
        return result;
    }
    if (!hasSceneClass) {
        auto result = fail(ValidationError::StructureInvalid,
                           "Code must define a class that inherits from Scene");
        result.missing = MissingElement::SceneClass;
        return result;
    }
    if (!hasConstruct) {
        auto result = fail(ValidationError::StructureInvalid,
                           "Scene class '" + firstSceneClass + "' must have a construct method");
        result.missing = MissingElement::ConstructMethod;
        return result;
    }

    ValidationResult result;
    result.ok = true;
    result.sceneClass = entryClass;
    return result;
}

}

const std::vector<std::string>& dangerousPatterns() noexcept {
    static const std::vector<std::string> patterns = {
        // filesystem / interpreter / process access
        R"(\bos\.)",
        R"(\bsys\.)",
        R"(\bsubprocess\.)",
        R"(\bopen\s*\()",
        // dynamic evaluation
        R"(\beval\s*\()",
        R"(\bexec\s*\()",
        R"(\bcompile\s*\()",
        R"(\b__import__\s*\()",
        R"(\bimport\s+os\b)",
        R"(\bimport\s+sys\b)",
        R"(\bimport\s+subprocess\b)",
        R"(\bfrom\s+os\b)",
        R"(\bfrom\s+sys\b)",
        R"(\bfrom\s+subprocess\b)",
        R"(\bshutil\.)",
        // network
        R"(\brequests\.)",
        R"(\burllib\.)",
        R"(\bsocket\.)",
        // deserialization
        R"(\bpickle\.)",
    };
    return patterns;
}

ValidationResult validateCode(const std::string& code) noexcept {
    try {
        if (code.empty() || isBlank(code)) {
            return fail(ValidationError::EmptyCode, "Code is empty");
        }

        ParseResult parsed = parseSource(code);
        if (!parsed) {
            auto result = fail(ValidationError::SyntaxInvalid,
                               "Syntax error at line " + std::to_string(parsed.line) + ": " + parsed.message);
            result.line = parsed.line;
            return result;
        }

        std::vector<std::string> found = scanDangerous(code);
        if (!found.empty()) {
            auto result = fail(ValidationError::UnsafeConstruct,
                               "Code contains dangerous patterns: " + joinPatterns(found));
            result.patterns = std::move(found);
            return result;
        }

        return checkStructure(parsed.tree);
    } catch (const std::exception& e) {
        LOG_ERROR("Validator internal error: " + std::string(e.what()));
        return fail(ValidationError::SyntaxInvalid, "Error analyzing code structure: " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR("Validator unknown internal error");
        return fail(ValidationError::SyntaxInvalid, "Error analyzing code structure");
    }
}

const char* toString(ValidationError error) noexcept {
    switch (error) {
        case ValidationError::None: return "none";
        case ValidationError::EmptyCode: return "empty-code";
        case ValidationError::SyntaxInvalid: return "syntax-invalid";
        case ValidationError::UnsafeConstruct: return "unsafe-construct";
        case ValidationError::StructureInvalid: return "structure-invalid";
        default: return "unknown";
    }
}

}
