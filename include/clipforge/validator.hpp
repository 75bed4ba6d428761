/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace clipforge {

enum class ValidationError : uint8_t {
    None = 0,
    EmptyCode,
    SyntaxInvalid,
    UnsafeConstruct,
    StructureInvalid
};

// Which part of the required scene shape is absent.
enum class MissingElement : uint8_t {
    None = 0,
    EngineImport,
    SceneClass,
    ConstructMethod
};

struct ValidationResult {
    bool ok = false;
    ValidationError error = ValidationError::None;
    std::string message;
    int line = 0;                          // SyntaxInvalid only
    std::vector<std::string> patterns;     // UnsafeConstruct: every matched pattern
    MissingElement missing = MissingElement::None;
    std::string sceneClass;                // entry class found on success
    explicit operator bool() const noexcept { return ok; }
};

// Gate applied to generated scene code before it is ever executed.
// Checks run in order and stop at the first failure:
//   1. empty / whitespace-only
//   2. syntax (parseSource)
//   3. denylisted capabilities in the raw text
//   4. engine import, Scene subclass, construct() method
// Pure: no I/O, nothing is executed.
[[nodiscard]] ValidationResult validateCode(const std::string& code) noexcept;

// The denylist scanned in step 3, as regular expressions.
[[nodiscard]] const std::vector<std::string>& dangerousPatterns() noexcept;

[[nodiscard]] const char* toString(ValidationError error) noexcept;

}
