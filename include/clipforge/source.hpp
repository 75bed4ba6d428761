/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace clipforge {

// Statement outline of a scene script. The script is parsed by the embedded
// Python interpreter (AST only, nothing is compiled to bytecode or run), and
// the statement tree is reduced to what the validator inspects: imports,
// classes with their bases, functions and nested blocks.

enum class StatementKind : std::uint8_t {
    Import,
    FromImport,
    ClassDef,
    FunctionDef,
    Compound,   // if / for / while / with / try / match
    Simple
};

struct Statement {
    StatementKind kind = StatementKind::Simple;
    int line = 0;
    bool isAsync = false;
    std::string keyword;                  // leading keyword of compound statements
    std::string name;                     // class or function name
    std::vector<std::string> bases;       // positional class bases as written ("Scene", "manim.Scene")
    std::vector<std::string> modules;     // imported modules; FromImport has exactly one, relative ones keep their dots
    std::vector<Statement> body;          // every nested block, branches and handlers included
};

struct SourceTree {
    std::vector<Statement> statements;
};

struct ParseResult {
    bool ok = false;
    SourceTree tree;
    int line = 0;             // 0 when the interpreter reports no line
    std::string message;      // the interpreter's SyntaxError text
    explicit operator bool() const noexcept { return ok; }
};

// Thread-safe. The interpreter is started on first use and kept for the
// life of the process.
[[nodiscard]] ParseResult parseSource(const std::string& code);

// Pre-order walk over every statement, nested bodies included.
void walk(const SourceTree& tree, const std::function<void(const Statement&)>& visit);

}
