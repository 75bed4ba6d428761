/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

// Python.h must come before any standard header
#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include "clipforge/source.hpp"
#include "clipforge/logger.hpp"
#include <memory>
#include <stdexcept>

namespace clipforge {

namespace {

constexpr const char* kSourceName = "<scene>";

struct PyDecRef {
    void operator()(PyObject* object) const noexcept { Py_XDECREF(object); }
};
using PyRef = std::unique_ptr<PyObject, PyDecRef>;

// Holds the GIL for the calling thread. PyRefs must not outlive it.
class GilLock {
public:
    GilLock() : state_(PyGILState_Ensure()) {}
    ~GilLock() { PyGILState_Release(state_); }

    GilLock(const GilLock&) = delete;
    GilLock& operator=(const GilLock&) = delete;

private:
    PyGILState_STATE state_;
};

struct Interpreter {
    bool ready = false;
    std::string error;
};

// Isolated from PYTHON* variables and user site-packages; no signal handlers,
// since the process also forks the render tools.
const Interpreter& interpreter() {
    static const Interpreter instance = [] {
        Interpreter state;
        if (Py_IsInitialized()) {
            state.ready = true;
            return state;
        }

        PyConfig config;
        PyConfig_InitIsolatedConfig(&config);
        config.site_import = 0;
        config.install_signal_handlers = 0;
        config.write_bytecode = 0;
        PyStatus status = Py_InitializeFromConfig(&config);
        PyConfig_Clear(&config);
        if (PyStatus_Exception(status)) {
            state.error = status.err_msg ? status.err_msg : "initialization failed";
            LOG_ERROR("Python interpreter unavailable: " + state.error);
            return state;
        }

        // Initialization leaves the GIL with this thread; every parse takes it anew
        PyEval_SaveThread();
        state.ready = true;
        LOG_DEBUG(std::string("Python interpreter started: ") + Py_GetVersion());
        return state;
    }();
    return instance;
}

PyRef attribute(PyObject* object, const char* name) {
    PyRef value(PyObject_GetAttrString(object, name));
    if (!value) {
        PyErr_Clear();
    }
    return value;
}

std::string text(PyObject* object) {
    if (!object || !PyUnicode_Check(object)) {
        return {};
    }
    const char* utf8 = PyUnicode_AsUTF8(object);
    if (!utf8) {
        PyErr_Clear();
        return {};
    }
    return utf8;
}

long integer(PyObject* object, const char* name) {
    PyRef value = attribute(object, name);
    if (!value || !PyLong_Check(value.get())) {
        return 0;
    }
    long out = PyLong_AsLong(value.get());
    if (out == -1 && PyErr_Occurred()) {
        PyErr_Clear();
        return 0;
    }
    return out;
}

std::string typeName(PyObject* object) {
    PyRef name = attribute(reinterpret_cast<PyObject*>(Py_TYPE(object)), "__name__");
    return text(name.get());
}

// Name and Attribute chains as written; any other expression yields ""
std::string dottedName(PyObject* expr) {
    const std::string type = typeName(expr);
    if (type == "Name") {
        PyRef id = attribute(expr, "id");
        return text(id.get());
    }
    if (type == "Attribute") {
        PyRef value = attribute(expr, "value");
        PyRef attr = attribute(expr, "attr");
        std::string prefix = value ? dottedName(value.get()) : std::string();
        if (prefix.empty()) {
            return {};
        }
        return prefix + "." + text(attr.get());
    }
    return {};
}

template <typename Visit>
void forEachItem(PyObject* node, const char* field, Visit&& visit) {
    PyRef list = attribute(node, field);
    if (!list || !PyList_Check(list.get())) {
        return;
    }
    const Py_ssize_t size = PyList_Size(list.get());
    for (Py_ssize_t i = 0; i < size; ++i) {
        visit(PyList_GetItem(list.get(), i));
    }
}

struct CompoundKind {
    const char* type;
    const char* keyword;
    bool isAsync;
};

constexpr CompoundKind kCompounds[] = {
    {"If", "if", false},
    {"For", "for", false},
    {"AsyncFor", "for", true},
    {"While", "while", false},
    {"With", "with", false},
    {"AsyncWith", "with", true},
    {"Try", "try", false},
    {"TryStar", "try", false},
    {"Match", "match", false},
};

Statement convert(PyObject* node);

void appendBlock(PyObject* node, const char* field, std::vector<Statement>& out) {
    forEachItem(node, field, [&out](PyObject* child) { out.push_back(convert(child)); });
}

Statement convert(PyObject* node) {
    Statement stmt;
    stmt.line = static_cast<int>(integer(node, "lineno"));
    const std::string type = typeName(node);

    if (type == "Import") {
        stmt.kind = StatementKind::Import;
        forEachItem(node, "names", [&stmt](PyObject* alias) {
            PyRef name = attribute(alias, "name");
            stmt.modules.push_back(text(name.get()));
        });
        return stmt;
    }
    if (type == "ImportFrom") {
        // module is None for "from . import x"
        stmt.kind = StatementKind::FromImport;
        PyRef module = attribute(node, "module");
        std::string name(static_cast<std::size_t>(integer(node, "level")), '.');
        name += text(module.get());
        stmt.modules.push_back(name);
        return stmt;
    }
    if (type == "ClassDef") {
        stmt.kind = StatementKind::ClassDef;
        PyRef name = attribute(node, "name");
        stmt.name = text(name.get());
        forEachItem(node, "bases", [&stmt](PyObject* base) {
            std::string written = dottedName(base);
            if (!written.empty()) {
                stmt.bases.push_back(written);
            }
        });
        appendBlock(node, "body", stmt.body);
        return stmt;
    }
    if (type == "FunctionDef" || type == "AsyncFunctionDef") {
        stmt.kind = StatementKind::FunctionDef;
        stmt.isAsync = type == "AsyncFunctionDef";
        PyRef name = attribute(node, "name");
        stmt.name = text(name.get());
        appendBlock(node, "body", stmt.body);
        return stmt;
    }
    for (const auto& compound : kCompounds) {
        if (type != compound.type) {
            continue;
        }
        stmt.kind = StatementKind::Compound;
        stmt.keyword = compound.keyword;
        stmt.isAsync = compound.isAsync;
        appendBlock(node, "body", stmt.body);
        appendBlock(node, "orelse", stmt.body);
        forEachItem(node, "handlers", [&stmt](PyObject* handler) { appendBlock(handler, "body", stmt.body); });
        appendBlock(node, "finalbody", stmt.body);
        forEachItem(node, "cases", [&stmt](PyObject* matchCase) { appendBlock(matchCase, "body", stmt.body); });
        return stmt;
    }

    stmt.kind = StatementKind::Simple;
    return stmt;
}

// Turns the pending exception into a failed ParseResult
ParseResult failureFromError() {
    PyObject* type = nullptr;
    PyObject* value = nullptr;
    PyObject* traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);
    PyRef typeRef(type);
    PyRef valueRef(value);
    PyRef tracebackRef(traceback);

    ParseResult result;
    if (valueRef && PyErr_GivenExceptionMatches(typeRef.get(), PyExc_SyntaxError)) {
        PyRef msg = attribute(valueRef.get(), "msg");
        result.message = text(msg.get());
        result.line = static_cast<int>(integer(valueRef.get(), "lineno"));
    } else if (valueRef) {
        // Parser limits (MemoryError, RecursionError) rather than bad syntax
        PyRef detail(PyObject_Str(valueRef.get()));
        if (!detail) {
            PyErr_Clear();
        }
        result.message = typeName(valueRef.get());
        std::string extra = text(detail.get());
        if (!extra.empty()) {
            result.message += ": " + extra;
        }
    }
    if (result.message.empty()) {
        result.message = "invalid syntax";
    }
    return result;
}

void walkStatements(const std::vector<Statement>& statements,
                    const std::function<void(const Statement&)>& visit) {
    for (const auto& stmt : statements) {
        visit(stmt);
        walkStatements(stmt.body, visit);
    }
}

}

ParseResult parseSource(const std::string& code) {
    // The interpreter takes a C string; report what ast.parse would
    if (code.find('\0') != std::string::npos) {
        ParseResult result;
        result.message = "source code string cannot contain null bytes";
        return result;
    }

    const Interpreter& python = interpreter();
    if (!python.ready) {
        throw std::runtime_error("Python interpreter unavailable: " + python.error);
    }

    GilLock gil;
    PyCompilerFlags flags;
    flags.cf_flags = PyCF_ONLY_AST;
    flags.cf_feature_version = PY_MINOR_VERSION;
    PyRef module(Py_CompileStringExFlags(code.c_str(), kSourceName, Py_file_input, &flags, -1));
    if (!module) {
        return failureFromError();
    }

    ParseResult result;
    appendBlock(module.get(), "body", result.tree.statements);
    result.ok = true;
    return result;
}

void walk(const SourceTree& tree, const std::function<void(const Statement&)>& visit) {
    walkStatements(tree.statements, visit);
}

}
