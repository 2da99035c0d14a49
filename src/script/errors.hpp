#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "script/value.hpp"

namespace codeact::script {

// Lexer or parser failure.
class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& message, int line)
        : std::runtime_error(message), line_(line) {}

    int line() const { return line_; }

private:
    int line_ = 0;
};

// An import that the capability policy refused. Guest code cannot catch it.
class CapabilityError : public std::runtime_error {
public:
    CapabilityError(std::string name, const std::string& message)
        : std::runtime_error(message), name_(std::move(name)) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

// Raised by the restricting transformer; carries one "Line N: ..." entry
// per rejected construct.
class SyntaxRejection : public std::runtime_error {
public:
    explicit SyntaxRejection(std::vector<std::string> errors);

    const std::vector<std::string>& errors() const { return errors_; }

private:
    std::vector<std::string> errors_;
};

struct TraceEntry {
    std::string where;
    int line = 0;
};

// A guest-level exception. `exception` is the guest exception instance.
class ScriptException : public std::runtime_error {
public:
    explicit ScriptException(Value exception);

    const Value& exception() const { return exception_; }
    const std::vector<TraceEntry>& trace() const { return trace_; }
    bool has_trace() const { return has_trace_; }
    void set_trace(std::vector<TraceEntry> trace) {
        trace_ = std::move(trace);
        has_trace_ = true;
    }

    // "Type: message" of the guest exception.
    std::string Describe() const;
    // Full "Traceback (most recent call last):" rendering.
    std::string Format() const;

private:
    Value exception_;
    std::vector<TraceEntry> trace_;
    bool has_trace_ = false;
};

// Raises a guest exception of the named built-in class.
[[noreturn]] void ThrowError(const std::string& type_name, const std::string& message);

}  // namespace codeact::script
