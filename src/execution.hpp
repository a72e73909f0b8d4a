#pragma once
#include "invocation.hpp"
#include <string>
#include <vector>
#include <stdexcept>

enum class ExecMode { Disabled, Logical, Effectful };

// Type, range or name problem with a single invocation.
class ValidationError : public std::runtime_error {
public:
    enum Kind { Type, Range, Name, Syntax };
    ValidationError(Kind k, const std::string& msg): std::runtime_error(msg), kind_(k) {}
    Kind kind() const { return kind_; }
    const char* kind_name() const;
private:
    Kind kind_;
};

// A validated invocation with normalized arguments.
struct Action {
    Op op = Op::Click;
    int coords[4] = {0, 0, 0, 0};
    int ncoords = 0;
    std::string text;
    std::string canonical;
};

// Throws ValidationError.
Action validate(const Invocation& inv);
std::string canonical_form(const Action& a);

// Per-turn audit trail. One context per turn; nothing is shared between turns.
struct ExecutionContext {
    ExecMode mode = ExecMode::Logical;
    std::string run_dir;
    std::vector<std::string> executed;
    std::vector<std::string> ignored;
    std::vector<std::string> errors;
    // Text returned by recall()/help(), in call order.
    std::vector<std::string> outputs;
};

// Performs pointer and keyboard actions on the real desktop.
class InputInjector {
public:
    virtual ~InputInjector() = default;
    // Throws std::runtime_error when the OS rejects the input.
    virtual void perform(const Action& a) = 0;
};

class ExecutionRegistry {
public:
    // `injector` is only used in effectful mode and may be null otherwise.
    explicit ExecutionRegistry(InputInjector* injector = nullptr);

    void run(const std::vector<std::string>& lines, ExecutionContext& ctx) const;
    void run_one(const std::string& line, ExecutionContext& ctx) const;

private:
    InputInjector* injector_;
};

std::string help_text(const std::string& name = "");
// Appends a usage hint to an "<Kind>: message" error string.
std::string with_hint(const std::string& err);
