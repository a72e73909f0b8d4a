#pragma once
#include <string>
#include <vector>
#include <optional>

enum class Op { Click, RightClick, DoubleClick, Drag, Write, Remember, Recall, Help };

struct Literal {
    enum Type { Number, String };
    Type type = Number;
    double num = 0.0;
    std::string str;
};

// One parsed `name(arg, ...)` line. `name` is the callee as written
// (possibly dotted), `op` is resolved from its last component.
struct Invocation {
    Op op = Op::Click;
    std::string name;
    std::vector<Literal> args;
};

const char* op_name(Op op);
std::optional<Op> op_from_name(const std::string& name);
// "click, right_click, double_click, drag, write, remember, recall, help"
std::string operation_list();

// Parses a single line against the closed invocation grammar. Returns
// nullopt for anything that is not exactly one call with literal arguments
// to a known operation; `why` receives a short reason when non-null.
std::optional<Invocation> parse_invocation(const std::string& line, std::string* why = nullptr);

// Collects the distinct trimmed lines of `raw` that parse as invocations.
// Contents of ``` fences are scanned ahead of the full text. Never throws.
std::vector<std::string> extract_invocations(const std::string& raw);
