#include "execution.hpp"
#include "note_store.hpp"
#include "mark_store.hpp"
#include "util.hpp"
#include "log.hpp"
#include <cmath>

const char* ValidationError::kind_name() const {
    switch (kind_) {
        case Type: return "TypeError";
        case Range: return "ValueError";
        case Name: return "NameError";
        case Syntax: return "SyntaxError";
    }
    return "Error";
}

static std::string fmt_number(double v){
    char buf[32];
    snprintf(buf, sizeof(buf), "%g", v);
    return buf;
}

static int coord(const Literal& a, const char* name){
    if (a.type != Literal::Number)
        throw ValidationError(ValidationError::Type, std::string(name) + " must be a number, got str");
    if (a.num != std::floor(a.num) || a.num < 0 || a.num > 1000)
        throw ValidationError(ValidationError::Range,
            std::string(name) + "=" + fmt_number(a.num) + " outside valid range 0-1000");
    return (int)a.num;
}

static const std::string& text_arg(const Invocation& inv){
    if (inv.args.size() != 1)
        throw ValidationError(ValidationError::Type, std::string(op_name(inv.op)) +
            "() takes 1 argument (" + std::to_string(inv.args.size()) + " given)");
    if (inv.args[0].type != Literal::String)
        throw ValidationError(ValidationError::Type, std::string(op_name(inv.op)) + "() requires str, got number");
    return inv.args[0].str;
}

static void expect_args(const Invocation& inv, size_t n){
    if (inv.args.size() != n)
        throw ValidationError(ValidationError::Type, std::string(op_name(inv.op)) + "() takes " +
            std::to_string(n) + " argument" + (n == 1 ? "" : "s") + " (" + std::to_string(inv.args.size()) + " given)");
}

Action validate(const Invocation& inv){
    static const char* point_names[] = {"x", "y"};
    static const char* drag_names[] = {"x1", "y1", "x2", "y2"};
    Action a;
    a.op = inv.op;
    switch (inv.op) {
        case Op::Click:
        case Op::RightClick:
        case Op::DoubleClick:
            expect_args(inv, 2);
            for (int i=0;i<2;i++) a.coords[i] = coord(inv.args[i], point_names[i]);
            a.ncoords = 2;
            break;
        case Op::Drag:
            expect_args(inv, 4);
            for (int i=0;i<4;i++) a.coords[i] = coord(inv.args[i], drag_names[i]);
            a.ncoords = 4;
            break;
        case Op::Write:
        case Op::Remember:
            a.text = text_arg(inv);
            break;
        case Op::Recall:
            expect_args(inv, 0);
            break;
        case Op::Help:
            if (inv.args.size() > 1) expect_args(inv, 1);
            if (!inv.args.empty()) {
                if (inv.args[0].type != Literal::String)
                    throw ValidationError(ValidationError::Type, "help() requires an operation name");
                a.text = inv.args[0].str;
            }
            break;
    }
    a.canonical = canonical_form(a);
    return a;
}

std::string canonical_form(const Action& a){
    std::string s = op_name(a.op);
    s += "(";
    switch (a.op) {
        case Op::Write:
        case Op::Remember:
            s += "\"" + escape_json(a.text) + "\"";
            break;
        case Op::Help:
            if (!a.text.empty()) s += "\"" + escape_json(a.text) + "\"";
            break;
        default:
            for (int i=0;i<a.ncoords;i++){
                if (i) s += ", ";
                s += std::to_string(a.coords[i]);
            }
    }
    s += ")";
    return s;
}

struct OpHelp { Op op; const char* usage; };

static const OpHelp kHelp[] = {
    {Op::Click, "click(x, y) -- Left-click at (x, y). Coordinates 0-1000."},
    {Op::RightClick, "right_click(x, y) -- Right-click at (x, y). Coordinates 0-1000."},
    {Op::DoubleClick, "double_click(x, y) -- Double-click at (x, y). Coordinates 0-1000."},
    {Op::Drag, "drag(x1, y1, x2, y2) -- Drag from (x1,y1) to (x2,y2). Coordinates 0-1000."},
    {Op::Write, "write(text) -- Type text at current cursor position."},
    {Op::Remember, "remember(text) -- Store a learning for future turns and sessions."},
    {Op::Recall, "recall() -- Read all stored learnings. Returns a string."},
    {Op::Help, "help() -- List functions. help(\"fn\") -- Show help for fn."},
};

std::string help_text(const std::string& name){
    std::string out;
    auto op = op_from_name(name);
    for (const auto& h : kHelp){
        if (!name.empty() && op && h.op != *op) continue;
        if (!out.empty()) out += "\n";
        out += h.usage;
    }
    return out;
}

std::string with_hint(const std::string& err){
    if (err.rfind("NameError", 0) == 0)
        return err + "\n  (Available: " + operation_list() + ". No imports.)";
    if (err.rfind("ValueError", 0) == 0 && err.find("1000") != std::string::npos)
        return err + "\n  (Coordinates: integers 0-1000)";
    if (err.rfind("TypeError", 0) == 0)
        return err + "\n  (Use help(fn) for signature)";
    return err;
}

ExecutionRegistry::ExecutionRegistry(InputInjector* injector): injector_(injector) {}

void ExecutionRegistry::run(const std::vector<std::string>& lines, ExecutionContext& ctx) const {
    for (const auto& line : lines) run_one(line, ctx);
}

void ExecutionRegistry::run_one(const std::string& line, ExecutionContext& ctx) const {
    Action a;
    try {
        std::string why;
        auto inv = parse_invocation(line, &why);
        if (!inv) {
            if (why.rfind("unknown operation", 0) == 0)
                throw ValidationError(ValidationError::Name, why);
            throw ValidationError(ValidationError::Syntax, why);
        }
        a = validate(*inv);
    } catch (const ValidationError& e) {
        std::string err = std::string(e.kind_name()) + ": " + e.what();
        ctx.errors.push_back(err);
        log_msg("execute", "Execution error on '%.80s': %s", line.c_str(), err.c_str());
        return;
    }

    // help() is a query, not an action: answered in every mode, never recorded.
    if (a.op == Op::Help) {
        ctx.outputs.push_back(help_text(a.text));
        return;
    }
    if (ctx.mode == ExecMode::Disabled) {
        ctx.ignored.push_back(a.canonical);
        return;
    }
    ctx.executed.push_back(a.canonical);

    RunFiles files = RunFiles::in(ctx.run_dir);
    switch (a.op) {
        case Op::Remember:
            if (!NoteStore(files.memory).append(a.text))
                ctx.errors.push_back("OSError: could not write " + files.memory);
            return;
        case Op::Recall:
            ctx.outputs.push_back(NoteStore(files.memory).recall());
            return;
        default:
            break;
    }
    if (ctx.mode != ExecMode::Effectful) return;
    if (!injector_) {
        ctx.errors.push_back("OSError: no input injector available");
        return;
    }
    try {
        injector_->perform(a);
    } catch (const std::runtime_error& e) {
        std::string err = std::string("OSError: ") + e.what();
        ctx.errors.push_back(err);
        log_msg("execute", "Input injection failed for '%s': %s", a.canonical.c_str(), e.what());
    }
}
