#include <catch2/catch_test_macros.hpp>
#include "execution.hpp"
#include "note_store.hpp"
#include "test_support.hpp"
#include <stdexcept>

namespace {

class RecordingInjector : public InputInjector {
public:
    void perform(const Action& a) override {
        if (fail) throw std::runtime_error("device gone");
        performed.push_back(a.canonical);
    }
    std::vector<std::string> performed;
    bool fail = false;
};

ExecutionContext context(ExecMode mode, const std::string& run_dir) {
    ExecutionContext ctx;
    ctx.mode = mode;
    ctx.run_dir = run_dir;
    return ctx;
}

}  // namespace

TEST_CASE("Coordinates on the boundary are accepted", "[execution]") {
    TempDir dir;
    auto ctx = context(ExecMode::Logical, dir.path());
    ExecutionRegistry reg;
    reg.run({"click(0, 0)", "click(1000, 1000)", "drag(0, 1000, 1000, 0)"}, ctx);
    REQUIRE(ctx.errors.empty());
    REQUIRE(ctx.executed.size() == 3);
    CHECK(ctx.executed[0] == "click(0, 0)");
    CHECK(ctx.executed[1] == "click(1000, 1000)");
    CHECK(ctx.executed[2] == "drag(0, 1000, 1000, 0)");
}

TEST_CASE("Out of range click is rejected with a range error", "[execution]") {
    TempDir dir;
    auto ctx = context(ExecMode::Logical, dir.path());
    ExecutionRegistry().run({"click(2000, 500)"}, ctx);
    CHECK(ctx.executed.empty());
    REQUIRE(ctx.errors.size() == 1);
    CHECK(ctx.errors[0] == "ValueError: x=2000 outside valid range 0-1000");
    CHECK(with_hint(ctx.errors[0]).find("(Coordinates: integers 0-1000)") != std::string::npos);
}

TEST_CASE("Negative and fractional coordinates are range errors", "[execution]") {
    TempDir dir;
    auto ctx = context(ExecMode::Logical, dir.path());
    ExecutionRegistry().run({"click(-1, 5)", "right_click(5, 12.5)"}, ctx);
    CHECK(ctx.executed.empty());
    REQUIRE(ctx.errors.size() == 2);
    CHECK(ctx.errors[0].rfind("ValueError: x=-1", 0) == 0);
    CHECK(ctx.errors[1].rfind("ValueError: y=12.5", 0) == 0);
}

TEST_CASE("Type and arity problems are type errors", "[execution]") {
    TempDir dir;
    auto ctx = context(ExecMode::Logical, dir.path());
    ExecutionRegistry().run({"click('a', 5)", "write(42)", "drag(1, 2, 3)", "recall(1)"}, ctx);
    CHECK(ctx.executed.empty());
    REQUIRE(ctx.errors.size() == 4);
    for (const auto& e : ctx.errors) {
        INFO(e);
        CHECK(e.rfind("TypeError: ", 0) == 0);
        CHECK(with_hint(e).find("(Use help(fn) for signature)") != std::string::npos);
    }
}

TEST_CASE("Unknown operation is a name error with the operation list", "[execution]") {
    TempDir dir;
    auto ctx = context(ExecMode::Logical, dir.path());
    ExecutionRegistry().run_one("scroll(1, 2)", ctx);
    REQUIRE(ctx.errors.size() == 1);
    CHECK(ctx.errors[0].rfind("NameError: ", 0) == 0);
    CHECK(with_hint(ctx.errors[0]).find("(Available: click, right_click") != std::string::npos);
}

TEST_CASE("Canonical forms normalize spacing and quoting", "[execution]") {
    TempDir dir;
    auto ctx = context(ExecMode::Logical, dir.path());
    ExecutionRegistry().run({"click(500,500)", "double_click( 7 ,8 )", "write('say \"hi\"')",
                             "tools.right_click(1.0, 2)"}, ctx);
    REQUIRE(ctx.executed.size() == 4);
    CHECK(ctx.executed[0] == "click(500, 500)");
    CHECK(ctx.executed[1] == "double_click(7, 8)");
    CHECK(ctx.executed[2] == "write(\"say \\\"hi\\\"\")");
    CHECK(ctx.executed[3] == "right_click(1, 2)");
}

TEST_CASE("Canonical form parses back to the same action", "[execution]") {
    const char* lines[] = {"drag(10, 20, 30, 40)", "write('a\\nb')", "remember(\"x\")", "recall()"};
    for (const char* line : lines) {
        INFO(line);
        Action a = validate(*parse_invocation(line));
        auto again = parse_invocation(a.canonical);
        REQUIRE(again.has_value());
        CHECK(validate(*again).canonical == a.canonical);
    }
}

TEST_CASE("Disabled mode records everything as ignored", "[execution]") {
    TempDir dir;
    auto ctx = context(ExecMode::Disabled, dir.path());
    ExecutionRegistry().run({"click(1, 2)", "remember('note')", "recall()"}, ctx);
    CHECK(ctx.executed.empty());
    REQUIRE(ctx.ignored.size() == 3);
    CHECK(ctx.ignored[0] == "click(1, 2)");
    CHECK(ctx.ignored[1] == "remember(\"note\")");
    CHECK(ctx.outputs.empty());
    CHECK(NoteStore(dir.file("memory.json")).load().empty());
}

TEST_CASE("Logical mode never touches the injector", "[execution]") {
    TempDir dir;
    RecordingInjector inj;
    auto ctx = context(ExecMode::Logical, dir.path());
    ExecutionRegistry(&inj).run({"click(1, 2)", "write('x')"}, ctx);
    CHECK(ctx.executed.size() == 2);
    CHECK(inj.performed.empty());
}

TEST_CASE("Effectful mode performs input actions through the injector", "[execution]") {
    TempDir dir;
    RecordingInjector inj;
    auto ctx = context(ExecMode::Effectful, dir.path());
    ExecutionRegistry(&inj).run({"click(1, 2)", "remember('n')", "write('x')"}, ctx);
    CHECK(ctx.executed.size() == 3);
    REQUIRE(inj.performed.size() == 2);
    CHECK(inj.performed[0] == "click(1, 2)");
    CHECK(inj.performed[1] == "write(\"x\")");
}

TEST_CASE("Injector failure becomes an OSError entry", "[execution]") {
    TempDir dir;
    RecordingInjector inj;
    inj.fail = true;
    auto ctx = context(ExecMode::Effectful, dir.path());
    ExecutionRegistry(&inj).run_one("click(1, 2)", ctx);
    CHECK(ctx.executed.size() == 1);
    REQUIRE(ctx.errors.size() == 1);
    CHECK(ctx.errors[0] == "OSError: device gone");
}

TEST_CASE("remember then recall within and across turns", "[execution]") {
    TempDir dir;
    {
        auto ctx = context(ExecMode::Logical, dir.path());
        ExecutionRegistry().run({"recall()", "remember('the button is blue')", "recall()"}, ctx);
        REQUIRE(ctx.outputs.size() == 2);
        CHECK(ctx.outputs[0] == "(no memories yet)");
        CHECK(ctx.outputs[1] == "- the button is blue");
    }
    {
        auto ctx = context(ExecMode::Logical, dir.path());
        ExecutionRegistry().run({"remember('second')", "recall()"}, ctx);
        REQUIRE(ctx.outputs.size() == 1);
        CHECK(ctx.outputs[0] == "- the button is blue\n- second");
    }
}

TEST_CASE("help answers in every mode without being recorded", "[execution]") {
    TempDir dir;
    for (ExecMode mode : {ExecMode::Disabled, ExecMode::Logical}) {
        auto ctx = context(mode, dir.path());
        ExecutionRegistry().run({"help()", "help('drag')"}, ctx);
        CHECK(ctx.executed.empty());
        CHECK(ctx.ignored.empty());
        REQUIRE(ctx.outputs.size() == 2);
        CHECK(ctx.outputs[0].find("click(x, y)") != std::string::npos);
        CHECK(ctx.outputs[0].find("recall()") != std::string::npos);
        CHECK(ctx.outputs[1] == "drag(x1, y1, x2, y2) -- Drag from (x1,y1) to (x2,y2). Coordinates 0-1000.");
    }
}

TEST_CASE("One bad line does not stop the rest", "[execution]") {
    TempDir dir;
    auto ctx = context(ExecMode::Logical, dir.path());
    ExecutionRegistry().run({"click(1, 2)", "click(5000, 0)", "click(3, 4)"}, ctx);
    CHECK(ctx.executed.size() == 2);
    CHECK(ctx.errors.size() == 1);
}
