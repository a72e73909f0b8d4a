#include <catch2/catch_test_macros.hpp>
#include "agent_loop.hpp"
#include "mark_store.hpp"
#include "util.hpp"
#include "test_support.hpp"
#include <memory>
#include <stdexcept>

namespace {

class ScriptedClient : public InferenceClient {
public:
    ScriptedClient(std::string reply, bool fail, std::vector<std::string>* log)
        : reply_(std::move(reply)), fail_(fail), log_(log) {}
    std::string complete(const std::string& story, const std::string& feedback,
                         const std::string& screenshot_b64) override {
        log_->push_back(story + "|" + feedback + "|" + screenshot_b64);
        if (fail_) throw std::runtime_error("connection refused");
        return reply_;
    }
private:
    std::string reply_;
    bool fail_;
    std::vector<std::string>* log_;
};

struct Harness {
    Harness() {
        REQUIRE(write_file_atomic(dir.file("config.json"),
            std::string(R"({"virtual_canvas": true, "screen_width": 20, "screen_height": 10})")));
    }

    std::unique_ptr<AgentLoop> make() {
        auto loop = std::make_unique<AgentLoop>(dir.path(), "/nonexistent/deskpilot", dir.file("config.json"));
        loop->set_turn_fn([this](const std::string& raw, const std::string& run_dir) {
            stories.push_back(raw);
            CHECK(run_dir == dir.path());
            TurnResult r;
            r.executed = {"click(1, 2)"};
            r.feedback = "click(1, 2) -> OK";
            r.screenshot_b64 = "QUJD";
            return r;
        });
        loop->set_client_factory([this](const AppCfg&) -> std::unique_ptr<InferenceClient> {
            std::string reply = replies.empty() ? std::string() : replies.front();
            if (!replies.empty()) replies.erase(replies.begin());
            return std::make_unique<ScriptedClient>(reply, fail, &requests);
        });
        return loop;
    }

    TempDir dir;
    std::vector<std::string> replies;
    std::vector<std::string> stories;
    std::vector<std::string> requests;
    bool fail = false;
};

}  // namespace

TEST_CASE("Fresh run bootstraps the virtual canvas", "[loop]") {
    Harness h;
    auto loop = h.make();
    loop->start();
    std::string canvas;
    REQUIRE(try_read_file(RunFiles::in(h.dir.path()).canvas, canvas));
    CHECK(canvas.size() == 20 * 10 * 4);
    CHECK(loop->state().turn == 0);
}

TEST_CASE("Each turn feeds the previous reply back as the story", "[loop]") {
    Harness h;
    h.replies = {"I click.\nclick(1, 2)", "Now I type.\nwrite('x')"};
    auto loop = h.make();
    loop->start();
    loop->step();
    loop->step();

    REQUIRE(h.stories.size() == 2);
    CHECK(h.stories[0].empty());
    CHECK(h.stories[1] == "I click.\nclick(1, 2)");
    REQUIRE(h.requests.size() == 2);
    CHECK(h.requests[1] == "I click.\nclick(1, 2)|click(1, 2) -> OK|QUJD");

    CHECK(loop->state().turn == 2);
    CHECK(loop->state().story == "Now I type.\nwrite('x')");
    CHECK(loop->state().prev_story == "I click.\nclick(1, 2)");
}

TEST_CASE("Empty or failed inference injects a default click", "[loop]") {
    SECTION("empty reply") {
        Harness h;
        h.replies = {"   \n"};
        auto loop = h.make();
        loop->start();
        loop->step();
        CHECK(loop->state().story == "click(500, 500)");
    }
    SECTION("transport failure") {
        Harness h;
        h.fail = true;
        auto loop = h.make();
        loop->start();
        loop->step();
        CHECK(loop->state().story == "click(500, 500)");
    }
}

TEST_CASE("Loop state is persisted and resumed", "[loop]") {
    Harness h;
    h.replies = {"first", "second"};
    {
        auto loop = h.make();
        loop->start();
        loop->step();
    }
    LoopState saved = load_loop_state(h.dir.file("state.json"));
    CHECK(saved.turn == 1);
    CHECK(saved.story == "first");

    std::string body;
    REQUIRE(try_read_file(h.dir.file("state.json"), body));
    CHECK(body.find("\"executed\": [\n    \"click(1, 2)\"\n  ]") != std::string::npos);
    CHECK(body.find("\"timestamp\": \"") != std::string::npos);

    auto resumed = h.make();
    resumed->start();
    CHECK(resumed->state().turn == 1);
    resumed->step();
    CHECK(h.stories.back() == "first");
    CHECK(resumed->state().turn == 2);
    CHECK(resumed->state().story == "second");
}

TEST_CASE("Unreadable state starts over", "[loop]") {
    TempDir dir;
    REQUIRE(write_file_atomic(dir.file("state.json"), std::string("not json")));
    LoopState st = load_loop_state(dir.file("state.json"));
    CHECK(st.turn == 0);
    CHECK(st.story.empty());
}
