#include <catch2/catch_test_macros.hpp>
#include "inference_client.hpp"
#include <stdexcept>

extern "C" {
#include <json-c/json.h>
}

namespace {

// Owns a parsed document for the duration of a test.
struct Doc {
    explicit Doc(const std::string& s): root(json_tokener_parse(s.c_str())) {}
    ~Doc() { if (root) json_object_put(root); }
    json_object* get(json_object* o, const char* k) const {
        json_object* v = nullptr;
        return o && json_object_object_get_ex(o, k, &v) ? v : nullptr;
    }
    json_object* root;
};

InferenceCfg cfg() {
    InferenceCfg c;
    c.api_url = "http://127.0.0.1:9/v1/chat/completions";
    c.model = "test-model";
    c.temperature = 0.7;
    c.top_p = 0.9;
    c.max_tokens = 300;
    c.timeout_s = 2;
    return c;
}

}  // namespace

TEST_CASE("User text joins story and feedback", "[inference]") {
    CHECK(compose_user_text("story", "fb") == "story\n\nfb");
    CHECK(compose_user_text("", "fb") == "fb");
    CHECK(compose_user_text("story", "") == "story");
}

TEST_CASE("Chat payload carries system prompt, text and image", "[inference]") {
    Doc d(build_chat_payload(cfg(), "I see \"a\" window", "click(1, 2) -> OK", "QUJD"));
    REQUIRE(d.root != nullptr);
    CHECK(std::string(json_object_get_string(d.get(d.root, "model"))) == "test-model");
    CHECK(json_object_get_int(d.get(d.root, "max_tokens")) == 300);
    CHECK(json_object_get_double(d.get(d.root, "temperature")) == 0.7);

    json_object* msgs = d.get(d.root, "messages");
    REQUIRE(json_object_array_length(msgs) == 2);
    json_object* sys = json_object_array_get_idx(msgs, 0);
    CHECK(std::string(json_object_get_string(d.get(sys, "role"))) == "system");
    CHECK(std::string(json_object_get_string(d.get(sys, "content"))) == kSystemPrompt);

    json_object* content = d.get(json_object_array_get_idx(msgs, 1), "content");
    REQUIRE(json_object_array_length(content) == 2);
    json_object* text = json_object_array_get_idx(content, 0);
    CHECK(std::string(json_object_get_string(d.get(text, "text"))) ==
          "I see \"a\" window\n\nclick(1, 2) -> OK");
    json_object* img = json_object_array_get_idx(content, 1);
    CHECK(std::string(json_object_get_string(d.get(img, "type"))) == "image_url");
    CHECK(std::string(json_object_get_string(d.get(d.get(img, "image_url"), "url"))) ==
          "data:image/png;base64,QUJD");
}

TEST_CASE("No image part without a screenshot", "[inference]") {
    Doc d(build_chat_payload(cfg(), "s", "", ""));
    REQUIRE(d.root != nullptr);
    json_object* content = d.get(json_object_array_get_idx(d.get(d.root, "messages"), 1), "content");
    CHECK(json_object_array_length(content) == 1);
}

TEST_CASE("Reply content is taken from the first choice", "[inference]") {
    std::string content;
    long tokens = 0;
    REQUIRE(extract_reply(R"({"choices":[{"message":{"role":"assistant","content":"click(5, 5)"}}],
                              "usage":{"total_tokens":42}})", content, &tokens));
    CHECK(content == "click(5, 5)");
    CHECK(tokens == 42);

    REQUIRE(extract_reply(R"({"choices":[{"message":{"content":null}}]})", content, &tokens));
    CHECK(content.empty());
    CHECK(tokens == -1);

    CHECK_FALSE(extract_reply(R"({"choices":[]})", content));
    CHECK_FALSE(extract_reply(R"({"error":"model not loaded"})", content));
    CHECK_FALSE(extract_reply("<html>", content));
}

TEST_CASE("Unreachable endpoint raises", "[inference]") {
    HttpInferenceClient client(cfg());
    CHECK_THROWS_AS(client.complete("s", "f", ""), std::runtime_error);
}
