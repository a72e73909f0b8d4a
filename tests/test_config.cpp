#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include "util.hpp"
#include "test_support.hpp"
#include <stdexcept>

TEST_CASE("Missing config file yields defaults", "[config]") {
    TempDir dir;
    AppCfg c = load_cfg(dir.file("config.json"));
    CHECK(c.model == "qwen3-vl-2b-instruct-1m");
    CHECK(c.api_url == "http://localhost:1234/v1/chat/completions");
    CHECK(c.width == 512);
    CHECK(c.height == 288);
    CHECK(c.max_tokens == 300);
    CHECK(c.execute_actions);
    CHECK_FALSE(c.physical_execution);
    CHECK(c.overlay_debug);
    CHECK(c.virtual_canvas);
    CHECK(c.loop_delay == 2.0);
    CHECK(c.capture_delay == 1.0);
    CHECK(c.screen_width == 0);
}

TEST_CASE("Present keys override defaults, absent keys keep them", "[config]") {
    TempDir dir;
    std::string path = dir.file("config.json");
    REQUIRE(write_file_atomic(path, std::string(R"({
        "model": "other-vl",
        "temperature": 0.2,
        "width": 640,
        "physical_execution": true,
        "virtual_canvas": false,
        "loop_delay": 5
    })")));
    AppCfg c = load_cfg(path);
    CHECK(c.model == "other-vl");
    CHECK(c.temperature == 0.2);
    CHECK(c.width == 640);
    CHECK(c.height == 288);
    CHECK(c.physical_execution);
    CHECK_FALSE(c.virtual_canvas);
    CHECK(c.loop_delay == 5.0);
    CHECK(c.top_p == 0.9);
}

TEST_CASE("Unparsable config throws, the lenient loader falls back", "[config]") {
    TempDir dir;
    std::string path = dir.file("config.json");
    REQUIRE(write_file_atomic(path, std::string("{ \"width\": ")));
    CHECK_THROWS_AS(load_cfg(path), std::runtime_error);
    AppCfg c = load_cfg_or_defaults(path, "test");
    CHECK(c.width == 512);
}

TEST_CASE("Input is only synthesized outside both isolation modes", "[config]") {
    AppCfg c;
    c.physical_execution = true;
    c.overlay_debug = false;
    c.virtual_canvas = false;
    CHECK(physical_enabled(c));
    c.overlay_debug = true;
    CHECK_FALSE(physical_enabled(c));
    c.overlay_debug = false;
    c.virtual_canvas = true;
    CHECK_FALSE(physical_enabled(c));
    c.virtual_canvas = false;
    c.physical_execution = false;
    CHECK_FALSE(physical_enabled(c));
}
