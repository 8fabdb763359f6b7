// llamaload - Config Tests

#include "config.hpp"
#include "test_support.hpp"

#include <catch2/catch.hpp>

using namespace llamaload;
using llamaload::testing::ScopedEnv;

TEST_CASE("boolean parsing", "[config]")
{
    for (const char* value : {"1", "true", "TRUE", "Yes", "on"}) {
        INFO(value);
        REQUIRE(parseBool(value).has_value());
        CHECK(*parseBool(value));
    }
    for (const char* value : {"0", "false", "No", "OFF"}) {
        INFO(value);
        REQUIRE(parseBool(value).has_value());
        CHECK_FALSE(*parseBool(value));
    }
    CHECK_FALSE(parseBool("").has_value());
    CHECK_FALSE(parseBool("maybe").has_value());
    CHECK_FALSE(parseBool("2").has_value());
}

TEST_CASE("config from environment", "[config]")
{
    SECTION("all overrides")
    {
        ScopedEnv path("LLAMALOAD_LIBRARY_PATH", "/opt/llama/libllama.so");
        ScopedEnv version("LLAMALOAD_VERSION", "b6862");
        ScopedEnv cache("LLAMALOAD_CACHE_DIR", "/tmp/llama-cache");
        ScopedEnv embedded("LLAMALOAD_USE_EMBEDDED", "yes");
        ScopedEnv embedded_dir("LLAMALOAD_EMBEDDED_DIR", "/opt/bundle");
        ScopedEnv preload("LLAMALOAD_PRELOAD_SIBLINGS", "on");

        Config config = Config::fromEnvironment();
        CHECK(config.library_path == "/opt/llama/libllama.so");
        CHECK(config.version == "b6862");
        CHECK(config.cache_dir == "/tmp/llama-cache");
        CHECK(config.use_embedded);
        CHECK(config.embedded_dir == "/opt/bundle");
        REQUIRE(config.preload_siblings.has_value());
        CHECK(*config.preload_siblings);
    }

    SECTION("invalid booleans keep defaults")
    {
        ScopedEnv embedded("LLAMALOAD_USE_EMBEDDED", "sometimes");
        ScopedEnv preload("LLAMALOAD_PRELOAD_SIBLINGS", "perhaps");

        Config config = Config::fromEnvironment();
        CHECK_FALSE(config.use_embedded);
        CHECK_FALSE(config.preload_siblings.has_value());
    }
}
