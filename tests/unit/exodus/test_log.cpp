#include "Log.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace exodus::logx;

TEST_CASE("Log level gates messages above the configured verbosity", "[log]")
{
    const Level saved = g_level.load();

    init(Config{Level::Error});
    REQUIRE_FALSE(gate(Level::Error));
    REQUIRE(gate(Level::Warn));
    REQUIRE(gate(Level::Debug));

    init(Config{Level::Debug});
    REQUIRE_FALSE(gate(Level::Debug));
    LOGD("[log] debug output enabled\n");

    g_level.store(saved);
}
