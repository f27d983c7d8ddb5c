#include <catch2/catch_test_macros.hpp>
#include "core/logging.hpp"

#include <cstring>

TEST_CASE("Logging categories share the lanbridge prefix", "[logging]") {
    REQUIRE(std::strcmp(lanbridgeMainLog().categoryName(), "lanbridge.main") == 0);
    REQUIRE(std::strcmp(lanbridgeCodecLog().categoryName(), "lanbridge.codec") == 0);
    REQUIRE(std::strcmp(lanbridgeTunnelLog().categoryName(), "lanbridge.tunnel") == 0);
    REQUIRE(std::strcmp(lanbridgeAppLog().categoryName(), "lanbridge.app") == 0);
    REQUIRE(std::strcmp(lanbridgeClientLog().categoryName(), "lanbridge.client") == 0);
    REQUIRE(std::strcmp(lanbridgeDirectLog().categoryName(), "lanbridge.direct") == 0);
    REQUIRE(std::strcmp(lanbridgeQueryLog().categoryName(), "lanbridge.query") == 0);
}

TEST_CASE("set_debug_logging toggles debug output for every category", "[logging]") {
    const bool was_enabled = lanbridgeAppLog().isDebugEnabled();

    lanbridge::core::set_debug_logging(true);
    REQUIRE(lanbridgeAppLog().isDebugEnabled());
    REQUIRE(lanbridgeQueryLog().isDebugEnabled());
    REQUIRE(lanbridgeMainLog().isInfoEnabled());

    lanbridge::core::set_debug_logging(false);
    REQUIRE_FALSE(lanbridgeAppLog().isDebugEnabled());
    REQUIRE_FALSE(lanbridgeQueryLog().isDebugEnabled());
    REQUIRE(lanbridgeMainLog().isInfoEnabled());

    lanbridge::core::set_debug_logging(was_enabled);
}
