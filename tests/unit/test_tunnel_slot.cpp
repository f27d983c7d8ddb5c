#include <catch2/catch_test_macros.hpp>
#include "network/tunnel_link.hpp"
#include "network/tunnel_slot.hpp"

using namespace lanbridge::network;

TEST_CASE("TunnelSlot starts empty", "[tunnel_slot]") {
    TunnelSlot slot;
    REQUIRE_FALSE(slot.has_link());
    REQUIRE(slot.current() == nullptr);
    REQUIRE(slot.take() == nullptr);
}

TEST_CASE("TunnelSlot::replace keeps the newest link", "[tunnel_slot]") {
    TunnelSlot slot;
    auto first = TunnelLink::create();
    auto second = TunnelLink::create();

    REQUIRE(slot.replace(first) == nullptr);
    REQUIRE(slot.current() == first);

    auto previous = slot.replace(second);
    REQUIRE(previous == first);
    REQUIRE(slot.current() == second);
    // The superseded link is handed back untouched.
    REQUIRE(first->state() == TunnelLink::State::Idle);
}

TEST_CASE("TunnelSlot::clear_if only clears the link it names", "[tunnel_slot]") {
    TunnelSlot slot;
    auto first = TunnelLink::create();
    auto second = TunnelLink::create();

    slot.replace(first);
    slot.replace(second);

    REQUIRE_FALSE(slot.clear_if(first.get()));
    REQUIRE(slot.current() == second);

    REQUIRE(slot.clear_if(second.get()));
    REQUIRE_FALSE(slot.has_link());
    REQUIRE_FALSE(slot.clear_if(second.get()));
}

TEST_CASE("TunnelSlot::take empties the slot", "[tunnel_slot]") {
    TunnelSlot slot;
    auto link = TunnelLink::create();
    slot.replace(link);

    REQUIRE(slot.take() == link);
    REQUIRE_FALSE(slot.has_link());
}
