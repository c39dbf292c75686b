#include <catch2/catch_test_macros.hpp>

#include "network/rendezvous_name.hpp"

#include <numeric>

using namespace datlan;
using namespace datlan::network;

TEST_CASE("Rendezvous name: first 40 hex chars under dat.local", "[unit][rendezvous]") {
    std::vector<uint8_t> key(32);
    std::iota(key.begin(), key.end(), uint8_t{0});

    const auto name = derive_rendezvous_name(key);
    REQUIRE(name.is_ok());
    REQUIRE(name.unwrap().to_string() == "000102030405060708090a0b0c0d0e0f10111213.dat.local");
    REQUIRE(name.unwrap().labels().size() == 3);
}

TEST_CASE("Rendezvous name: keys sharing 20 leading bytes collide", "[unit][rendezvous]") {
    std::vector<uint8_t> a(32, 0xAB);
    std::vector<uint8_t> b = a;
    b[31] = 0x00;

    REQUIRE(derive_rendezvous_name(a).unwrap() == derive_rendezvous_name(b).unwrap());

    b[19] = 0x00;
    REQUIRE_FALSE(derive_rendezvous_name(a).unwrap() == derive_rendezvous_name(b).unwrap());
}

TEST_CASE("Rendezvous name: exactly 20 bytes is enough", "[unit][rendezvous]") {
    const std::vector<uint8_t> key(20, 0xFF);
    REQUIRE(derive_rendezvous_name(key).unwrap().to_string()
            == std::string(40, 'f') + ".dat.local");
}

TEST_CASE("Rendezvous name: short keys are rejected", "[unit][rendezvous]") {
    const auto name = derive_rendezvous_name(std::vector<uint8_t>(19, 0x01));
    REQUIRE(name.is_err());
    REQUIRE(name.unwrap_err().code == ErrorCode::InvalidName);

    REQUIRE(derive_rendezvous_name({}).is_err());
}
