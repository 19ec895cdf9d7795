#include <catch2/catch_test_macros.hpp>

#include "core/types/Vendor.hpp"

using namespace netscan::core;

TEST_CASE("OUI prefix extraction", "[Vendor]") {
    SECTION("Full addresses in any notation") {
        REQUIRE(VendorDetector::ouiPrefix("a4:83:e7:11:22:33") == "A4:83:E7");
        REQUIRE(VendorDetector::ouiPrefix("A4-83-E7-11-22-33") == "A4:83:E7");
    }

    SECTION("Bare prefixes") {
        REQUIRE(VendorDetector::ouiPrefix("b8:27:eb") == "B8:27:EB");
        REQUIRE(VendorDetector::ouiPrefix("0:3:93") == "00:03:93");
    }

    SECTION("Malformed input") {
        REQUIRE(VendorDetector::ouiPrefix("").empty());
        REQUIRE(VendorDetector::ouiPrefix("a4:83").empty());
        REQUIRE(VendorDetector::ouiPrefix("zz:83:e7:00:00:00").empty());
        REQUIRE(VendorDetector::ouiPrefix("a4::e7:00:00:00").empty());
    }
}

TEST_CASE("Built-in vendor lookup", "[Vendor]") {
    REQUIRE(VendorDetector::detectVendor("B8:27:EB:01:02:03") == "Raspberry Pi");
    REQUIRE(VendorDetector::detectVendor("a4-83-e7-01-02-03") == "Apple");
    REQUIRE(VendorDetector::detectVendor("00:0C:29:AA:BB:CC") == "VMware");
    REQUIRE(VendorDetector::detectVendor("02:00:00:00:00:01").empty());
    REQUIRE(VendorDetector::detectVendor("garbage").empty());

    for (const auto& [prefix, vendor] : VendorDetector::getKnownVendors()) {
        REQUIRE(VendorDetector::ouiPrefix(prefix) == prefix);
        REQUIRE_FALSE(vendor.empty());
    }
}
