#include <doctest/doctest.h>
#include "greeRegistry.hpp"

#include <string>
#include <vector>

static greeScanResult scan_result(const std::string &mac, const std::string &address)
{
    greeScanResult result;
    result.mac = mac;
    result.address = address;
    result.pack["mac"] = mac;
    result.pack["t"] = "dev";
    return result;
}

TEST_CASE("RecordScan keeps one entry per MAC") {
    greeRegistry registry;
    std::vector<greeScanResult> results;
    results.push_back(scan_result("aaaa", "10.0.0.1"));
    results.push_back(scan_result("bbbb", "10.0.0.2"));
    results.push_back(scan_result("aaaa", "10.0.0.3"));
    registry.RecordScan(results);

    CHECK(registry.size() == 2);
    REQUIRE(registry.Get("aaaa") != nullptr);
    CHECK(registry.Get("aaaa")->address == "10.0.0.3");
    CHECK_FALSE(registry.Get("aaaa")->isBound());
    std::vector<std::string> macs = registry.devices();
    REQUIRE(macs.size() == 2);
    CHECK(macs[0] == "aaaa");
    CHECK(macs[1] == "bbbb");
}

TEST_CASE("Unknown MACs are reported as not found") {
    greeRegistry registry;
    CHECK(registry.Get("cccc") == nullptr);
    CHECK(registry.getlasterror() == Gree::Error::NOT_FOUND);
    CHECK_FALSE(registry.RecordBind("cccc", "0123456789ABCDEF"));
    CHECK(registry.getlasterror() == Gree::Error::NOT_FOUND);
    CHECK_FALSE(registry.ForgetKey("cccc"));
}

TEST_CASE("Resolve consults the alias table first") {
    greeRegistry registry;
    registry.setAlias("living", "aaaa");
    CHECK(registry.Resolve("living") == "aaaa");
    CHECK(registry.Resolve("bbbb") == "bbbb");
    CHECK(registry.removeAlias("living"));
    CHECK(registry.Resolve("living") == "living");
    CHECK_FALSE(registry.removeAlias("living"));
}

TEST_CASE("Session keys follow the rescan policy") {
    greeRegistry registry;
    std::vector<greeScanResult> results;
    results.push_back(scan_result("aaaa", "10.0.0.1"));
    registry.RecordScan(results);
    REQUIRE(registry.RecordBind("aaaa", "0123456789ABCDEF"));
    CHECK(registry.Get("aaaa")->isBound());

    SUBCASE("carried forward when the MAC reappears") {
        results[0].address = "10.0.0.9";
        registry.RecordScan(results, true);
        CHECK(registry.Get("aaaa")->key == "0123456789ABCDEF");
        CHECK(registry.Get("aaaa")->address == "10.0.0.9");
    }
    SUBCASE("dropped on full replacement") {
        registry.RecordScan(results, false);
        CHECK_FALSE(registry.Get("aaaa")->isBound());
    }
    SUBCASE("dropped with the device") {
        registry.RecordScan(std::vector<greeScanResult>(), true);
        CHECK(registry.empty());
        registry.RecordScan(results, true);
        CHECK_FALSE(registry.Get("aaaa")->isBound());
    }
    SUBCASE("forgotten on request") {
        CHECK(registry.ForgetKey("aaaa"));
        CHECK_FALSE(registry.Get("aaaa")->isBound());
    }
}
