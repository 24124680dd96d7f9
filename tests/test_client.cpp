#include <doctest/doctest.h>
#include "fake_network.hpp"

#include <sstream>
#include <string>
#include <utility>
#include <vector>

static const std::string MAC1 = "c8f742000001";
static const std::string MAC2 = "c8f742000002";
static const std::string KEY1 = "Wd3Gh6Jk9Lz2Xc5V";
static const std::string KEY2 = "Qa7Ws8Ed9Rf0Tg1Y";

static const long long MIN_AGE_MS = 60 * 1000;
static const long long MAX_AGE_MS = 24 * 60 * 60 * 1000LL;

static std::vector<std::string> names_of(const char *a, const char *b = nullptr)
{
    std::vector<std::string> names(1, a);
    if (b)
        names.push_back(b);
    return names;
}

TEST_CASE("The first operation always scans") {
    fakeNetwork net;
    testClient client(&net);
    CHECK_FALSE(client.hasScanned());
    REQUIRE(client.MaybeScan(false));
    CHECK(client.hasScanned());
    CHECK(client.getLastScanTime() == client.now);
    CHECK(net.scans == 1);
}

TEST_CASE("Scans are throttled by the registry age") {
    fakeNetwork net;
    testClient client(&net);
    REQUIRE(client.MaybeScan(false));
    const long long t0 = client.now;
    REQUIRE(net.scans == 1);

    SUBCASE("just before min_age neither routine nor forced requests scan") {
        client.now = t0 + MIN_AGE_MS - 1;
        REQUIRE(client.MaybeScan(false));
        REQUIRE(client.MaybeScan(true));
        CHECK(net.scans == 1);
    }
    SUBCASE("after min_age only a forced request scans") {
        client.now = t0 + MIN_AGE_MS;
        REQUIRE(client.MaybeScan(false));
        CHECK(net.scans == 1);
        REQUIRE(client.MaybeScan(true));
        CHECK(net.scans == 2);
        CHECK(client.getLastScanTime() == t0 + MIN_AGE_MS);
    }
    SUBCASE("after max_age every request scans") {
        client.now = t0 + MAX_AGE_MS + 1;
        REQUIRE(client.MaybeScan(false));
        CHECK(net.scans == 2);
    }
    SUBCASE("Scan ignores the throttle") {
        client.now = t0 + 1;
        REQUIRE(client.Scan());
        CHECK(net.scans == 2);
    }
}

TEST_CASE("EnsureBound binds once") {
    fakeNetwork net;
    net.addDevice(MAC1, "10.0.0.21", KEY1);
    testClient client(&net);
    REQUIRE(client.Scan());

    REQUIRE(client.EnsureBound(MAC1));
    CHECK(net.binds == 1);
    CHECK(client.getRegistry().Get(MAC1)->key == KEY1);

    const int sends = net.sends;
    REQUIRE(client.EnsureBound(MAC1));
    CHECK(net.binds == 1);
    CHECK(net.sends == sends);
}

TEST_CASE("EnsureBound surfaces a failed bind") {
    fakeNetwork net;
    net.addDevice(MAC1, "10.0.0.21", KEY1).answers_bind = false;
    testClient client(&net);
    REQUIRE(client.Scan());

    CHECK_FALSE(client.EnsureBound(MAC1));
    CHECK(client.getlasterror() == Gree::Error::TIMEOUT);
    CHECK_FALSE(client.getRegistry().Get(MAC1)->isBound());
}

TEST_CASE("Retry heals a device that was missing from the registry") {
    fakeNetwork net;
    fakeDevice &device = net.addDevice(MAC1, "10.0.0.21", KEY1);
    device.online = false;
    testClient client(&net);
    REQUIRE(client.Scan());
    REQUIRE(client.getRegistry().empty());

    device.online = true;
    client.advance(MIN_AGE_MS);
    REQUIRE(client.Bind(MAC1));
    CHECK(net.scans == 2);
    CHECK(client.getRegistry().Get(MAC1)->isBound());
}

TEST_CASE("Retry gives up after one forced rescan") {
    fakeNetwork net;
    testClient client(&net);
    REQUIRE(client.Scan());
    client.advance(MIN_AGE_MS);

    greeVarBag bag;
    REQUIRE(bag.FromNames(names_of("Pow")));
    CHECK_FALSE(client.NetRead(MAC1, bag));
    CHECK(client.getlasterror() == Gree::Error::NOT_FOUND);
    CHECK(Gree::Error::http_status(client.getlasterror()) == 404);
    CHECK(net.scans == 2);
    CHECK(bag.Get("Pow")->read_pending);
}

TEST_CASE("A throttled rescan does not hide a missing device") {
    fakeNetwork net;
    testClient client(&net);
    REQUIRE(client.Scan());

    CHECK_FALSE(client.Bind(MAC1));
    CHECK(client.getlasterror() == Gree::Error::NOT_FOUND);
    CHECK(net.scans == 1);
}

TEST_CASE("NetRead fills the bag from one status exchange") {
    fakeNetwork net;
    fakeDevice &device = net.addDevice(MAC1, "10.0.0.21", KEY1);
    device.vars["Pow"] = 1;
    device.vars["Mod"] = 0;
    testClient client(&net);

    greeVarBag bag;
    REQUIRE(bag.FromNames(names_of("Pow", "Mod")));
    REQUIRE(client.NetRead(MAC1, bag));
    CHECK(net.statuses == 1);
    CHECK_FALSE(bag.Get("Pow")->read_pending);
    CHECK_FALSE(bag.Get("Mod")->read_pending);
    CHECK(bag.Get("Pow")->value.asInt() == 1);
    CHECK(bag.Get("Mod")->value.asInt() == 0);

    // nothing left to read
    REQUIRE(client.NetRead(MAC1, bag));
    CHECK(net.statuses == 1);
}

TEST_CASE("NetWrite takes the values echoed by the device") {
    fakeNetwork net;
    fakeDevice &device = net.addDevice(MAC1, "10.0.0.21", KEY1);
    testClient client(&net);

    greeVarBag bag;
    std::vector<std::pair<std::string, std::string> > pairs;
    pairs.push_back(std::make_pair("Pow", "1"));
    pairs.push_back(std::make_pair("SetTem", "23"));
    REQUIRE(bag.FromNameValuePairs(pairs));
    REQUIRE(client.NetWrite(MAC1, bag));

    CHECK(net.commands == 1);
    CHECK(bag.PendingWrites().empty());
    CHECK(bag.Get("SetTem")->value.asInt() == 23);
    CHECK(device.vars["Pow"].asInt() == 1);
    CHECK(device.vars["SetTem"].asInt() == 23);

    // nothing left to write
    REQUIRE(client.NetWrite(MAC1, bag));
    CHECK(net.commands == 1);
}

TEST_CASE("NetWrite keeps the value the device settled on") {
    fakeNetwork net;
    fakeDevice &device = net.addDevice(MAC1, "10.0.0.21", KEY1);
    device.limits["SetTem"] = 30;
    testClient client(&net);

    greeVarBag bag;
    std::vector<std::pair<std::string, std::string> > pairs;
    pairs.push_back(std::make_pair("Pow", "1"));
    pairs.push_back(std::make_pair("SetTem", "35"));
    REQUIRE(bag.FromNameValuePairs(pairs));
    REQUIRE(client.NetWrite(MAC1, bag));

    CHECK(bag.PendingWrites().empty());
    CHECK(bag.Get("SetTem")->value.asInt() == 30);
    CHECK(bag.Get("Pow")->value.asInt() == 1);
    CHECK(device.vars["SetTem"].asInt() == 30);
}

TEST_CASE("A device with a new session key is bound again") {
    fakeNetwork net;
    fakeDevice &device = net.addDevice(MAC1, "10.0.0.21", KEY1);
    testClient client(&net);
    REQUIRE(client.Bind(MAC1));
    REQUIRE(net.binds == 1);

    // the unit rebooted and hands out a different key
    device.key = KEY2;
    greeVarBag bag;
    REQUIRE(bag.FromNames(names_of("Pow")));
    REQUIRE(client.NetRead(MAC1, bag));
    CHECK(net.binds == 2);
    CHECK(client.getRegistry().Get(MAC1)->key == KEY2);
    CHECK_FALSE(bag.Get("Pow")->read_pending);
}

TEST_CASE("Rescans keep session keys unless configured otherwise") {
    fakeNetwork net;
    net.addDevice(MAC1, "10.0.0.21", KEY1);
    testClient client(&net);

    SUBCASE("default") {
        REQUIRE(client.Bind(MAC1));
        REQUIRE(client.Scan());
        CHECK(client.getRegistry().Get(MAC1)->isBound());
        REQUIRE(client.Bind(MAC1));
        CHECK(net.binds == 1);
    }
    SUBCASE("full replacement") {
        greeConfig config;
        config.keep_keys = false;
        REQUIRE(client.Configure(config));
        REQUIRE(client.Bind(MAC1));
        REQUIRE(client.Scan());
        CHECK_FALSE(client.getRegistry().Get(MAC1)->isBound());
        REQUIRE(client.Bind(MAC1));
        CHECK(net.binds == 2);
    }
}

TEST_CASE("Invalid input never reaches the network") {
    fakeNetwork net;
    net.addDevice(MAC1, "10.0.0.21", KEY1);
    testClient client(&net);

    greeVarBag bag;
    std::vector<std::pair<std::string, std::string> > pairs(1, std::make_pair(std::string("Pow"), std::string("2")));
    CHECK_FALSE(bag.FromNameValuePairs(pairs));
    CHECK(bag.getlasterror() == Gree::Error::INVALID_VALUE);
    CHECK(Gree::Error::http_status(bag.getlasterror()) == 400);

    // an empty bag binds but exchanges no variables
    REQUIRE(client.NetWrite(MAC1, bag));
    CHECK(net.commands == 0);
    CHECK(net.statuses == 0);
}

TEST_CASE("Two devices answer a scan for three and an alias reaches the first") {
    fakeNetwork net;
    fakeDevice &living = net.addDevice(MAC1, "10.0.0.21", KEY1);
    living.vars["Pow"] = 1;
    net.addDevice(MAC2, "10.0.0.22", KEY2);

    testClient client(&net);
    greeConfig config;
    config.max_count = 3;
    config.aliases["living"] = MAC1;
    REQUIRE(client.Configure(config));

    std::ostringstream log;
    client.setOutput(&log);

    REQUIRE(client.Scan());
    CHECK(client.getRegistry().size() == 2);

    greeVarBag bag;
    REQUIRE(bag.FromNames(names_of("Pow")));
    REQUIRE(client.NetRead("living", bag));
    CHECK(net.scans == 1);
    CHECK(net.binds == 1);
    CHECK(net.statuses == 1);
    CHECK(bag.Get("Pow")->value.asInt() == 1);
    CHECK_FALSE(bag.Get("Pow")->read_pending);
    CHECK(client.getRegistry().Get(MAC1)->isBound());
    CHECK_FALSE(client.getRegistry().Get(MAC2)->isBound());

    CHECK(log.str().find("Found 2 device(s)") != std::string::npos);
    CHECK(log.str().find("Bound " + MAC1) != std::string::npos);
}

TEST_CASE("WithDevice projects the registry entry") {
    fakeNetwork net;
    fakeDevice &device = net.addDevice(MAC1, "10.0.0.21", KEY1);
    testClient client(&net);

    std::string address;
    REQUIRE(client.WithDevice(MAC1, [&address](const greeDevice &d) { address = d.address; }));
    CHECK(address == "10.0.0.21");

    SUBCASE("a known device is served from the registry") {
        device.address = "10.0.0.31";
        client.advance(MIN_AGE_MS);
        REQUIRE(client.WithDevice(MAC1, [&address](const greeDevice &d) { address = d.address; }));
        CHECK(address == "10.0.0.21");
        CHECK(net.scans == 1);
    }
    SUBCASE("an unknown device is reported") {
        client.advance(MIN_AGE_MS);
        bool called = false;
        CHECK_FALSE(client.WithDevice("living", [&called](const greeDevice &) { called = true; }));
        CHECK_FALSE(called);
        CHECK(client.getlasterror() == Gree::Error::NOT_FOUND);
        CHECK(net.scans == 2);
    }
}

TEST_CASE("WithState exposes every device") {
    fakeNetwork net;
    net.addDevice(MAC1, "10.0.0.21", KEY1);
    net.addDevice(MAC2, "10.0.0.22", KEY2);
    testClient client(&net);

    size_t count = 0;
    REQUIRE(client.WithState([&count](const greeRegistry &registry) { count = registry.size(); }));
    CHECK(count == 2);
    CHECK(net.scans == 1);
}

TEST_CASE("Execute dispatches on the operation") {
    fakeNetwork net;
    net.addDevice(MAC1, "10.0.0.21", KEY1);
    testClient client(&net);

    REQUIRE(client.Execute(MAC1, Gree::Client::Operation::BIND));
    CHECK(net.binds == 1);

    CHECK_FALSE(client.Execute(MAC1, Gree::Client::Operation::NET_READ));
    CHECK(client.getlasterror() == Gree::Error::INVALID_VARIABLE);

    greeVarBag bag;
    REQUIRE(bag.FromNames(names_of("Lig")));
    REQUIRE(client.Execute(MAC1, Gree::Client::Operation::NET_READ, &bag));
    CHECK(net.statuses == 1);
}

TEST_CASE("Configure rejects inconsistent scan ages") {
    fakeNetwork net;
    testClient client(&net);
    greeConfig config;
    config.min_scan_age = 600;
    config.max_scan_age = 600;
    CHECK_FALSE(client.Configure(config));
    CHECK(client.getlasterror() == Gree::Error::CONFIG);
    CHECK(client.getConfig().max_scan_age == 86400);
}
