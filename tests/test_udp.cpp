#include <doctest/doctest.h>
#include "greeUDP.hpp"

#include <cerrno>
#include <chrono>
#include <string>
#include <thread>

// Two sockets on the loopback interface talking to each other
struct loopbackPair
{
    greeUDP a;
    greeUDP b;

    loopbackPair()
    {
        REQUIRE(a.Open("127.0.0.1", 0));
        REQUIRE(b.Open("127.0.0.1", 0));
        a.setReceiveTimeout(200);
        b.setReceiveTimeout(200);
    }
};

static void exercise(loopbackPair &pair)
{
    REQUIRE(pair.a.send("{\"t\":\"scan\"}", "127.0.0.1", pair.b.getLocalPort()));

    std::string sender, datagram;
    REQUIRE(pair.b.receive(sender, datagram));
    CHECK(sender == "127.0.0.1");
    CHECK(datagram == "{\"t\":\"scan\"}");

    // nothing else is on its way
    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
    CHECK_FALSE(pair.b.receive(sender, datagram, 100));
    CHECK(pair.b.getlasterror() == Gree::Error::TIMEOUT);
    CHECK(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(90));

    // stale datagrams are dropped by drain
    REQUIRE(pair.a.send("first", "127.0.0.1", pair.b.getLocalPort()));
    REQUIRE(pair.a.send("second", "127.0.0.1", pair.b.getLocalPort()));
    REQUIRE(pair.b.receive(sender, datagram));
    CHECK(datagram == "first");
    // let the receiver thread pick up the second one
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    pair.b.drain();
    CHECK_FALSE(pair.b.receive(sender, datagram, 50));

    REQUIRE(pair.a.send("third", "127.0.0.1", pair.b.getLocalPort()));
    REQUIRE(pair.b.receive(sender, datagram));
    CHECK(datagram == "third");
}

TEST_CASE("Open binds the requested address") {
    greeUDP udp;
    CHECK(udp.getSocketState() == Gree::UDP::Socket::CLOSED);
    REQUIRE(udp.Open("127.0.0.1", 0));
    CHECK(udp.getSocketState() == Gree::UDP::Socket::OPEN);
    CHECK(udp.getLocalPort() != 0);
    udp.Close();
    CHECK(udp.getSocketState() == Gree::UDP::Socket::CLOSED);
    CHECK(udp.getLocalPort() == 0);
}

TEST_CASE("Open rejects an invalid address") {
    greeUDP udp;
    CHECK_FALSE(udp.Open("not.an.address", 0));
    CHECK(udp.getlasterror() == Gree::Error::IO);
    CHECK(udp.getSocketState() == Gree::UDP::Socket::FAILED);
}

TEST_CASE("A closed socket refuses to send") {
    greeUDP udp;
    CHECK_FALSE(udp.send("x", "127.0.0.1", 7000));
    CHECK(udp.getlasterror() == Gree::Error::IO);
    std::string sender, datagram;
    CHECK_FALSE(udp.receive(sender, datagram, 10));
    CHECK(udp.getlasterror() == Gree::Error::IO);
    CHECK_FALSE(udp.setReceiverThread(true));
}

TEST_CASE("Datagrams travel over loopback with a blocking receive") {
    loopbackPair pair;
    exercise(pair);
}

TEST_CASE("Datagrams travel over loopback through the receiver thread") {
    loopbackPair pair;
    REQUIRE(pair.b.setReceiverThread(true));
    CHECK(pair.b.hasReceiverThread());
    CHECK(pair.b.getSocketState() == Gree::UDP::Socket::RECEIVING);

    exercise(pair);

    REQUIRE(pair.b.setReceiverThread(false));
    CHECK_FALSE(pair.b.hasReceiverThread());
    CHECK(pair.b.getSocketState() == Gree::UDP::Socket::OPEN);
}

TEST_CASE("Broadcast sends are accepted on loopback") {
    loopbackPair pair;
    REQUIRE(pair.a.send_broadcast("{\"t\":\"scan\"}", "127.0.0.1", pair.b.getLocalPort()));
    std::string sender, datagram;
    REQUIRE(pair.b.receive(sender, datagram));
    CHECK(datagram == "{\"t\":\"scan\"}");
}

static void oversized(loopbackPair &pair)
{
    std::string big(GREE_MAX_DATAGRAM_SIZE + 100, 'x');
    REQUIRE(pair.a.send(big, "127.0.0.1", pair.b.getLocalPort()));
    REQUIRE(pair.a.send("after", "127.0.0.1", pair.b.getLocalPort()));

    std::string sender, datagram;
    CHECK_FALSE(pair.b.receive(sender, datagram));
    CHECK(pair.b.getlasterror() == Gree::Error::PROTOCOL);
    CHECK(pair.b.getlasterrno() == EMSGSIZE);

    // the oversized datagram is consumed, the next one comes through intact
    REQUIRE(pair.b.receive(sender, datagram));
    CHECK(datagram == "after");
}

TEST_CASE("An oversized datagram is rejected instead of truncated") {
    SUBCASE("blocking receive") {
        loopbackPair pair;
        oversized(pair);
    }

    SUBCASE("receiver thread") {
        loopbackPair pair;
        REQUIRE(pair.b.setReceiverThread(true));
        oversized(pair);
    }
}
