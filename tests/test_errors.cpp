#include <doctest/doctest.h>
#include "greeErrors.hpp"

#include <string>

TEST_CASE("Errors map onto HTTP status codes") {
    CHECK(Gree::Error::http_status(Gree::Error::NONE) == 200);
    CHECK(Gree::Error::http_status(Gree::Error::NOT_FOUND) == 404);
    CHECK(Gree::Error::http_status(Gree::Error::TIMEOUT) == 503);
    CHECK(Gree::Error::http_status(Gree::Error::IO) == 503);

    const Gree::Error::value bad_requests[] = {
        Gree::Error::CRYPTO, Gree::Error::SERIALIZATION, Gree::Error::PROTOCOL, Gree::Error::NOT_BOUND,
        Gree::Error::INVALID_VARIABLE, Gree::Error::INVALID_VALUE, Gree::Error::CONFIG
    };
    for (size_t i = 0; i < sizeof(bad_requests) / sizeof(bad_requests[0]); i++)
        CHECK(Gree::Error::http_status(bad_requests[i]) == 400);
}

TEST_CASE("Only network errors are transient") {
    CHECK(Gree::Error::is_transient(Gree::Error::TIMEOUT));
    CHECK(Gree::Error::is_transient(Gree::Error::IO));
    CHECK_FALSE(Gree::Error::is_transient(Gree::Error::NOT_FOUND));
    CHECK_FALSE(Gree::Error::is_transient(Gree::Error::INVALID_VALUE));
}

TEST_CASE("Every error has a name") {
    CHECK(std::string(Gree::Error::name(Gree::Error::TIMEOUT)) == "timeout");
    CHECK(std::string(Gree::Error::name(Gree::Error::NOT_FOUND)) == "not found");
    CHECK(std::string(Gree::Error::name(Gree::Error::CONFIG)) == "invalid configuration");
}
