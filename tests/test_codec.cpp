#include <doctest/doctest.h>
#include "netway/codec.hpp"
#include "netway/common.hpp"
#include "netway/protocol.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace netway;
using nlohmann::json;

TEST_CASE("Request packet JSON shape") {
    Request r;
    r.sequence     = 4;
    r.response_ack = 2;
    r.cookie       = "abc";
    r.action       = action::Connect{"alice", "0.3.2"};

    const json j = codec::packet_to_json(r);
    CHECK(j.at("type").get<std::string>() == "Request");
    CHECK(j.at("sequence").get<uint64_t>() == 4);
    CHECK(j.at("response_ack").get<uint64_t>() == 2);
    CHECK(j.at("cookie").get<std::string>() == "abc");
    CHECK(j.at("action").at("type").get<std::string>() == "Connect");
    CHECK(j.at("action").at("client_version").get<std::string>() == "0.3.2");

    r.response_ack.reset();
    r.cookie.reset();
    const json k = codec::packet_to_json(r);
    CHECK(k.at("response_ack").is_null());
    CHECK(k.at("cookie").is_null());
}

TEST_CASE("Decode accepts hand-written packets") {
    const auto p = codec::decode(
        R"({"type":"Response","sequence":9,"request_ack":null,)"
        R"("code":{"type":"PlayerList","players":["a","b"]}})");
    REQUIRE(p.has_value());
    const auto& rsp = std::get<Response>(*p);
    CHECK(rsp.sequence == 9);
    CHECK_FALSE(rsp.request_ack.has_value());
    const std::vector<std::string> expected{"a", "b"};
    CHECK(std::get<code::PlayerList>(rsp.code).players == expected);

    Request keep;
    keep.sequence = 3;
    keep.action   = action::KeepAlive{2};
    CHECK(codec::decode(codec::encode(keep)) == std::optional<Packet>(Packet(keep)));
}

TEST_CASE("Decode reports malformed input instead of throwing") {
    std::string err;
    CHECK_FALSE(codec::decode("{not json", &err).has_value());
    CHECK_FALSE(err.empty());

    err.clear();
    CHECK_FALSE(codec::decode(R"({"type":"Request","sequence":"one"})", &err).has_value());
    CHECK_FALSE(err.empty());

    err.clear();
    CHECK_FALSE(codec::decode(
        R"({"type":"Request","sequence":1,"response_ack":null,"cookie":null,"action":{"type":"Fly"}})",
        &err).has_value());
    CHECK(err.find("Fly") != std::string::npos);

    CHECK_FALSE(codec::decode(R"({"type":"Datagram"})").has_value());
}

TEST_CASE("The throwing helpers raise json exceptions on bad fields") {
    const json missing_field = json::parse(R"({"type":"ChatMessage"})");
    const json unknown_tag   = json::parse(R"({"type":"Nope"})");
    CHECK_THROWS_AS(codec::action_from_json(missing_field), json::exception);
    CHECK_THROWS_AS(codec::code_from_json(unknown_tag), std::invalid_argument);
}

TEST_CASE("Tag names and debug strings") {
    CHECK(std::string(action_name(action::LeaveRoom{})) == "LeaveRoom");
    CHECK(std::string(code_name(code::IncompatibleVersion{"1.0.0"})) == "IncompatibleVersion");
    CHECK(to_string(RequestAction(action::ListRooms{})) == R"({"type":"ListRooms"})");

    Response r;
    r.sequence = 12;
    r.code     = code::OK{};
    CHECK(packet_sequence(r) == 12);
}

TEST_CASE("Endpoint identity and formatting") {
    CHECK(Endpoint("10.0.0.1", 80).to_string() == "10.0.0.1:80");
    CHECK(Endpoint("::1", 9000).to_string() == "[::1]:9000");
    CHECK(Endpoint("a", 1) == Endpoint("a", 1));
    CHECK(Endpoint("a", 1) != Endpoint("a", 2));
    CHECK(Endpoint("a", 2) < Endpoint("b", 1));
    CHECK(std::hash<Endpoint>{}(Endpoint("a", 1)) == std::hash<Endpoint>{}(Endpoint("a", 1)));

    const TrackingId t1 = next_tracking_id();
    const TrackingId t2 = next_tracking_id();
    CHECK(t1 != 0);
    CHECK(t2 > t1);
}
