#include <doctest/doctest.h>
#include "filter_harness.hpp"

using namespace netway;
using namespace nwtest;

static const Endpoint kClient{"10.0.0.2", 4000};

TEST_CASE("Server handshake: Connect, LoggedIn, KeepAlive releases the LoggedIn with one DropPacket") {
    Harness h(FilterMode::Server);

    h.deliver(kClient, make_request(1, action::Connect{"alice", "0.3.2"}));
    REQUIRE(h.tick());

    auto reqs = only<filter_notice::NewRequestAction>(h.notices());
    REQUIRE(reqs.size() == 1);
    CHECK(reqs[0].endpoint == kClient);
    CHECK(std::get<action::Connect>(reqs[0].action).name == "alice");
    CHECK(h.transport().empty());                     // nothing sent until the app answers
    REQUIRE(h.filter.session(kClient) != nullptr);
    CHECK(h.filter.session(kClient)->phase() == SessionPhase::Connecting);

    // empty cookie/version: the filter fills both in
    h.command(filter_cmd::SendResponseCode{kClient, code::LoggedIn{"", ""}});
    REQUIRE(h.tick());

    auto cmds  = h.transport();
    auto sends = only<transport_cmd::SendPackets>(cmds);
    REQUIRE(sends.size() == 1);
    REQUIRE(sends[0].packets.size() == 1);
    REQUIRE(sends[0].packet_infos.size() == 1);

    const auto& rsp = std::get<Response>(sends[0].packets[0]);
    CHECK(rsp.sequence == 1);
    CHECK(rsp.request_ack.value_or(0) == 1);
    const auto& li = std::get<code::LoggedIn>(rsp.code);
    CHECK_FALSE(li.cookie.empty());
    CHECK(li.server_version == "0.3.2");

    const TrackingId tid = sends[0].packet_infos[0].tid;
    CHECK(sends[0].packet_infos[0].retry_count == 0);

    const Session* s = h.filter.session(kClient);
    REQUIRE(s != nullptr);
    CHECK(s->phase() == SessionPhase::Established);
    CHECK(s->cookie() == li.cookie);
    CHECK(s->inflight().size() == 1);

    h.deliver(kClient, make_request(2, action::KeepAlive{1}, 1, li.cookie));
    REQUIRE(h.tick());

    cmds = h.transport();
    auto drops = only<transport_cmd::DropPacket>(cmds);
    REQUIRE(drops.size() == 1);
    CHECK(drops[0].tid == tid);
    CHECK(drops[0].endpoint == kClient);
    CHECK(only<transport_cmd::SendPackets>(cmds).empty());
    CHECK(h.notices().empty());                       // KeepAlive is not surfaced

    CHECK(s->inflight().empty());
    CHECK(s->peer_ack_seq() == 1);
    CHECK(h.filter.stats().packets_acked == 1);
}

TEST_CASE("Server adopts a cookie chosen by the application and checks it on every request") {
    Harness h(FilterMode::Server);
    const std::string cookie = establish_server(h, kClient, "app-cookie");
    CHECK(h.filter.session(kClient)->cookie() == "app-cookie");

    SUBCASE("matching cookie reaches the application") {
        h.deliver(kClient, make_request(2, action::ChatMessage{"hi"}, 1, cookie));
        h.tick();
        auto reqs = only<filter_notice::NewRequestAction>(h.notices());
        REQUIRE(reqs.size() == 1);
        CHECK(std::get<action::ChatMessage>(reqs[0].action).message == "hi");
    }

    SUBCASE("wrong cookie is answered with Unauthorized and the session stays") {
        h.deliver(kClient, make_request(2, action::ChatMessage{"hi"}, 1, std::string("forged")));
        h.tick();
        CHECK(h.notices().empty());

        auto packets = sent_packets(h.transport());
        REQUIRE(packets.size() == 1);
        const auto& rsp = std::get<Response>(packets[0]);
        CHECK(std::holds_alternative<code::Unauthorized>(rsp.code));
        CHECK(rsp.sequence == 2);                     // untracked but still consumes a sequence

        const Session* s = h.filter.session(kClient);
        REQUIRE(s != nullptr);
        CHECK(s->phase() == SessionPhase::Established);
        CHECK(s->inflight().size() == 1);             // only the LoggedIn
        CHECK(h.filter.stats().peer_rejections == 1);
    }

    SUBCASE("missing cookie is answered with Unauthorized") {
        h.deliver(kClient, make_request(2, action::ListRooms{}, 1));
        h.tick();
        CHECK(h.notices().empty());
        auto packets = sent_packets(h.transport());
        REQUIRE(packets.size() == 1);
        CHECK(std::holds_alternative<code::Unauthorized>(std::get<Response>(packets[0]).code));
    }
}

TEST_CASE("Server rejects an incompatible client version and closes the session") {
    Harness h(FilterMode::Server);

    h.deliver(kClient, make_request(1, action::Connect{"old", "0.2.9"}));
    h.tick();

    CHECK(h.notices().empty());
    auto cmds = h.transport();
    REQUIRE(cmds.size() == 2);

    const auto& send = std::get<transport_cmd::SendPackets>(cmds[0]);
    const auto& rsp  = std::get<Response>(send.packets.at(0));
    CHECK(std::get<code::IncompatibleVersion>(rsp.code).server_version == "0.3.2");
    CHECK(rsp.request_ack.value_or(0) == 1);

    CHECK(std::get<transport_cmd::DropEndpoint>(cmds[1]).endpoint == kClient);
    CHECK(h.filter.session(kClient) == nullptr);
}

TEST_CASE("Server answers a request before the handshake with Unauthorized") {
    Harness h(FilterMode::Server);

    h.deliver(kClient, make_request(1, action::ListPlayers{}));
    h.tick();

    CHECK(h.notices().empty());
    auto packets = sent_packets(h.transport());
    REQUIRE(packets.size() == 1);
    CHECK(std::holds_alternative<code::Unauthorized>(std::get<Response>(packets[0]).code));
    CHECK(h.filter.session(kClient) == nullptr);
}

TEST_CASE("Server drops duplicate requests before anything else") {
    Harness h(FilterMode::Server);

    h.deliver(kClient, make_request(1, action::Connect{"alice", "0.3.2"}));
    h.deliver(kClient, make_request(1, action::Connect{"alice", "0.3.2"}));
    h.tick();

    CHECK(only<filter_notice::NewRequestAction>(h.notices()).size() == 1);
    CHECK(h.filter.stats().duplicates == 1);
}

TEST_CASE("Server delivers out-of-order requests at once; late ones inside the gap are dropped") {
    Harness h(FilterMode::Server);
    const std::string cookie = establish_server(h, kClient);

    h.deliver(kClient, make_request(3, action::ChatMessage{"third"}, 1, cookie));
    h.tick();
    auto reqs = only<filter_notice::NewRequestAction>(h.notices());
    REQUIRE(reqs.size() == 1);
    CHECK(std::get<action::ChatMessage>(reqs[0].action).message == "third");
    CHECK(h.filter.session(kClient)->highest_recv_seq().value_or(0) == 3);

    h.deliver(kClient, make_request(2, action::ChatMessage{"second"}, 1, cookie));
    h.tick();
    CHECK(h.notices().empty());

    const auto st = h.filter.stats();
    CHECK(st.out_of_order == 1);
    CHECK(st.duplicates == 1);
}

TEST_CASE("Server response carries the next sequence and acks the request it answers") {
    Harness h(FilterMode::Server);
    const std::string cookie = establish_server(h, kClient);

    h.deliver(kClient, make_request(2, action::JoinRoom{"lobby"}, 1, cookie));
    h.tick();
    h.notices();
    CHECK(only<transport_cmd::DropPacket>(h.transport()).size() == 1);   // LoggedIn acked

    h.command(filter_cmd::SendResponseCode{kClient, code::JoinedRoom{"lobby"}});
    h.tick();

    auto packets = sent_packets(h.transport());
    REQUIRE(packets.size() == 1);
    const auto& rsp = std::get<Response>(packets[0]);
    CHECK(rsp.sequence == 2);
    CHECK(rsp.request_ack.value_or(0) == 2);
    CHECK(std::get<code::JoinedRoom>(rsp.code).room_name == "lobby");
}

TEST_CASE("Peer Disconnect notifies the application and removes the session") {
    Harness h(FilterMode::Server);
    const std::string cookie = establish_server(h, kClient);
    const TrackingId logged_in_tid = h.filter.session(kClient)->inflight().begin()->first;

    h.deliver(kClient, make_request(2, action::Disconnect{}, std::nullopt, cookie));
    h.tick();

    auto reqs = only<filter_notice::NewRequestAction>(h.notices());
    REQUIRE(reqs.size() == 1);
    CHECK(std::holds_alternative<action::Disconnect>(reqs[0].action));

    auto cmds = h.transport();
    auto drops = only<transport_cmd::DropPacket>(cmds);
    REQUIRE(drops.size() == 1);
    CHECK(drops[0].tid == logged_in_tid);
    CHECK(only<transport_cmd::DropEndpoint>(cmds).size() == 1);
    CHECK(h.filter.session_count() == 0);
}

TEST_CASE("Server refuses misused commands on the response channel") {
    Harness h(FilterMode::Server);

    SUBCASE("response to an unknown endpoint") {
        h.command(filter_cmd::SendResponseCode{kClient, code::OK{}});
        h.tick();
        auto rsps = h.responses();
        REQUIRE(rsps.size() == 1);
        CHECK(std::get<filter_rsp::NoSuchEndpoint>(rsps[0]).endpoint == kClient);
    }

    SUBCASE("request on a server filter") {
        h.command(filter_cmd::SendRequestAction{kClient, action::ListRooms{}});
        h.tick();
        auto rsps = h.responses();
        REQUIRE(rsps.size() == 1);
        CHECK(std::get<filter_rsp::Rejected>(rsps[0]).error == FilterError::WrongMode);
    }

    SUBCASE("LoggedIn for a session that is already established") {
        establish_server(h, kClient);
        h.command(filter_cmd::SendResponseCode{kClient, code::LoggedIn{"again", "0.3.2"}});
        h.tick();
        auto rsps = h.responses();
        REQUIRE(rsps.size() == 1);
        CHECK(std::get<filter_rsp::Rejected>(rsps[0]).error == FilterError::InvalidPhase);
        CHECK(h.transport().empty());
        CHECK(h.filter.session(kClient)->cookie() == "c00k1e");
    }

    SUBCASE("application DropEndpoint forgets the peer") {
        establish_server(h, kClient);
        h.command(filter_cmd::DropEndpoint{kClient});
        h.tick();
        auto cmds = h.transport();
        CHECK(only<transport_cmd::DropPacket>(cmds).size() == 1);
        CHECK(only<transport_cmd::DropEndpoint>(cmds).size() == 1);
        CHECK(h.filter.session_count() == 0);
        CHECK(h.responses().empty());
    }
}

TEST_CASE("Server discards responses and malformed datagrams") {
    Harness h(FilterMode::Server);

    h.deliver(kClient, make_response(1, code::OK{}));
    h.tnotice->send(transport_notice::MalformedPacket{kClient, "not json"});
    h.tick();

    CHECK(h.filter.session_count() == 0);
    CHECK(h.notices().empty());
    CHECK(h.transport().empty());
    CHECK(h.filter.stats().malformed == 2);
}

TEST_CASE("Server fails a silent endpoint after the idle timeout") {
    FilterConfig cfg;
    cfg.endpoint_idle_timeout_ms = 500;
    Harness h(FilterMode::Server, cfg);
    establish_server(h, kClient);

    h.advance(499);
    h.tick();
    CHECK(h.notices().empty());

    h.advance(1);
    h.tick();
    auto failed = only<filter_notice::EndpointFailed>(h.notices());
    REQUIRE(failed.size() == 1);
    CHECK(failed[0].endpoint == kClient);
    CHECK(failed[0].reason == FailReason::IdleTimeout);
    CHECK(h.filter.session_count() == 0);
    CHECK(only<transport_cmd::DropEndpoint>(h.transport()).size() == 1);
}
