#include <doctest/doctest.h>
#include "netway/session.hpp"

using namespace netway;

static Request chat(const std::string& text) {
    Request r;
    r.action = action::ChatMessage{text};
    return r;
}

static Response ok() {
    Response r;
    r.code = code::OK{};
    return r;
}

TEST_CASE("Inbound classification: new, duplicate, out of order") {
    const TimePoint t0{};
    Session s(Endpoint{"h", 1}, SessionRole::Responder, SessionPhase::Established, t0);

    CHECK(s.classify(5) == InboundClass::New);        // first packet ever, whatever its number
    CHECK(s.observe_inbound(1, std::nullopt, t0).cls == InboundClass::New);
    CHECK(s.observe_inbound(2, std::nullopt, t0).cls == InboundClass::New);
    CHECK(s.observe_inbound(2, std::nullopt, t0).cls == InboundClass::Duplicate);
    CHECK(s.observe_inbound(1, std::nullopt, t0).cls == InboundClass::Duplicate);
    CHECK(s.highest_recv_seq().value_or(0) == 2);

    // skipping ahead jumps the high-water mark; the gap is never filled
    CHECK(s.observe_inbound(5, std::nullopt, t0).cls == InboundClass::OutOfOrder);
    CHECK(s.highest_recv_seq().value_or(0) == 5);
    CHECK(s.classify(3) == InboundClass::Duplicate);
    CHECK(s.classify(6) == InboundClass::New);
}

TEST_CASE("Outbound stamping assigns consecutive sequences and the current ack") {
    const TimePoint t0{};
    Session s(Endpoint{"h", 1}, SessionRole::Requester, SessionPhase::Established, t0);
    s.set_cookie("k");
    s.observe_inbound(7, std::nullopt, t0);

    const TrackingId a = s.register_outbound(chat("a"), t0);
    const Packet     b = s.stamp_unreliable(chat("b"), t0);
    const TrackingId c = s.register_outbound(chat("c"), t0);

    REQUIRE(s.find_inflight(a) != nullptr);
    REQUIRE(s.find_inflight(c) != nullptr);
    CHECK(s.find_inflight(a)->sequence == 1);
    CHECK(packet_sequence(b) == 2);
    CHECK(s.find_inflight(c)->sequence == 3);
    CHECK(s.next_send_seq() == 4);
    CHECK(s.inflight().size() == 2);                  // the unreliable one is not tracked

    const auto& req = std::get<Request>(s.find_inflight(a)->packet);
    CHECK(req.response_ack.value_or(0) == 7);
    CHECK(req.cookie.value_or("") == "k");
}

TEST_CASE("Responses are stamped with request_ack") {
    const TimePoint t0{};
    Session s(Endpoint{"h", 1}, SessionRole::Responder, SessionPhase::Established, t0);

    const TrackingId none = s.register_outbound(ok(), t0);
    CHECK_FALSE(std::get<Response>(s.find_inflight(none)->packet).request_ack.has_value());

    s.observe_inbound(3, std::nullopt, t0);
    const TrackingId some = s.register_outbound(ok(), t0);
    CHECK(std::get<Response>(s.find_inflight(some)->packet).request_ack.value_or(0) == 3);
}

TEST_CASE("Acknowledgment is cumulative and only moves forward") {
    const TimePoint t0{};
    Session s(Endpoint{"h", 1}, SessionRole::Requester, SessionPhase::Established, t0);
    const TrackingId t1 = s.register_outbound(chat("1"), t0);
    const TrackingId t2 = s.register_outbound(chat("2"), t0);
    s.register_outbound(chat("3"), t0);

    auto released = s.acknowledge(2);
    REQUIRE(released.size() == 2);
    CHECK(released[0] == t1);
    CHECK(released[1] == t2);
    CHECK(s.peer_ack_seq() == 2);
    CHECK(s.inflight().size() == 1);

    CHECK(s.acknowledge(1).empty());
    CHECK(s.peer_ack_seq() == 2);

    // an ack piggy-backed on an inbound packet does the same
    auto in = s.observe_inbound(1, uint64_t{3}, t0);
    CHECK(in.released.size() == 1);
    CHECK(s.inflight().empty());
}

TEST_CASE("Retry bookkeeping: due set, retransmit, exhaustion") {
    const TimePoint  t0{};
    const Milliseconds interval(100);
    Session s(Endpoint{"h", 1}, SessionRole::Requester, SessionPhase::Established, t0);

    const TrackingId first  = s.register_outbound(chat("x"), t0);
    const TrackingId second = s.register_outbound(chat("y"), t0 + Milliseconds(50));

    CHECK(s.due_for_retry(t0 + Milliseconds(99), interval).empty());
    auto due = s.due_for_retry(t0 + Milliseconds(100), interval);
    REQUIRE(due.size() == 1);
    CHECK(due[0] == first);

    const auto moved = s.retransmit(first, t0 + Milliseconds(100));
    REQUIRE(moved.has_value());
    CHECK(*moved != first);
    CHECK(s.find_inflight(first) == nullptr);
    CHECK(s.find_inflight(*moved)->sequence == 1);
    CHECK(s.find_inflight(*moved)->retry_count == 1);
    CHECK_FALSE(s.retransmit(first, t0).has_value());  // old id is gone

    due = s.due_for_retry(t0 + Milliseconds(200), interval);
    REQUIRE(due.size() == 2);
    CHECK(due[0] == *moved);                          // ordered by sequence
    CHECK(due[1] == second);

    CHECK(s.exhausted(t0 + Milliseconds(200), interval, 1));
    CHECK_FALSE(s.exhausted(t0 + Milliseconds(199), interval, 1));
    CHECK_FALSE(s.exhausted(t0 + Milliseconds(200), interval, 2));

    auto dropped = s.clear_inflight();
    CHECK(dropped.size() == 2);
    CHECK(s.inflight().empty());
}
