#include <doctest/doctest.h>
#include <cstdlib>
#include <string>
#include "raet/packer.hpp"

using namespace raet;

static Packet make_addressed_packet() {
    Packet p = make_packet();
    p.head.set_source_device("alpha");
    p.head.set_dest_device("beta");
    p.head.set_service_kind(ServiceKind::ackretry);
    p.head.set_packet_kind(PacketKind::data);
    return p;
}

static std::string head_text(const Packet& p) { return p.head.pack_str(); }

TEST_CASE("Ackretry data packet with a JSON body packs to the expected bytes") {
    Packet p = make_addressed_packet();
    p.meta.set_body_kind(BodyKind::json);
    p.body.data = Value::parse(R"({"a":1})");

    std::string wire = pack(p);

    const std::string head =
        "{\"hk\":0,\"hl\":\"4b\",\"sd\":\"alpha\",\"dd\":\"beta\",\"sk\":1,\"pk\":0,\"bk\":1,\"bl\":7}\r\n\r\n";
    CHECK(head_text(p) == head);
    CHECK(p.body.pack == R"({"a":1})");
    CHECK(p.neck.pack.empty());
    CHECK(p.tail.pack.empty());
    CHECK(wire == head + R"({"a":1})");
    CHECK(p.pack == wire);
    CHECK(p.meta.error.empty());
}

TEST_CASE("Header always starts with the JSON head lead") {
    Packet p = make_packet();
    pack(p);
    CHECK(head_text(p).rfind(JSON_HEAD_LEAD, 0) == 0);
    CHECK(head_text(p).substr(head_text(p).size() - HEAD_END_LENGTH) == HEAD_END);
}

TEST_CASE("Default-valued fields are elided, others emitted") {
    Packet p = make_addressed_packet();
    p.head.set_session_id(0);
    p.head.set_segment_count(1);
    p.head.set_transaction_id(12);
    p.head.set_burst(true);

    pack(p);
    const std::string h = head_text(p);
    CHECK(h.find("\"si\"") == std::string::npos);
    CHECK(h.find("\"sc\"") == std::string::npos);
    CHECK(h.find("\"vn\"") == std::string::npos);
    CHECK(h.find("\"ti\":12") != std::string::npos);
    CHECK(h.find("\"bf\":1") != std::string::npos);
}

TEST_CASE("Mandatory fields are emitted even without a value") {
    Packet p = make_packet();
    pack(p);
    const std::string h = head_text(p);
    CHECK(h.find("\"sd\":null") != std::string::npos);
    CHECK(h.find("\"dd\":null") != std::string::npos);
    CHECK(h.find("\"sk\":null") != std::string::npos);
    CHECK(h.find("\"pk\":null") != std::string::npos);
}

TEST_CASE("Part lengths match the packed parts") {
    Packet p = make_addressed_packet();
    p.meta.set_body_kind(BodyKind::json);
    p.body.data = Value::parse(R"({"msg":"hello","n":[1,2,3]})");

    pack(p);
    CHECK(p.meta.head_length() == p.head.pack.size());
    CHECK(p.meta.neck_length() == p.neck.pack.size());
    CHECK(p.meta.body_length() == p.body.pack.size());
    CHECK(p.meta.tail_length() == p.tail.pack.size());
    CHECK(p.head.fields.get_uint(tag::body_length) == p.body.pack.size());
}

TEST_CASE("Length field is patched with the real header length") {
    Packet p = make_addressed_packet();
    p.head.set_datetime(1700000000.25);
    pack(p);

    const std::string h = head_text(p);
    const std::string lead = "{\"hk\":0,\"hl\":\"";
    REQUIRE(h.compare(0, lead.size(), lead) == 0);
    const std::string hex = h.substr(lead.size(), 2);
    CHECK(std::strtoul(hex.c_str(), nullptr, 16) == h.size());
    CHECK(hex == p.head.fields.get_string(tag::head_length));
    CHECK(p.head.length() == static_cast<int32_t>(h.size()));
}

TEST_CASE("Header of exactly 255 bytes packs, one more byte fails") {
    Packet sizing = make_addressed_packet();
    sizing.head.set_source_device("");
    pack(sizing);
    const size_t base = sizing.head.pack.size();
    REQUIRE(base < MAX_HEAD_LENGTH);

    Packet fits = make_addressed_packet();
    fits.head.set_source_device(std::string(MAX_HEAD_LENGTH - base, 'x'));
    std::string wire = pack(fits);
    CHECK(fits.head.pack.size() == MAX_HEAD_LENGTH);
    CHECK(fits.meta.head_length() == MAX_HEAD_LENGTH);
    CHECK(fits.meta.error.empty());
    CHECK_FALSE(wire.empty());
    CHECK(fits.head.fields.get_string(tag::head_length) == "ff");

    Packet over = make_addressed_packet();
    over.head.set_source_device(std::string(MAX_HEAD_LENGTH - base + 1, 'x'));
    wire = pack(over);
    CHECK(wire.empty());
    CHECK(over.pack.empty());
    CHECK(over.head.pack.empty());
    CHECK(over.meta.head_length() == 0);
    CHECK_FALSE(over.meta.error.empty());
    CHECK(over.report.failed(Stage::pack_head));
    CHECK(over.report.last_failure()->kind == ErrorKind::head_too_long);
    CHECK_FALSE(over.report.ran(Stage::pack_neck));
}

TEST_CASE("Only the JSON head kind can be packed") {
    Packet p = make_addressed_packet();
    p.head.set_kind(HeadKind::binary);
    CHECK(pack(p).empty());
    CHECK(p.report.last_failure()->kind == ErrorKind::unrecognized_head);
    CHECK(p.meta.error == "Unrecognizible packet head.");

    Packet bare;  // no head kind at all
    CHECK(pack(bare).empty());
}

TEST_CASE("Unimplemented body kind still produces a packet with an unknown body") {
    Packet p = make_addressed_packet();
    p.meta.set_body_kind(BodyKind::binary);
    p.body.data = Value::parse(R"({"a":1})");

    std::string wire = pack(p);
    CHECK_FALSE(wire.empty());
    CHECK(p.meta.body_kind() == BodyKind::unknown);
    CHECK(p.meta.body_length() == 0);
    CHECK(p.body.pack.empty());
    CHECK(p.meta.error == "Unrecognizible packet body.");
    CHECK(head_text(p).find("\"bk\":255") != std::string::npos);
}

TEST_CASE("Raw body takes precedence over data") {
    Packet p = make_addressed_packet();
    p.meta.set_body_kind(BodyKind::json);
    p.body.data = Value::parse(R"({"ignored":true})");
    p.body.raw = "plain";
    pack(p);
    CHECK(p.body.pack == "\"plain\"");
}

TEST_CASE("Stages run in body, tail, head, neck order") {
    Packet p = make_addressed_packet();
    pack(p);
    REQUIRE(p.report.size() == 4);
    CHECK(p.report[0].stage == Stage::pack_body);
    CHECK(p.report[1].stage == Stage::pack_tail);
    CHECK(p.report[2].stage == Stage::pack_head);
    CHECK(p.report[3].stage == Stage::pack_neck);
    CHECK(p.report.all_ok());
}

TEST_CASE("Each pack call starts with a clean error") {
    Packet p = make_addressed_packet();
    p.meta.set_body_kind(BodyKind::binary);
    pack(p);
    CHECK_FALSE(p.meta.error.empty());

    p.meta.set_body_kind(BodyKind::json);
    pack(p);
    CHECK(p.meta.error.empty());
}
