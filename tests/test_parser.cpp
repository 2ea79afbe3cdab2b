#include <doctest/doctest.h>
#include <cstdio>
#include <string>
#include "raet/packer.hpp"
#include "raet/parser.hpp"

using namespace raet;

// Build a JSON head around `fields` with a correct length field.
static std::string frame_head(const std::string& fields) {
    std::string text = std::string("{\"hk\":0,\"hl\":\"00\",") + fields + "}\r\n\r\n";
    char hex[3];
    std::snprintf(hex, sizeof(hex), "%02x", static_cast<unsigned>(text.size()));
    text[14] = hex[0];
    text[15] = hex[1];
    return text;
}

static Packet make_outbound() {
    Packet p = make_packet();
    p.head.set_source_device("alpha");
    p.head.set_dest_device("beta");
    p.head.set_service_kind(ServiceKind::ackretry);
    p.head.set_packet_kind(PacketKind::data);
    p.meta.set_body_kind(BodyKind::json);
    return p;
}

TEST_CASE("Round trip restores head fields and body data") {
    Packet out = make_outbound();
    out.head.set_session_id(42);
    out.head.set_transaction_id(7);
    out.head.set_corresponder(true);
    out.head.set_order_index(3);
    out.head.set_segment_count(2);
    out.head.set_datetime(1700000000.5);
    out.body.data = Value::parse(R"({"a":1,"list":["x","y"],"nested":{"k":null}})");
    std::string wire = pack(out);
    REQUIRE_FALSE(wire.empty());

    Packet in = make_packet(wire);
    auto rest = parse(in);
    REQUIRE(rest.has_value());
    CHECK(rest->empty());
    CHECK(in.meta.error.empty());

    CHECK(in.body.data == out.body.data);
    CHECK(in.body.raw.is_null());
    CHECK(in.head.fields.get_string(tag::source_device) == "alpha");
    CHECK(in.head.fields.get_string(tag::dest_device) == "beta");
    CHECK(in.head.service_kind() == ServiceKind::ackretry);
    CHECK(in.head.packet_kind() == PacketKind::data);
    CHECK(in.head.session_id() == 42);
    CHECK(in.head.transaction_id() == 7);
    CHECK(in.head.corresponder());
    CHECK(in.head.order_index() == 3);
    CHECK(in.head.segment_count() == 2);
    CHECK(in.head.datetime() == doctest::Approx(1700000000.5));
    CHECK(in.head.pack_str() == out.head.pack_str());
}

TEST_CASE("Parsing the ackretry data packet recovers body and service fields") {
    const std::string wire =
        "{\"hk\":0,\"hl\":\"4b\",\"sd\":\"alpha\",\"dd\":\"beta\",\"sk\":1,\"pk\":0,\"bk\":1,\"bl\":7}\r\n\r\n"
        "{\"a\":1}";
    Packet in = make_packet(wire);
    auto rest = parse(in);
    REQUIRE(rest.has_value());
    CHECK(rest->empty());
    CHECK(in.meta.error.empty());
    CHECK(in.body.data == Value::parse(R"({"a":1})"));
    CHECK(in.head.service_kind() == ServiceKind::ackretry);
    CHECK(in.head.packet_kind() == PacketKind::data);
    CHECK(in.meta.head_length() == 75);
    CHECK(in.meta.body_length() == 7);
    CHECK(in.neck.pack.empty());
    CHECK(in.tail.pack.empty());
}

TEST_CASE("Header sync and defaults after parse") {
    Packet in = make_packet(frame_head("\"sd\":1,\"dd\":2,\"sk\":0,\"pk\":1,\"bk\":1,\"bl\":2") + "{}");
    in.meta.set_source_host("10.0.0.9");
    REQUIRE(parse(in).has_value());

    CHECK(in.meta.head_kind() == HeadKind::json);
    CHECK(in.meta.body_kind() == BodyKind::json);
    CHECK(in.meta.neck_kind() == NeckKind::nada);
    CHECK(in.meta.tail_length() == 0);
    CHECK(in.meta.source_host() == "10.0.0.9");
    CHECK(in.meta.dest_host() == "127.0.0.1");
    CHECK(in.meta.dest_port() == DEFAULT_PORT);

    CHECK(in.head.fields.size() == head_defaults().size());
    CHECK(in.head.segment_count() == 1);
    CHECK(in.head.version() == Version::v0_1);
    CHECK(in.head.packet_kind() == PacketKind::req);
}

TEST_CASE("Unknown header tags are ignored") {
    Packet in = make_packet(frame_head("\"sd\":1,\"dd\":2,\"sk\":0,\"pk\":0,\"zz\":5,\"fg\":\"07\",\"bk\":1,\"bl\":2") + "{}");
    REQUIRE(parse(in).has_value());
    CHECK_FALSE(in.head.fields.has("zz"));
    CHECK_FALSE(in.head.fields.has("fg"));
}

TEST_CASE("Unimplemented body kind degrades to unknown without stopping") {
    Packet in = make_packet(frame_head("\"sd\":1,\"dd\":2,\"sk\":0,\"pk\":0,\"bk\":2,\"bl\":3") + "abc");
    auto rest = parse(in);

    REQUIRE(rest.has_value());
    CHECK(rest->empty());  // body bytes were still consumed
    CHECK(in.meta.body_kind() == BodyKind::unknown);
    CHECK(in.meta.body_length() == 0);
    CHECK_FALSE(in.meta.error.empty());
    CHECK(in.report.failed(Stage::parse_body));
    CHECK(in.report.ran(Stage::verify));
}

TEST_CASE("A nada body is not decodable") {
    Packet in = make_packet(frame_head("\"sd\":1,\"dd\":2,\"sk\":0,\"pk\":0"));
    REQUIRE(parse(in).has_value());
    CHECK(in.meta.body_kind() == BodyKind::unknown);
    CHECK(in.meta.error == "Unrecognizible packet body.");
}

TEST_CASE("Unrecognizable head stops before the neck") {
    SUBCASE("no lead") {
        Packet in = make_packet("GET / HTTP/1.1\r\n\r\n");
        CHECK_FALSE(parse(in).has_value());
        CHECK(in.meta.head_kind() == HeadKind::unknown);
        CHECK(in.meta.head_length() == 0);
        CHECK(in.meta.error == "Unrecognizible packet head.");
        CHECK(in.neck.pack.empty());
        CHECK(in.body.pack.empty());
        CHECK(in.body.data.empty());
        CHECK(in.tail.pack.empty());
        CHECK_FALSE(in.report.ran(Stage::parse_neck));
    }
    SUBCASE("no end marker") {
        Packet in = make_packet("{\"hk\":0,\"hl\":\"10\",\"sd\":1");
        CHECK_FALSE(parse(in).has_value());
        CHECK(in.meta.head_kind() == HeadKind::unknown);
        CHECK_FALSE(in.meta.error.empty());
        CHECK(in.head.fields.empty());
    }
    SUBCASE("empty buffer") {
        Packet in = make_packet(std::string());
        CHECK_FALSE(parse(in).has_value());
        CHECK(in.report.last_failure()->kind == ErrorKind::unrecognized_head);
    }
    SUBCASE("head longer than allowed") {
        Packet in = make_packet("{\"hk\":0,\"sd\":\"" + std::string(300, 'x') + "\"}\r\n\r\n");
        CHECK_FALSE(parse(in).has_value());
        CHECK(in.meta.head_length() == 0);
    }
    SUBCASE("not json") {
        Packet in = make_packet("{\"hk\":0,garbage}\r\n\r\n");
        CHECK_FALSE(parse(in).has_value());
        CHECK(in.report.last_failure()->kind == ErrorKind::malformed_head);
    }
}

TEST_CASE("Header length mismatch is reported but parsing continues") {
    std::string head = frame_head("\"sd\":1,\"dd\":2,\"sk\":0,\"pk\":0,\"bk\":1,\"bl\":7");
    head[14] = 'f';
    head[15] = 'f';
    Packet in = make_packet(head + R"({"a":1})");

    auto rest = parse(in);
    REQUIRE(rest.has_value());
    CHECK(in.report.failed(Stage::parse_head));
    CHECK(in.report.find(Stage::parse_head)->kind == ErrorKind::head_length_mismatch);
    CHECK(in.meta.error.find("does not match") != std::string::npos);
    CHECK(in.body.data == Value::parse(R"({"a":1})"));
}

TEST_CASE("Header length field must be exactly two hex digits") {
    SUBCASE("padded string") {
        // low byte of the field equals the real length; the rest must not be dropped
        std::string head = "{\"hk\":0,\"hl\":\"10000000000\",\"sd\":1,\"dd\":2,\"sk\":0,\"pk\":0,\"bk\":1,\"bl\":7}\r\n\r\n";
        char hex[3];
        std::snprintf(hex, sizeof(hex), "%02x", static_cast<unsigned>(head.size()));
        head[23] = hex[0];
        head[24] = hex[1];
        Packet in = make_packet(head + R"({"a":1})");

        REQUIRE(parse(in).has_value());
        CHECK(in.head.length() == -1);
        CHECK(in.report.find(Stage::parse_head)->kind == ErrorKind::head_length_mismatch);
        CHECK(in.body.data == Value::parse(R"({"a":1})"));
    }
    SUBCASE("sign and prefix") {
        for (const char* bad : {"+4", " 4", "0x", "-1"}) {
            Head h;
            h.fields.set(tag::head_length, bad);
            CHECK(h.length() == -1);
        }
    }
    SUBCASE("integer out of range") {
        Head h;
        h.fields.set(tag::head_length, 4294967296ULL + 75);
        CHECK(h.length() == -1);
        h.fields.set(tag::head_length, 256);
        CHECK(h.length() == -1);
        h.fields.set(tag::head_length, 75);
        CHECK(h.length() == 75);
    }
}

TEST_CASE("Header kind mismatch is reported but parsing continues") {
    // duplicate key: the last hk wins in the decoded object
    std::string head = frame_head("\"sd\":1,\"dd\":2,\"sk\":0,\"pk\":0,\"hk\":1,\"bk\":1,\"bl\":2");
    Packet in = make_packet(head + "{}");
    auto rest = parse(in);
    REQUIRE(rest.has_value());
    CHECK(in.report.find(Stage::parse_head)->kind == ErrorKind::head_kind_mismatch);
    CHECK(in.report.ran(Stage::parse_body));
}

TEST_CASE("Huge float lengths in the header read as zero") {
    Packet in = make_packet(frame_head("\"sd\":1,\"dd\":2,\"sk\":0,\"pk\":0,\"bk\":1,\"bl\":1e300") + "{}");
    auto rest = parse(in);
    REQUIRE(rest.has_value());
    CHECK(in.meta.body_length() == 0);
    CHECK(in.body.pack.empty());
    CHECK(*rest == "{}");
}

TEST_CASE("Unknown neck kind consumes its declared bytes and parsing continues") {
    Packet in = make_packet(frame_head("\"sd\":1,\"dd\":2,\"sk\":0,\"pk\":0,\"nk\":1,\"nl\":3,\"bk\":1,\"bl\":7") +
                            "SIG" + R"({"a":1})");
    auto rest = parse(in);

    REQUIRE(rest.has_value());
    CHECK(rest->empty());
    CHECK(in.meta.neck_kind() == NeckKind::unknown);
    CHECK(in.meta.neck_length() == 0);
    CHECK(in.meta.error == "Unrecognizible packet neck.");
    CHECK(in.report.find(Stage::parse_neck)->kind == ErrorKind::unrecognized_neck);
    CHECK(in.body.data == Value::parse(R"({"a":1})"));
}

TEST_CASE("Scalar JSON body lands in raw") {
    Packet out = make_outbound();
    out.body.raw = 5;
    std::string wire = pack(out);

    Packet in = make_packet(wire);
    REQUIRE(parse(in).has_value());
    CHECK(in.body.raw == 5);
    CHECK(in.body.data.empty());
}

TEST_CASE("Undecodable JSON body is reported and kept") {
    Packet in = make_packet(frame_head("\"sd\":1,\"dd\":2,\"sk\":0,\"pk\":0,\"bk\":1,\"bl\":3") + "{x}");
    auto rest = parse(in);
    REQUIRE(rest.has_value());
    CHECK(in.report.find(Stage::parse_body)->kind == ErrorKind::malformed_body);
    CHECK(in.body.pack == "{x}");
    CHECK(in.meta.body_length() == 3);
    CHECK_FALSE(in.meta.error.empty());
}

TEST_CASE("Vouch rejection stops before the body") {
    Packet out = make_outbound();
    out.body.data = Value::parse(R"({"secret":true})");
    std::string wire = pack(out);

    SUBCASE("default message") {
        Validators v;
        v.vouch = [](Meta&, const Head&, const Neck&) { return false; };
        Packet in = make_packet(wire);
        CHECK_FALSE(parse(in, v).has_value());
        CHECK(in.meta.error == "Head failed authentication.");
        CHECK(in.body.pack.empty());
        CHECK(in.body.data.empty());
        CHECK(in.tail.pack.empty());
        CHECK_FALSE(in.report.ran(Stage::parse_body));
        CHECK(in.report.last_failure()->kind == ErrorKind::rejected_head);
    }
    SUBCASE("hook message") {
        Validators v;
        v.vouch = [](Meta& meta, const Head& head, const Neck&) {
            if (head.service_kind() == ServiceKind::ackretry) {
                meta.error = "untrusted sender";
                return false;
            }
            return true;
        };
        Packet in = make_packet(wire);
        CHECK_FALSE(parse(in, v).has_value());
        CHECK(in.meta.error == "untrusted sender");
    }
}

TEST_CASE("Verify rejection discards a fully parsed packet") {
    Packet out = make_outbound();
    out.body.data = Value::parse(R"({"n":2})");
    std::string wire = pack(out);

    bool vouched = false;
    Validators v;
    v.vouch = [&vouched](Meta&, const Head&, const Neck&) { vouched = true; return true; };
    v.verify = [](Meta&, const Body& body, const Tail&) { return body.data.value("n", 0) == 1; };

    Packet in = make_packet(wire);
    CHECK_FALSE(parse(in, v).has_value());
    CHECK(vouched);
    CHECK(in.report.ran(Stage::parse_tail));
    CHECK(in.report.last_failure()->kind == ErrorKind::rejected_body);
    CHECK(in.meta.error == "Body failed verification.");
}

TEST_CASE("Trailing bytes are returned as the remainder") {
    Packet out = make_outbound();
    out.body.data = Value::parse(R"({"a":1})");
    std::string wire = pack(out);

    Packet in = make_packet(wire + "NEXT");
    auto rest = parse(in);
    REQUIRE(rest.has_value());
    CHECK(*rest == "NEXT");
    CHECK(in.pack == "NEXT");
    CHECK(in.body.data == Value::parse(R"({"a":1})"));
}

TEST_CASE("Stages run in head, neck, vouch, body, tail, verify order") {
    Packet out = make_outbound();
    Packet in = make_packet(pack(out));
    REQUIRE(parse(in).has_value());
    REQUIRE(in.report.size() == 6);
    CHECK(in.report[0].stage == Stage::parse_head);
    CHECK(in.report[1].stage == Stage::parse_neck);
    CHECK(in.report[2].stage == Stage::vouch);
    CHECK(in.report[3].stage == Stage::parse_body);
    CHECK(in.report[4].stage == Stage::parse_tail);
    CHECK(in.report[5].stage == Stage::verify);
    CHECK(in.report.all_ok());
}
