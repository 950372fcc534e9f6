#include <gtest/gtest.h>
#include <respkv/error.hpp>
#include <respkv/proto/frame.hpp>
#include <string>

using namespace respkv;

namespace {

    CheckResult check_str(const std::string& s, std::size_t* consumed = nullptr) {
        Cursor c(s.data(), s.size());
        auto r = check(c);
        if (consumed) *consumed = c.pos;
        return r;
    }

    Frame parse_str(const std::string& s, std::size_t* consumed = nullptr) {
        Cursor c(s.data(), s.size());
        EXPECT_EQ(check(c), CheckResult::Complete);
        Cursor p(s.data(), s.size());
        auto f = parse(p);
        EXPECT_EQ(p.pos, c.pos);
        if (consumed) *consumed = p.pos;
        return f;
    }

} // namespace

// ---------- encoding

TEST(FrameEncode, Scalars) {
    EXPECT_EQ(encode(Frame::simple("OK")), "+OK\r\n");
    EXPECT_EQ(encode(Frame::error("ERR unknown command 'foobar'")), "-ERR unknown command 'foobar'\r\n");
    EXPECT_EQ(encode(Frame::integer_of(1000)), ":1000\r\n");
    EXPECT_EQ(encode(Frame::bulk("foo")), "$3\r\nfoo\r\n");
    EXPECT_EQ(encode(Frame::bulk("")), "$0\r\n\r\n");
    EXPECT_EQ(encode(Frame::null()), "$-1\r\n");
}

TEST(FrameEncode, NestedArray) {
    auto f = Frame::array_of({
        Frame::bulk("SET"),
        Frame::array_of({ Frame::integer_of(1), Frame::null() }),
        Frame::array_of({}),
    });
    EXPECT_EQ(encode(f), "*3\r\n$3\r\nSET\r\n*2\r\n:1\r\n$-1\r\n*0\r\n");
}

TEST(FrameEncode, BulkIsBinarySafe) {
    std::string payload("a\r\n\0b", 5);
    auto wire = encode(Frame::bulk(payload));
    EXPECT_EQ(wire, std::string("$5\r\na\r\n\0b\r\n", 11));
    EXPECT_EQ(parse_str(wire), Frame::bulk(payload));
}

// ---------- parsing

TEST(FrameParse, EachVariant) {
    EXPECT_EQ(parse_str("+OK\r\n"), Frame::simple("OK"));
    EXPECT_EQ(parse_str("-ERR boom\r\n"), Frame::error("ERR boom"));
    EXPECT_EQ(parse_str(":18446744073709551615\r\n"), Frame::integer_of(18446744073709551615ull));
    EXPECT_EQ(parse_str("$6\r\nfoobar\r\n"), Frame::bulk("foobar"));
    EXPECT_EQ(parse_str("$-1\r\n"), Frame::null());
    EXPECT_EQ(parse_str("*-1\r\n"), Frame::null());
    EXPECT_EQ(parse_str("*2\r\n$3\r\nfoo\r\n$3\r\nbar\r\n"),
        Frame::array_of({ Frame::bulk("foo"), Frame::bulk("bar") }));
}

TEST(FrameParse, RoundTrip) {
    std::vector<Frame> frames = {
        Frame::simple("PONG"),
        Frame::simple(""),
        Frame::error("ERR syntax error"),
        Frame::integer_of(0),
        Frame::integer_of(42),
        Frame::bulk("hello world"),
        Frame::bulk(""),
        Frame::null(),
        Frame::array_of({ Frame::bulk("GET"), Frame::bulk("k") }),
        Frame::array_of({ Frame::simple("x"), Frame::array_of({ Frame::integer_of(7) }) }),
    };
    for (auto& f : frames) {
        EXPECT_EQ(parse_str(encode(f)), f) << f;
    }
}

TEST(FrameParse, ConsumesExactlyOneFrame) {
    std::string wire = "+OK\r\n*1\r\n$4\r\nPING\r\n";
    std::size_t consumed = 0;
    EXPECT_EQ(parse_str(wire, &consumed), Frame::simple("OK"));
    EXPECT_EQ(consumed, 5u);

    Cursor c(wire.data() + consumed, wire.size() - consumed);
    EXPECT_EQ(check(c), CheckResult::Complete);
    EXPECT_EQ(c.pos, wire.size() - consumed);
}

TEST(FrameParse, Utf8Lines) {
    EXPECT_EQ(parse_str("+caf\xc3\xa9\r\n"), Frame::simple("caf\xc3\xa9"));

    std::string bad = "+\xff\xfe\r\n";
    Cursor c(bad.data(), bad.size());
    EXPECT_EQ(check(c), CheckResult::Complete);
    Cursor p(bad.data(), bad.size());
    EXPECT_THROW(parse(p), ProtocolError);

    std::string truncated_seq = "-\xc3\r\n";
    Cursor p2(truncated_seq.data(), truncated_seq.size());
    EXPECT_THROW(parse(p2), ProtocolError);
}

// ---------- incompleteness

TEST(FrameCheck, EveryStrictPrefixIsIncomplete) {
    auto wire = encode(Frame::array_of({
        Frame::bulk("SET"), Frame::bulk("key"), Frame::bulk("value"),
        Frame::simple("EX"), Frame::integer_of(10), Frame::null() }));
    for (std::size_t n = 0; n < wire.size(); ++n) {
        EXPECT_EQ(check_str(wire.substr(0, n)), CheckResult::Incomplete) << "prefix length " << n;
    }
    std::size_t consumed = 0;
    EXPECT_EQ(check_str(wire, &consumed), CheckResult::Complete);
    EXPECT_EQ(consumed, wire.size());
}

TEST(FrameCheck, LoneCarriageReturnIsIncomplete) {
    EXPECT_EQ(check_str("+OK\r"), CheckResult::Incomplete);
    EXPECT_EQ(check_str("$3\r\nfoo\r"), CheckResult::Incomplete);
}

TEST(FrameParse, TruncationAfterCheckIsProtocolError) {
    std::string s = "$10\r\nabc";
    Cursor c(s.data(), s.size());
    EXPECT_THROW(parse(c), ProtocolError);
}

// ---------- malformed input

TEST(FrameCheck, MalformedInputThrows) {
    EXPECT_THROW(check_str("?what\r\n"), ProtocolError);
    EXPECT_THROW(check_str(":12a\r\n"), ProtocolError);
    EXPECT_THROW(check_str(":-5\r\n"), ProtocolError);
    EXPECT_THROW(check_str(":\r\n"), ProtocolError);
    EXPECT_THROW(check_str(":99999999999999999999\r\n"), ProtocolError);
    EXPECT_THROW(check_str("$x\r\n"), ProtocolError);
    EXPECT_THROW(check_str("$-2\r\n"), ProtocolError);
    EXPECT_THROW(check_str("$3\r\nfooXY"), ProtocolError);
    EXPECT_THROW(check_str("*abc\r\n"), ProtocolError);
    EXPECT_THROW(check_str("*1\r\n!\r\n"), ProtocolError);
}

TEST(FrameCheck, LimitsAreEnforced) {
    EXPECT_THROW(check_str("$" + std::to_string(MAX_BULK_LEN + 1) + "\r\n"), ProtocolError);
    EXPECT_THROW(check_str("*" + std::to_string(MAX_ARRAY_COUNT + 1) + "\r\n"), ProtocolError);

    std::string deep;
    for (std::size_t i = 0; i < MAX_FRAME_DEPTH + 2; ++i) deep += "*1\r\n";
    deep += ":1\r\n";
    EXPECT_THROW(check_str(deep), ProtocolError);
}
