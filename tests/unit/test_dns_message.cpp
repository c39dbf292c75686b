#include <catch2/catch_test_macros.hpp>

#include "network/dns_message.hpp"

using namespace datlan;
using namespace datlan::network;

namespace {

DnsName name_of(std::string_view text) {
    return DnsName::from_ascii(text).unwrap();
}

QByteArray bytes(std::initializer_list<int> values) {
    QByteArray out;
    for (int v : values) out.append(static_cast<char>(v));
    return out;
}

// Header with the given flags and section counts.
QByteArray header(uint16_t flags, uint16_t qd, uint16_t an, uint16_t ns = 0, uint16_t ar = 0) {
    return bytes({0, 0, flags >> 8, flags & 0xFF,
                  qd >> 8, qd & 0xFF, an >> 8, an & 0xFF,
                  ns >> 8, ns & 0xFF, ar >> 8, ar & 0xFF});
}

} // namespace

TEST_CASE("DNS name: parses dotted text", "[unit][dns]") {
    const auto name = name_of("abc.dat.local");
    REQUIRE(name.labels() == std::vector<std::string>{"abc", "dat", "local"});
    REQUIRE(name.to_string() == "abc.dat.local");
    REQUIRE(name.wire_length() == 15);

    REQUIRE(name_of("abc.dat.local.") == name);
    REQUIRE(name_of(".").is_root());
    REQUIRE(name_of(".").to_string() == ".");
}

TEST_CASE("DNS name: rejects invalid text", "[unit][dns]") {
    REQUIRE(DnsName::from_ascii("").unwrap_err().code == ErrorCode::InvalidName);
    REQUIRE(DnsName::from_ascii("a..b").is_err());
    REQUIRE(DnsName::from_ascii(".a").is_err());
    REQUIRE(DnsName::from_ascii("a b.local").is_err());
    REQUIRE(DnsName::from_ascii("caf\xC3\xA9.local").is_err());
    REQUIRE(DnsName::from_ascii(std::string(64, 'x') + ".local").is_err());
    REQUIRE(DnsName::from_ascii(std::string(63, 'x') + ".local").is_ok());
}

TEST_CASE("DNS name: total wire length is capped at 255", "[unit][dns]") {
    // 4 * (1 + 62) + 1 = 253 fits, one more label does not.
    const std::string label(62, 'a');
    const auto fits = label + '.' + label + '.' + label + '.' + label;
    REQUIRE(DnsName::from_ascii(fits).is_ok());
    REQUIRE(DnsName::from_ascii(fits + ".bb").is_err());
}

TEST_CASE("DNS name: comparison folds ASCII case only", "[unit][dns]") {
    REQUIRE(name_of("ABC.Dat.LOCAL").equals_ignore_case(name_of("abc.dat.local")));
    REQUIRE_FALSE(name_of("abc.dat.local").equals_ignore_case(name_of("abc.dat")));
    REQUIRE_FALSE(name_of("abd.dat.local").equals_ignore_case(name_of("abc.dat.local")));
    REQUIRE_FALSE(name_of("ABC.dat.local") == name_of("abc.dat.local"));
}

TEST_CASE("DNS message: serializes a TXT question", "[unit][dns]") {
    DnsMessage message;
    message.questions.push_back(DnsQuestion{name_of("a.b"), RecordType::TXT, CLASS_IN});

    const auto encoded = serialize_message(message).unwrap();

    REQUIRE(encoded == header(0x0000, 1, 0)
                       + bytes({1, 'a', 1, 'b', 0, 0x00, 0x10, 0x00, 0x01}));
}

TEST_CASE("DNS message: response sets QR and AA bits", "[unit][dns]") {
    DnsMessage message;
    message.type = MessageType::Response;
    message.authoritative = true;
    DnsRecord record;
    record.name = name_of("a.b");
    record.type = RecordType::TXT;
    record.ttl = 120;
    record.txt = {QByteArray("x=1")};
    message.answers.push_back(record);

    const auto encoded = serialize_message(message).unwrap();

    REQUIRE(encoded.left(12) == header(0x8400, 0, 1));
    REQUIRE(encoded.mid(12) == bytes({1, 'a', 1, 'b', 0, 0x00, 0x10, 0x00, 0x01,
                                      0x00, 0x00, 0x00, 120, 0x00, 0x04, 3, 'x', '=', '1'}));

    const auto parsed = parse_message(encoded).unwrap();
    REQUIRE(parsed.type == MessageType::Response);
    REQUIRE(parsed.authoritative);
    REQUIRE_FALSE(parsed.truncated);
    REQUIRE(parsed.answers.size() == 1);
    REQUIRE(parsed.answers[0].type == RecordType::TXT);
    REQUIRE(parsed.answers[0].ttl == 120);
    REQUIRE(parsed.answers[0].txt == std::vector<QByteArray>{"x=1"});
}

TEST_CASE("DNS message: reads truncation and rcode", "[unit][dns]") {
    const auto raw = header(0x0203, 1, 0)
        + bytes({1, 'q', 0, 0x00, 0x10, 0x00, 0x01});

    const auto parsed = parse_message(raw).unwrap();
    REQUIRE(parsed.type == MessageType::Query);
    REQUIRE(parsed.opcode == 0);
    REQUIRE(parsed.truncated);
    REQUIRE(parsed.rcode == 3);
    REQUIRE(parsed.questions.size() == 1);
    REQUIRE(parsed.questions[0].name == name_of("q"));
    REQUIRE(parsed.questions[0].type == RecordType::TXT);
}

TEST_CASE("DNS message: follows compression pointers", "[unit][dns]") {
    // Answer name points back at the question name at offset 12.
    const auto raw = header(0x8400, 1, 1)
        + bytes({3, 'a', 'b', 'c', 3, 'd', 'a', 't', 5, 'l', 'o', 'c', 'a', 'l', 0,
                 0x00, 0x10, 0x00, 0x01})
        + bytes({0xC0, 0x0C, 0x00, 0x10, 0x00, 0x01, 0, 0, 0, 120, 0x00, 0x04,
                 3, 'k', '=', 'v'});

    const auto parsed = parse_message(raw);
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.unwrap().answers.size() == 1);
    REQUIRE(parsed.unwrap().answers[0].name == name_of("abc.dat.local"));
    REQUIRE(parsed.unwrap().answers[0].txt == std::vector<QByteArray>{"k=v"});
}

TEST_CASE("DNS message: follows a pointer after leading labels", "[unit][dns]") {
    // Question "dat.local" at 12, answer "abc" + pointer to it.
    const auto raw = header(0x8000, 1, 1)
        + bytes({3, 'd', 'a', 't', 5, 'l', 'o', 'c', 'a', 'l', 0, 0x00, 0x10, 0x00, 0x01})
        + bytes({3, 'a', 'b', 'c', 0xC0, 0x0C, 0x00, 0x10, 0x00, 0x01, 0, 0, 0, 0, 0x00, 0x01, 0});

    const auto parsed = parse_message(raw).unwrap();
    REQUIRE(parsed.answers[0].name == name_of("abc.dat.local"));
    REQUIRE(parsed.answers[0].txt.empty());
}

TEST_CASE("DNS message: rejects self-referencing and forward pointers", "[unit][dns]") {
    const auto self_loop = header(0, 1, 0) + bytes({0xC0, 0x0C, 0x00, 0x10, 0x00, 0x01});
    REQUIRE(parse_message(self_loop).unwrap_err().code == ErrorCode::MalformedMessage);

    const auto forward = header(0, 1, 0) + bytes({0xC0, 0x12, 0x00, 0x10, 0x00, 0x01, 1, 'a', 0});
    REQUIRE(parse_message(forward).is_err());

    // Two names pointing at each other.
    const auto ping_pong = header(0, 2, 0)
        + bytes({0xC0, 0x12, 0x00, 0x10, 0x00, 0x01})
        + bytes({0xC0, 0x0C, 0x00, 0x10, 0x00, 0x01});
    REQUIRE(parse_message(ping_pong).is_err());
}

TEST_CASE("DNS message: rejects truncated input", "[unit][dns]") {
    REQUIRE(parse_message(QByteArray()).unwrap_err().code == ErrorCode::MalformedMessage);
    REQUIRE(parse_message(QByteArray(11, '\0')).is_err());

    // Question count says one, body is empty.
    REQUIRE(parse_message(header(0, 1, 0)).is_err());
    // Every section count at its maximum, no body.
    REQUIRE(parse_message(header(0x8000, 0xFFFF, 0xFFFF, 0xFFFF, 0xFFFF)).unwrap_err().code
            == ErrorCode::MalformedMessage);
    // Label length runs past the end.
    REQUIRE(parse_message(header(0, 1, 0) + bytes({5, 'a', 'b'})).is_err());
    // Question without type/class.
    REQUIRE(parse_message(header(0, 1, 0) + bytes({1, 'a', 0, 0x00})).is_err());
    // rdlength larger than what follows.
    REQUIRE(parse_message(header(0x8000, 0, 1)
                          + bytes({0, 0x00, 0x10, 0x00, 0x01, 0, 0, 0, 0, 0x00, 0x09, 1, 'a'}))
                .is_err());
}

TEST_CASE("DNS message: rejects reserved label types", "[unit][dns]") {
    REQUIRE(parse_message(header(0, 1, 0) + bytes({0x40, 0x00, 0x00, 0x10, 0x00, 0x01})).is_err());
    REQUIRE(parse_message(header(0, 1, 0) + bytes({0x80, 0x00, 0x00, 0x10, 0x00, 0x01})).is_err());
}

TEST_CASE("DNS message: empty message round trips", "[unit][dns]") {
    const auto encoded = serialize_message(DnsMessage{}).unwrap();
    REQUIRE(encoded == header(0, 0, 0));

    const auto parsed = parse_message(encoded).unwrap();
    REQUIRE(parsed.questions.empty());
    REQUIRE(parsed.answers.empty());
}

TEST_CASE("DNS message: TXT strings keep their order", "[unit][dns][txt]") {
    DnsMessage message;
    message.type = MessageType::Response;
    DnsRecord record;
    record.name = name_of("abc.dat.local");
    record.type = RecordType::TXT;
    record.ttl = 120;
    record.txt = {QByteArray("token=abc"), QByteArray("peers=AAAAABtY")};
    message.answers.push_back(record);

    const auto encoded = serialize_message(message).unwrap();
    REQUIRE(encoded.contains(QByteArray("\x09token=abc\x0epeers=AAAAABtY")));

    const auto parsed = parse_message(encoded).unwrap();
    REQUIRE(parsed.answers[0].txt
            == std::vector<QByteArray>{"token=abc", "peers=AAAAABtY"});
}

TEST_CASE("DNS message: A records carry the address", "[unit][dns]") {
    DnsMessage message;
    message.type = MessageType::Response;
    DnsRecord record;
    record.name = name_of("host.local");
    record.type = RecordType::A;
    record.ttl = 120;
    record.address = QHostAddress(QStringLiteral("10.0.0.7"));
    message.additionals.push_back(record);

    const auto encoded = serialize_message(message).unwrap();
    REQUIRE(encoded.endsWith(bytes({0x00, 0x04, 10, 0, 0, 7})));

    const auto parsed = parse_message(encoded).unwrap();
    REQUIRE(parsed.additionals.size() == 1);
    REQUIRE(parsed.additionals[0].type == RecordType::A);
    REQUIRE(parsed.additionals[0].address == QHostAddress(QStringLiteral("10.0.0.7")));
}

TEST_CASE("DNS message: refuses records it cannot write", "[unit][dns]") {
    DnsMessage oversized;
    DnsRecord txt;
    txt.name = name_of("a.b");
    txt.type = RecordType::TXT;
    txt.txt = {QByteArray(256, 'x')};
    oversized.answers.push_back(txt);
    REQUIRE(serialize_message(oversized).unwrap_err().code == ErrorCode::InvalidArgument);

    oversized.answers[0].txt = {QByteArray(255, 'x')};
    REQUIRE(serialize_message(oversized).is_ok());

    DnsMessage srv;
    DnsRecord record;
    record.name = name_of("a.b");
    record.type = RecordType::SRV;
    srv.answers.push_back(record);
    REQUIRE(serialize_message(srv).unwrap_err().code == ErrorCode::InvalidArgument);
}
