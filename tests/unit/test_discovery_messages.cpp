#include <catch2/catch_test_macros.hpp>

#include "network/discovery_messages.hpp"

using namespace datlan;
using namespace datlan::network;

namespace {

const std::vector<uint8_t> kKey(32, 0x5A);

} // namespace

TEST_CASE("Discovery messages: question asks for TXT/IN", "[unit][discovery]") {
    const auto name = DnsName::from_ascii("abc.dat.local").unwrap();
    const auto message = build_question(name);

    REQUIRE(message.type == MessageType::Query);
    REQUIRE(message.id == 0);
    REQUIRE(message.questions.size() == 1);
    REQUIRE(message.questions[0].name == name);
    REQUIRE(message.questions[0].type == RecordType::TXT);
    REQUIRE(message.questions[0].qclass == CLASS_IN);
    REQUIRE(message.answers.empty());
}

TEST_CASE("Discovery messages: answer echoes the question and carries one TXT record",
          "[unit][discovery]") {
    const auto name = DnsName::from_ascii("abc.dat.local").unwrap();
    PeerRecord local;
    local.port = 7000;
    local.token = QStringLiteral("tok-A");

    const auto message = build_answer(name, local).unwrap();

    REQUIRE(message.type == MessageType::Response);
    REQUIRE(message.authoritative);
    REQUIRE(message.questions.size() == 1);
    REQUIRE(message.questions[0].name == name);
    REQUIRE(message.answers.size() == 1);

    const auto& answer = message.answers[0];
    REQUIRE(answer.name == name);
    REQUIRE(answer.type == RecordType::TXT);
    REQUIRE(answer.ttl == ANSWER_TTL_SECONDS);
    REQUIRE(answer.txt
            == std::vector<QByteArray>{"token=tok-A", "peers=AAAAABtY"});
}

TEST_CASE("Discovery messages: oversized token cannot be announced", "[unit][discovery]") {
    const auto name = DnsName::from_ascii("abc.dat.local").unwrap();
    PeerRecord local;
    local.token = QString(300, QLatin1Char('x'));

    REQUIRE(build_answer(name, local).is_err());
}

TEST_CASE("Rendezvous session: derives name, local record and templates", "[unit][discovery]") {
    auto session = RendezvousSession::create(kKey, 7000, QStringLiteral("tok-A"));
    REQUIRE(session.is_ok());
    const auto& s = session.unwrap();

    std::string expected_name;
    for (int i = 0; i < 20; ++i) expected_name += "5a";
    REQUIRE(s.name().to_string() == expected_name + ".dat.local");

    REQUIRE(s.local().address == QHostAddress(QHostAddress::AnyIPv4));
    REQUIRE(s.local().port == 7000);
    REQUIRE(s.local().token == QStringLiteral("tok-A"));

    REQUIRE(s.question_bytes() == serialize_message(build_question(s.name())).unwrap());
    REQUIRE(s.answer_bytes()
            == serialize_message(build_answer(s.name(), s.local()).unwrap()).unwrap());
}

TEST_CASE("Rendezvous session: answer template parses back to the local record",
          "[unit][discovery]") {
    const auto session = RendezvousSession::create(kKey, 8000, QStringLiteral("tok-B")).unwrap();

    const auto parsed = parse_message(session.answer_bytes()).unwrap();
    REQUIRE(parsed.type == MessageType::Response);
    REQUIRE(parsed.questions[0].name == session.name());

    const auto& fields = parsed.answers[0].txt;
    REQUIRE(decode_peer_record(fields).unwrap() == session.local());
}

TEST_CASE("Rendezvous session: rejects empty token and short key", "[unit][discovery]") {
    const auto no_token = RendezvousSession::create(kKey, 7000, QString());
    REQUIRE(no_token.is_err());
    REQUIRE(no_token.unwrap_err().code == ErrorCode::InvalidArgument);

    const auto short_key = RendezvousSession::create(std::vector<uint8_t>(8, 1), 7000,
                                                     QStringLiteral("tok"));
    REQUIRE(short_key.is_err());
    REQUIRE(short_key.unwrap_err().code == ErrorCode::InvalidName);
}
