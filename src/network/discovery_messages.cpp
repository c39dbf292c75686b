#include "network/discovery_messages.hpp"

#include "network/rendezvous_name.hpp"

namespace datlan::network {

DnsMessage build_question(const DnsName& name) {
    DnsMessage message;
    message.type = MessageType::Query;

    DnsQuestion question;
    question.name = name;
    question.type = RecordType::TXT;
    question.qclass = CLASS_IN;
    message.questions.push_back(std::move(question));

    return message;
}

Result<DnsMessage, Error> build_answer(const DnsName& name, const PeerRecord& local) {
    auto fields = encode_txt_fields(local);
    for (const auto& field : fields) {
        if (static_cast<size_t>(field.size()) > MAX_TXT_STRING_LENGTH) {
            return Result<DnsMessage, Error>::err(
                Error{"TXT entry longer than 255 bytes", ErrorCode::InvalidArgument});
        }
    }

    auto message = build_question(name);
    message.type = MessageType::Response;
    message.authoritative = true;

    DnsRecord record;
    record.name = name;
    record.type = RecordType::TXT;
    record.rclass = CLASS_IN;
    record.ttl = ANSWER_TTL_SECONDS;
    record.txt = std::move(fields);
    message.answers.push_back(std::move(record));

    return Result<DnsMessage, Error>::ok(std::move(message));
}

Result<RendezvousSession, Error> RendezvousSession::create(
    const std::vector<uint8_t>& discovery_key,
    uint16_t port,
    const QString& token)
{
    if (token.isEmpty()) {
        return Result<RendezvousSession, Error>::err(
            Error{"local token must not be empty", ErrorCode::InvalidArgument});
    }

    auto name = derive_rendezvous_name(discovery_key);
    if (name.is_err()) {
        return Result<RendezvousSession, Error>::err(name.unwrap_err());
    }

    RendezvousSession session;
    session.name_ = std::move(name).unwrap();
    session.local_.address = QHostAddress(QHostAddress::AnyIPv4);
    session.local_.port = port;
    session.local_.token = token;

    auto question = serialize_message(build_question(session.name_));
    if (question.is_err()) {
        return Result<RendezvousSession, Error>::err(question.unwrap_err());
    }

    auto answer = build_answer(session.name_, session.local_)
        .and_then([](const DnsMessage& message) { return serialize_message(message); });
    if (answer.is_err()) {
        return Result<RendezvousSession, Error>::err(answer.unwrap_err());
    }

    session.question_bytes_ = std::move(question).unwrap();
    session.answer_bytes_ = std::move(answer).unwrap();
    return Result<RendezvousSession, Error>::ok(std::move(session));
}

} // namespace datlan::network
