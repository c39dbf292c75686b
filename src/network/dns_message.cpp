#include "network/dns_message.hpp"

#include <ares.h>

#include <QtEndian>

#include <memory>

namespace datlan::network {
namespace {

struct AresRecordDeleter {
    void operator()(ares_dns_record_t* record) const { ares_dns_record_destroy(record); }
};
using AresRecordPtr = std::unique_ptr<ares_dns_record_t, AresRecordDeleter>;

struct AresBufferDeleter {
    void operator()(unsigned char* buf) const { ares_free_string(buf); }
};
using AresBufferPtr = std::unique_ptr<unsigned char, AresBufferDeleter>;

Error ares_error(const std::string& what, ares_status_t status, ErrorCode code) {
    return Error{what + ": " + ares_strerror(status), code};
}

char fold(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

std::string wire_text(const DnsName& name) {
    return name.is_root() ? std::string(".") : name.to_string();
}

// c-ares hands names back without the trailing dot, the root as "".
Result<DnsName, Error> name_from_wire(const char* text) {
    if (text == nullptr || *text == '\0') {
        return Result<DnsName, Error>::ok(DnsName{});
    }
    auto name = DnsName::from_ascii(text);
    if (name.is_err()) {
        return Result<DnsName, Error>::err(
            Error{"undecodable name: " + name.unwrap_err().message, ErrorCode::MalformedMessage});
    }
    return name;
}

Result<void, Error> write_record(ares_dns_record_t* out,
                                 ares_dns_section_t section,
                                 const DnsRecord& record) {
    if (record.type != RecordType::TXT && record.type != RecordType::A) {
        return Result<void, Error>::err(
            Error{"only TXT and A records can be written", ErrorCode::InvalidArgument});
    }

    ares_dns_rr_t* rr = nullptr;
    auto status = ares_dns_record_rr_add(&rr, out, section, wire_text(record.name).c_str(),
                                         static_cast<ares_dns_rec_type_t>(record.type),
                                         static_cast<ares_dns_class_t>(record.rclass),
                                         record.ttl);
    if (status != ARES_SUCCESS) {
        return Result<void, Error>::err(
            ares_error("cannot add record", status, ErrorCode::InvalidArgument));
    }

    if (record.type == RecordType::A) {
        bool is_v4 = false;
        const quint32 v4 = record.address.toIPv4Address(&is_v4);
        if (!is_v4) {
            return Result<void, Error>::err(
                Error{"A record needs an IPv4 address", ErrorCode::InvalidArgument});
        }
        in_addr addr{};
        addr.s_addr = qToBigEndian(v4);
        status = ares_dns_rr_set_addr(rr, ARES_RR_A_ADDR, &addr);
        if (status != ARES_SUCCESS) {
            return Result<void, Error>::err(
                ares_error("cannot set address", status, ErrorCode::InvalidArgument));
        }
        return Result<void, Error>::ok();
    }

    for (const auto& s : record.txt) {
        if (static_cast<size_t>(s.size()) > MAX_TXT_STRING_LENGTH) {
            return Result<void, Error>::err(
                Error{"TXT string longer than 255 bytes", ErrorCode::InvalidArgument});
        }
        status = ares_dns_rr_add_abin(rr, ARES_RR_TXT_DATA,
                                      reinterpret_cast<const unsigned char*>(s.constData()),
                                      static_cast<size_t>(s.size()));
        if (status != ARES_SUCCESS) {
            return Result<void, Error>::err(
                ares_error("cannot add TXT string", status, ErrorCode::InvalidArgument));
        }
    }
    return Result<void, Error>::ok();
}

Result<void, Error> read_section(ares_dns_record_t* in,
                                 ares_dns_section_t section,
                                 std::vector<DnsRecord>& out) {
    const size_t count = ares_dns_record_rr_cnt(in, section);
    for (size_t i = 0; i < count; ++i) {
        const ares_dns_rr_t* rr = ares_dns_record_rr_get(in, section, i);

        auto name = name_from_wire(ares_dns_rr_get_name(rr));
        if (name.is_err()) {
            return Result<void, Error>::err(name.unwrap_err());
        }

        DnsRecord record;
        record.name = std::move(name).unwrap();
        record.rclass = static_cast<uint16_t>(ares_dns_rr_get_class(rr));
        record.ttl = ares_dns_rr_get_ttl(rr);

        const auto type = ares_dns_rr_get_type(rr);
        if (type == ARES_REC_TYPE_RAW_RR) {
            record.type = static_cast<RecordType>(ares_dns_rr_get_u16(rr, ARES_RR_RAW_RR_TYPE));
        } else {
            record.type = static_cast<RecordType>(type);
        }

        if (type == ARES_REC_TYPE_TXT) {
            const size_t strings = ares_dns_rr_get_abin_cnt(rr, ARES_RR_TXT_DATA);
            for (size_t j = 0; j < strings; ++j) {
                size_t len = 0;
                const unsigned char* data = ares_dns_rr_get_abin(rr, ARES_RR_TXT_DATA, j, &len);
                if (data != nullptr && len > 0) {
                    record.txt.emplace_back(reinterpret_cast<const char*>(data),
                                            static_cast<qsizetype>(len));
                }
            }
        } else if (type == ARES_REC_TYPE_A) {
            if (const in_addr* addr = ares_dns_rr_get_addr(rr, ARES_RR_A_ADDR)) {
                record.address = QHostAddress(qFromBigEndian(static_cast<quint32>(addr->s_addr)));
            }
        }

        out.push_back(std::move(record));
    }
    return Result<void, Error>::ok();
}

} // namespace

// ============================================================================
// DnsName
// ============================================================================

Result<DnsName, Error> DnsName::from_ascii(std::string_view text) {
    if (text.empty()) {
        return Result<DnsName, Error>::err(Error{"empty domain name", ErrorCode::InvalidName});
    }
    if (text == ".") {
        return Result<DnsName, Error>::ok(DnsName{});
    }
    if (text.back() == '.') {
        text.remove_suffix(1);
    }

    std::vector<std::string> labels;
    size_t start = 0;
    while (start <= text.size()) {
        const auto dot = text.find('.', start);
        const auto end = dot == std::string_view::npos ? text.size() : dot;
        const auto label = text.substr(start, end - start);

        if (label.empty()) {
            return Result<DnsName, Error>::err(
                Error{"empty label in domain name", ErrorCode::InvalidName});
        }
        for (char c : label) {
            if (c <= 0x20 || c >= 0x7F) {
                return Result<DnsName, Error>::err(
                    Error{"non-ASCII or control character in domain name", ErrorCode::InvalidName});
            }
        }
        labels.emplace_back(label);

        if (dot == std::string_view::npos) break;
        start = dot + 1;
    }

    return from_labels(std::move(labels));
}

Result<DnsName, Error> DnsName::from_labels(std::vector<std::string> labels) {
    size_t total = 1;
    for (const auto& label : labels) {
        if (label.empty() || label.size() > MAX_LABEL_LENGTH) {
            return Result<DnsName, Error>::err(
                Error{"label length out of range", ErrorCode::InvalidName});
        }
        total += 1 + label.size();
    }
    if (total > MAX_NAME_WIRE_LENGTH) {
        return Result<DnsName, Error>::err(Error{"domain name too long", ErrorCode::InvalidName});
    }
    return Result<DnsName, Error>::ok(DnsName(std::move(labels)));
}

std::string DnsName::to_string() const {
    if (labels_.empty()) return ".";
    std::string out;
    for (const auto& label : labels_) {
        if (!out.empty()) out += '.';
        out += label;
    }
    return out;
}

size_t DnsName::wire_length() const noexcept {
    size_t total = 1;
    for (const auto& label : labels_) {
        total += 1 + label.size();
    }
    return total;
}

bool DnsName::equals_ignore_case(const DnsName& other) const noexcept {
    if (labels_.size() != other.labels_.size()) return false;
    for (size_t i = 0; i < labels_.size(); ++i) {
        const auto& a = labels_[i];
        const auto& b = other.labels_[i];
        if (a.size() != b.size()) return false;
        for (size_t j = 0; j < a.size(); ++j) {
            if (fold(a[j]) != fold(b[j])) return false;
        }
    }
    return true;
}

// ============================================================================
// Message codec
// ============================================================================

Result<QByteArray, Error> serialize_message(const DnsMessage& message) {
    unsigned short flags = 0;
    if (message.type == MessageType::Response) flags |= ARES_FLAG_QR;
    if (message.authoritative) flags |= ARES_FLAG_AA;
    if (message.truncated) flags |= ARES_FLAG_TC;

    ares_dns_record_t* raw = nullptr;
    auto status = ares_dns_record_create(&raw, message.id, flags,
                                         static_cast<ares_dns_opcode_t>(message.opcode),
                                         static_cast<ares_dns_rcode_t>(message.rcode));
    if (status != ARES_SUCCESS) {
        return Result<QByteArray, Error>::err(
            ares_error("cannot create DNS message", status, ErrorCode::InvalidArgument));
    }
    AresRecordPtr record(raw);

    for (const auto& question : message.questions) {
        status = ares_dns_record_query_add(record.get(), wire_text(question.name).c_str(),
                                           static_cast<ares_dns_rec_type_t>(question.type),
                                           static_cast<ares_dns_class_t>(question.qclass));
        if (status != ARES_SUCCESS) {
            return Result<QByteArray, Error>::err(
                ares_error("cannot add question", status, ErrorCode::InvalidArgument));
        }
    }

    for (auto [section, records] : {std::pair{ARES_SECTION_ANSWER, &message.answers},
                                    std::pair{ARES_SECTION_AUTHORITY, &message.authorities},
                                    std::pair{ARES_SECTION_ADDITIONAL, &message.additionals}}) {
        for (const auto& r : *records) {
            auto written = write_record(record.get(), section, r);
            if (written.is_err()) {
                return Result<QByteArray, Error>::err(written.unwrap_err());
            }
        }
    }

    unsigned char* buf = nullptr;
    size_t len = 0;
    status = ares_dns_write(record.get(), &buf, &len);
    AresBufferPtr wire(buf);
    if (status != ARES_SUCCESS) {
        return Result<QByteArray, Error>::err(
            ares_error("cannot encode DNS message", status, ErrorCode::InvalidArgument));
    }

    return Result<QByteArray, Error>::ok(
        QByteArray(reinterpret_cast<const char*>(wire.get()), static_cast<qsizetype>(len)));
}

Result<DnsMessage, Error> parse_message(const QByteArray& bytes) {
    if (bytes.isEmpty()) {
        return Result<DnsMessage, Error>::err(Error{"empty datagram", ErrorCode::MalformedMessage});
    }

    ares_dns_record_t* raw = nullptr;
    const auto status = ares_dns_parse(reinterpret_cast<const unsigned char*>(bytes.constData()),
                                       static_cast<size_t>(bytes.size()), 0, &raw);
    AresRecordPtr record(raw);
    if (status != ARES_SUCCESS) {
        return Result<DnsMessage, Error>::err(
            ares_error("not a DNS message", status, ErrorCode::MalformedMessage));
    }

    DnsMessage message;
    const unsigned short flags = ares_dns_record_get_flags(record.get());
    message.id = ares_dns_record_get_id(record.get());
    message.type = (flags & ARES_FLAG_QR) ? MessageType::Response : MessageType::Query;
    message.opcode = static_cast<uint8_t>(ares_dns_record_get_opcode(record.get()));
    message.authoritative = (flags & ARES_FLAG_AA) != 0;
    message.truncated = (flags & ARES_FLAG_TC) != 0;
    message.rcode = static_cast<uint8_t>(ares_dns_record_get_rcode(record.get()));

    const size_t questions = ares_dns_record_query_cnt(record.get());
    for (size_t i = 0; i < questions; ++i) {
        const char* name = nullptr;
        ares_dns_rec_type_t qtype{};
        ares_dns_class_t qclass{};
        if (ares_dns_record_query_get(record.get(), i, &name, &qtype, &qclass) != ARES_SUCCESS) {
            return Result<DnsMessage, Error>::err(Error{"unreadable question", ErrorCode::MalformedMessage});
        }

        auto qname = name_from_wire(name);
        if (qname.is_err()) {
            return Result<DnsMessage, Error>::err(qname.unwrap_err());
        }
        message.questions.push_back(DnsQuestion{std::move(qname).unwrap(),
                                                static_cast<RecordType>(qtype),
                                                static_cast<uint16_t>(qclass)});
    }

    for (auto [section, records] : {std::pair{ARES_SECTION_ANSWER, &message.answers},
                                    std::pair{ARES_SECTION_AUTHORITY, &message.authorities},
                                    std::pair{ARES_SECTION_ADDITIONAL, &message.additionals}}) {
        auto read = read_section(record.get(), section, *records);
        if (read.is_err()) {
            return Result<DnsMessage, Error>::err(read.unwrap_err());
        }
    }

    return Result<DnsMessage, Error>::ok(std::move(message));
}

} // namespace datlan::network
