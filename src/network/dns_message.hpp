#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <QHostAddress>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace datlan::network {

/**
 * Resource record types we build or recognize. Values outside this list are
 * carried through parsing unchanged.
 */
enum class RecordType : uint16_t {
    A = 1,
    PTR = 12,
    TXT = 16,
    AAAA = 28,
    SRV = 33,
    ANY = 255,
};

constexpr uint16_t CLASS_IN = 1;

// RFC 1035 limits.
constexpr size_t MAX_LABEL_LENGTH = 63;
constexpr size_t MAX_NAME_WIRE_LENGTH = 255;
constexpr size_t MAX_TXT_STRING_LENGTH = 255;

/**
 * DnsName - A domain name as a sequence of labels, without the root label.
 *
 * Names built from text are validated (ASCII, non-empty labels, length
 * limits) before they are handed to the wire codec.
 */
class DnsName {
public:
    DnsName() = default;

    /**
     * Parse dotted text ("abc.dat.local", trailing dot optional).
     */
    [[nodiscard]] static Result<DnsName, Error> from_ascii(std::string_view text);

    /**
     * Build from raw labels, checking only the wire length limits.
     */
    [[nodiscard]] static Result<DnsName, Error> from_labels(std::vector<std::string> labels);

    [[nodiscard]] const std::vector<std::string>& labels() const noexcept { return labels_; }
    [[nodiscard]] bool is_root() const noexcept { return labels_.empty(); }

    /**
     * Dotted form without the trailing dot ("." for the root).
     */
    [[nodiscard]] std::string to_string() const;

    /**
     * Length of the uncompressed wire encoding, root label included.
     */
    [[nodiscard]] size_t wire_length() const noexcept;

    /**
     * DNS name equality: same label count, labels equal under ASCII case
     * folding. No other normalization is applied.
     */
    [[nodiscard]] bool equals_ignore_case(const DnsName& other) const noexcept;

    bool operator==(const DnsName&) const = default;

private:
    explicit DnsName(std::vector<std::string> labels) : labels_(std::move(labels)) {}

    std::vector<std::string> labels_;
};

struct DnsQuestion {
    DnsName name;
    RecordType type = RecordType::ANY;
    uint16_t qclass = CLASS_IN;
};

/**
 * One resource record. Only the data of the types we use is kept:
 * the character strings of a TXT record and the address of an A record.
 */
struct DnsRecord {
    DnsName name;
    RecordType type = RecordType::A;
    uint16_t rclass = CLASS_IN;
    uint32_t ttl = 0;
    std::vector<QByteArray> txt;
    QHostAddress address;
};

enum class MessageType {
    Query,
    Response
};

/**
 * DnsMessage - Header fields and the four record sections.
 *
 * mDNS uses message id 0 and sets the authoritative bit on responses.
 */
struct DnsMessage {
    uint16_t id = 0;
    MessageType type = MessageType::Query;
    uint8_t opcode = 0;
    bool authoritative = false;
    bool truncated = false;
    uint8_t rcode = 0;

    std::vector<DnsQuestion> questions;
    std::vector<DnsRecord> answers;
    std::vector<DnsRecord> authorities;
    std::vector<DnsRecord> additionals;
};

/**
 * Encode a message with c-ares. Records other than TXT and A cannot be
 * written and fail with ErrorCode::InvalidArgument.
 */
[[nodiscard]] Result<QByteArray, Error> serialize_message(const DnsMessage& message);

/**
 * Decode a message from untrusted bytes with c-ares. Any framing error,
 * including bad compression pointers, is ErrorCode::MalformedMessage.
 */
[[nodiscard]] Result<DnsMessage, Error> parse_message(const QByteArray& bytes);

} // namespace datlan::network
