#include "network/rendezvous_name.hpp"

#include "crypto/keys.hpp"

namespace datlan::network {

Result<DnsName, Error> derive_rendezvous_name(const std::vector<uint8_t>& discovery_key) {
    auto hex = crypto::to_hex(discovery_key);
    if (hex.size() < RENDEZVOUS_KEY_HEX_LENGTH) {
        return Result<DnsName, Error>::err(
            Error{"discovery key shorter than 20 bytes", ErrorCode::InvalidName});
    }
    hex.resize(RENDEZVOUS_KEY_HEX_LENGTH);

    return DnsName::from_ascii(hex + '.' + RENDEZVOUS_NAME_SUFFIX);
}

} // namespace datlan::network
