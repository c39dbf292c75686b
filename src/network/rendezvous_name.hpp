#pragma once

#include "core/result.hpp"
#include "network/dns_message.hpp"

#include <cstdint>
#include <vector>

namespace datlan::network {

inline constexpr const char* RENDEZVOUS_NAME_SUFFIX = "dat.local";

// Hex characters of the discovery key kept in the name (20 bytes).
constexpr size_t RENDEZVOUS_KEY_HEX_LENGTH = 40;

/**
 * Derive "<first 40 hex chars of the key>.dat.local". Fails with
 * ErrorCode::InvalidName if the key is shorter than 20 bytes or the result
 * is not a valid DNS name; callers treat that as a startup error.
 */
[[nodiscard]] Result<DnsName, Error> derive_rendezvous_name(const std::vector<uint8_t>& discovery_key);

} // namespace datlan::network
