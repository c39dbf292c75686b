#pragma once

#include "core/result.hpp"
#include "crypto/keys.hpp"

#include <QString>

namespace datlan {

inline constexpr const char* DAT_URL_PROTOCOL = "dat://";

/**
 * Format an archive link: dat://<64 lowercase hex chars>.
 */
[[nodiscard]] QString format_dat_url(const crypto::PublicKey& public_key);

/**
 * Parse an archive link. Accepts the dat:// prefix or a bare key, surrounding
 * whitespace and a trailing slash. The key must be exactly 32 bytes of hex.
 */
[[nodiscard]] Result<crypto::PublicKey, Error> parse_dat_url(const QString& url);

} // namespace datlan
