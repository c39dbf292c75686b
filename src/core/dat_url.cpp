#include "core/dat_url.hpp"

#include <algorithm>

namespace datlan {

QString format_dat_url(const crypto::PublicKey& public_key) {
    return QString::fromLatin1(DAT_URL_PROTOCOL)
        + QString::fromStdString(crypto::to_hex(public_key.data(), public_key.size()));
}

Result<crypto::PublicKey, Error> parse_dat_url(const QString& url) {
    auto key = url.trimmed();
    if (key.startsWith(QLatin1String(DAT_URL_PROTOCOL), Qt::CaseInsensitive)) {
        key = key.mid(static_cast<int>(std::char_traits<char>::length(DAT_URL_PROTOCOL)));
    }
    if (key.endsWith(QLatin1Char('/'))) {
        key.chop(1);
    }

    if (key.size() != static_cast<int>(crypto::PUBLIC_KEY_SIZE * 2)) {
        return Result<crypto::PublicKey, Error>::err(
            Error{"Archive key must be 64 hex characters", ErrorCode::InvalidArgument});
    }

    const auto bytes = crypto::from_hex(key.toStdString());
    if (bytes.is_err()) {
        return Result<crypto::PublicKey, Error>::err(bytes.unwrap_err());
    }

    crypto::PublicKey out{};
    std::copy(bytes.unwrap().begin(), bytes.unwrap().end(), out.begin());
    return Result<crypto::PublicKey, Error>::ok(out);
}

} // namespace datlan
