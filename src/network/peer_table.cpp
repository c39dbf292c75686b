#include "network/peer_table.hpp"

namespace datlan::network {

bool PeerTable::insert(const PeerRecord& record) {
    if (by_token_.contains(record.token)) {
        return false;
    }
    by_token_.insert(record.token, record);
    order_.push_back(record.token);
    return true;
}

std::optional<PeerRecord> PeerTable::find(const QString& token) const {
    const auto it = by_token_.constFind(token);
    if (it == by_token_.constEnd()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<PeerRecord> PeerTable::records() const {
    std::vector<PeerRecord> out;
    out.reserve(order_.size());
    for (const auto& token : order_) {
        out.push_back(by_token_.value(token));
    }
    return out;
}

} // namespace datlan::network
