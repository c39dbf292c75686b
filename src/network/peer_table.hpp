#pragma once

#include "network/peer_record.hpp"

#include <QHash>
#include <QString>

#include <optional>
#include <vector>

namespace datlan::network {

/**
 * PeerTable - Consumer-side view of the discovered-peer stream, keyed by
 * token. The first sighting of a token wins; later sightings are reported
 * as already known and do not replace the stored record.
 */
class PeerTable {
public:
    /**
     * Returns true when `record` introduces a new token.
     */
    bool insert(const PeerRecord& record);

    [[nodiscard]] std::optional<PeerRecord> find(const QString& token) const;
    [[nodiscard]] bool contains(const QString& token) const { return by_token_.contains(token); }
    [[nodiscard]] int size() const { return static_cast<int>(by_token_.size()); }

    /**
     * Records in first-seen order.
     */
    [[nodiscard]] std::vector<PeerRecord> records() const;

private:
    QHash<QString, PeerRecord> by_token_;
    std::vector<QString> order_;
};

} // namespace datlan::network
