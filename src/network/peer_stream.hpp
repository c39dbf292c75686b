#pragma once

#include "network/peer_record.hpp"

#include <QObject>

#include <cstddef>
#include <deque>
#include <optional>

namespace datlan::network {

/**
 * PeerStream - Bounded, pull-based stream of discovered peers.
 *
 * The engine pushes, the consumer pulls with next(). While the buffer is full
 * new sightings are dropped, so a slow consumer loses sightings instead of
 * growing memory; peers announce again every broadcast round. The same peer
 * may appear many times; deduplication belongs to the consumer (see
 * PeerTable).
 */
class PeerStream : public QObject {
    Q_OBJECT

public:
    explicit PeerStream(size_t capacity, QObject* parent = nullptr);

    /**
     * Pull the oldest record, or nullopt when the buffer is empty.
     */
    [[nodiscard]] std::optional<PeerRecord> next();

    /**
     * Append a record. Returns false (and drops it) when the buffer is full.
     */
    bool push(PeerRecord record);

    [[nodiscard]] bool is_full() const noexcept { return buffer_.size() >= capacity_; }
    [[nodiscard]] bool is_empty() const noexcept { return buffer_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return buffer_.size(); }
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

signals:
    void peerAvailable();

private:
    size_t capacity_;
    std::deque<PeerRecord> buffer_;
};

} // namespace datlan::network
