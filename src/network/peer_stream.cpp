#include "network/peer_stream.hpp"

#include <algorithm>

namespace datlan::network {

PeerStream::PeerStream(size_t capacity, QObject* parent)
    : QObject(parent)
    , capacity_(std::max<size_t>(capacity, 1))
{
}

std::optional<PeerRecord> PeerStream::next() {
    if (buffer_.empty()) {
        return std::nullopt;
    }

    auto record = std::move(buffer_.front());
    buffer_.pop_front();
    return record;
}

bool PeerStream::push(PeerRecord record) {
    if (is_full()) {
        return false;
    }
    buffer_.push_back(std::move(record));
    emit peerAvailable();
    return true;
}

} // namespace datlan::network
