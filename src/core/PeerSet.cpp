#include "PeerSet.hpp"

bool PeerSet::add_if_not_seen(const Peer& peer) {
    std::lock_guard<std::mutex> lock(mtx);
    return peers.insert(peer).second;
}

bool PeerSet::contains(const Peer& peer) const {
    std::lock_guard<std::mutex> lock(mtx);
    return peers.count(peer) != 0;
}

std::vector<Peer> PeerSet::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx);
    return std::vector<Peer>(peers.begin(), peers.end());
}

size_t PeerSet::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return peers.size();
}
