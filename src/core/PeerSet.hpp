#pragma once
#include "Peer.hpp"
#include <mutex>
#include <set>
#include <vector>

// Peers discovered so far. Append-only; guarded by its own mutex so peer
// discovery never waits on block bookkeeping.
class PeerSet {
private:
    std::set<Peer> peers;
    mutable std::mutex mtx;

public:
    bool add_if_not_seen(const Peer& peer);
    bool contains(const Peer& peer) const;
    std::vector<Peer> snapshot() const;
    size_t size() const;
};
