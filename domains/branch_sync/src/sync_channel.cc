#include "sync_channel.hpp"

namespace branch_sync {

void InProcessSyncChannel::publish(const std::string& peer, const retail::StockMovement& movement) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (unreachable_.count(peer) > 0) {
        throw PeerUnavailableError("Peer " + peer + " is unreachable");
    }
    queues_[peer].push_back(movement);
}

std::vector<retail::StockMovement> InProcessSyncChannel::drain(const std::string& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<retail::StockMovement> result;
    auto it = queues_.find(peer);
    if (it == queues_.end()) return result;
    result.assign(it->second.begin(), it->second.end());
    it->second.clear();
    return result;
}

size_t InProcessSyncChannel::pending(const std::string& peer) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queues_.find(peer);
    return it == queues_.end() ? 0 : it->second.size();
}

void InProcessSyncChannel::set_reachable(const std::string& peer, bool reachable) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reachable) {
        unreachable_.erase(peer);
    } else {
        unreachable_.insert(peer);
    }
}

}  // namespace branch_sync
