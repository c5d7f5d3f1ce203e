#include "sapool/pool/ClientCache.hpp"
#include "sapool/pool/PoolError.hpp"

#include <iterator>

namespace sapool::pool {

ClientCache::ClientCache(std::size_t max)
    : max_(max) {}

void ClientCache::offer(ServiceClient client) {
    clients_.push_front(std::move(client));
    truncate();
}

void ClientCache::prepend(std::vector<ServiceClient> batch) {
    if (batch.empty()) {
        return;
    }
    clients_.insert(clients_.begin(),
                    std::make_move_iterator(batch.begin()),
                    std::make_move_iterator(batch.end()));
    truncate();
}

ServiceClient ClientCache::take() {
    if (clients_.empty()) {
        throw PoolError(PoolError::Type::empty_cache, "no available preloaded services");
    }
    ServiceClient client = std::move(clients_.front());
    clients_.pop_front();
    clients_.push_back(client);
    return client;
}

void ClientCache::setMax(std::size_t max) {
    max_ = max;
    truncate();
}

void ClientCache::truncate() {
    if (clients_.size() > max_) {
        clients_.resize(max_);
    }
}

} // namespace sapool::pool
