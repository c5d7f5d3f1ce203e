#pragma once

#include "sapool/pool/ServiceClient.hpp"

#include <cstddef>
#include <deque>
#include <vector>

namespace sapool::pool {

// 预加载客户端的有界队列，超出容量时从队尾丢弃
class ClientCache {
public:
    explicit ClientCache(std::size_t max);

    void offer(ServiceClient client);
    void prepend(std::vector<ServiceClient> batch);
    ServiceClient take();

    void setMax(std::size_t max);
    [[nodiscard]] std::size_t max() const noexcept { return max_; }
    [[nodiscard]] std::size_t size() const noexcept { return clients_.size(); }
    [[nodiscard]] bool empty() const noexcept { return clients_.empty(); }
    [[nodiscard]] const std::deque<ServiceClient>& clients() const noexcept { return clients_; }

private:
    void truncate();

    std::size_t max_;
    std::deque<ServiceClient> clients_;
};

} // namespace sapool::pool
