#pragma once

#include <stdexcept>
#include <string>

namespace sapool::pool {

class PoolError : public std::runtime_error {
public:
    enum class Type {
        no_candidates,
        all_blacklisted,
        exhausted,
        empty_cache,
        io_failure,
    };

    PoolError(Type type, const std::string& message)
        : std::runtime_error(message)
        , type_(type) {}

    [[nodiscard]] Type type() const noexcept { return type_; }

private:
    Type type_;
};

} // namespace sapool::pool
