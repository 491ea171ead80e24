#pragma once

#include <stdexcept>
#include <string>

namespace domain {

class ExchangeError : public std::runtime_error {
public:
    enum class Kind {
        RateLimited,
        Network,
        Malformed,
    };

    ExchangeError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

const char* to_string(ExchangeError::Kind kind) noexcept;

// Connection-class failure of the durable store; the writer retries these.
class StoreConnectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Any other durable store failure; never retried.
class StoreDataError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class CacheError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace domain
