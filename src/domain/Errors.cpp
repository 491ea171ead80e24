#include "domain/Errors.hpp"

namespace domain {

const char* to_string(ExchangeError::Kind kind) noexcept {
    switch (kind) {
    case ExchangeError::Kind::RateLimited:
        return "rate_limited";
    case ExchangeError::Kind::Network:
        return "network";
    case ExchangeError::Kind::Malformed:
        return "malformed";
    }
    return "unknown";
}

}  // namespace domain
