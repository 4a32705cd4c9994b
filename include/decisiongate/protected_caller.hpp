#pragma once

#include "decisiongate/circuit_breaker.hpp"
#include "decisiongate/exceptions.hpp"
#include "decisiongate/rate_limiter.hpp"
#include "decisiongate/result.hpp"

#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace decisiongate {

// The one path for outbound calls: rate limiter first, then the dependency's
// circuit breaker. weight is charged to the weighted limit, every other limit
// is charged one unit.
class ProtectedCaller {
public:
    ProtectedCaller(RateLimiter& limiter, CircuitBreakerRegistry& breakers,
                    std::optional<Duration> acquire_timeout = std::nullopt)
        : limiter_(limiter)
        , breakers_(breakers)
        , acquire_timeout_(acquire_timeout) {}

    // Throws RateLimitExceededException, CircuitOpenException, or whatever op
    // throws (after the breaker has recorded it).
    template <typename F>
    auto invoke(const std::string& dependency, RequestWeight weight, F&& op)
        -> std::invoke_result_t<F>
    {
        limiter_.acquire(weight, acquire_timeout_);
        return breakers_.get(dependency).call(std::forward<F>(op));
    }

    // Same as invoke() but admission and operation failures come back as an
    // Error. InvalidRequestException (a bad weight) still propagates.
    template <typename F>
    auto try_invoke(const std::string& dependency, RequestWeight weight, F&& op)
        -> Result<std::invoke_result_t<F>>
    {
        using R = std::invoke_result_t<F>;
        try {
            if constexpr (std::is_void_v<R>) {
                invoke(dependency, weight, std::forward<F>(op));
                return Result<void>{};
            } else {
                return Result<R>(invoke(dependency, weight, std::forward<F>(op)));
            }
        } catch (const RateLimitExceededException& e) {
            return Error{ErrorKind::RateLimitExceeded, e.what(), e.limit_name(), e.retry_after()};
        } catch (const CircuitOpenException& e) {
            return Error{ErrorKind::CircuitOpen, e.what(), e.dependency(), e.retry_after()};
        } catch (const InvalidRequestException&) {
            throw;
        } catch (const std::exception& e) {
            return Error{ErrorKind::OperationFailed, e.what(), dependency, std::nullopt};
        } catch (...) {
            return Error{ErrorKind::OperationFailed, "unknown error", dependency, std::nullopt};
        }
    }

    RateLimiter& limiter() noexcept { return limiter_; }
    CircuitBreakerRegistry& breakers() noexcept { return breakers_; }

private:
    RateLimiter& limiter_;
    CircuitBreakerRegistry& breakers_;
    std::optional<Duration> acquire_timeout_;
};

} // namespace decisiongate
