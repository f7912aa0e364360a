#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "order_gateway.hpp"
#include "retry_policy.hpp"

namespace execution {

    // Wraps an OrderGateway with the shared retry policy. Timeouts, rate limits
    // and network errors are retried under the same client order id; rejections
    // are returned immediately; an authentication failure fires the callback.
    class ResilientOrderClient {
    public:
        using AuthFailureHandler = std::function<void(const std::string& reason)>;

        ResilientOrderClient(OrderGateway& gateway, core::RetryPolicy policy, AuthFailureHandler on_auth_failure = {});

        // Never throws for order-level problems; the final error is in the result
        OrderResult placeOrder(OrderRequest request);

        // Throws the last core::TransientException once retries are exhausted
        std::vector<core::VenuePosition> getOpenPositions();

        // "<tag>-<instrument>-<sequence>", unique within the process
        std::string nextClientOrderId(const std::string& tag, const std::string& instrument_key);

    private:
        void reportAuthFailure(const std::string& reason);

        OrderGateway& gateway_;
        core::RetryPolicy policy_;
        AuthFailureHandler on_auth_failure_;
        std::atomic<std::uint64_t> sequence_{0};
    };

} // namespace execution
