#include "resilient_order_client.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

namespace execution {

namespace {

    // Retryable order errors are surfaced as the matching transient exception
    [[noreturn]] void throwTransient(const OrderError& error) {
        switch (error.kind) {
            case OrderErrorKind::Timeout: throw core::TimeoutException(error.message);
            case OrderErrorKind::RateLimited: throw core::RateLimitException(error.message);
            default: throw core::DisconnectedException(error.message);
        }
    }

    bool isRetryable(OrderErrorKind kind) {
        return kind == OrderErrorKind::Timeout || kind == OrderErrorKind::RateLimited || kind == OrderErrorKind::Network;
    }

} // end anonymous namespace

ResilientOrderClient::ResilientOrderClient(OrderGateway& gateway, core::RetryPolicy policy,
                                           AuthFailureHandler on_auth_failure)
    : gateway_(gateway), policy_(std::move(policy)), on_auth_failure_(std::move(on_auth_failure)) {}

std::string ResilientOrderClient::nextClientOrderId(const std::string& tag, const std::string& instrument_key) {
    return fmt::format("{}-{}-{}", tag, instrument_key, ++sequence_);
}

void ResilientOrderClient::reportAuthFailure(const std::string& reason) {
    core::logging::getLogger()->critical("Order gateway authentication failure: {}", reason);
    if (on_auth_failure_) {
        on_auth_failure_(reason);
    }
}

OrderResult ResilientOrderClient::placeOrder(OrderRequest request) {
    auto logger = core::logging::getLogger();
    if (request.client_order_id.empty()) {
        request.client_order_id = nextClientOrderId(request.tag.empty() ? "ORD" : request.tag, request.instrument_key);
    }
    std::string operation = fmt::format("placeOrder {} {} {} x{}", request.client_order_id,
                                        orderSideToString(request.side), request.instrument_key, request.quantity);

    OrderResult last;
    try {
        last = policy_.execute(operation, [&]() {
            OrderResult result = gateway_.placeOrder(request);
            if (!result.ok() && isRetryable(result.error->kind)) {
                throwTransient(*result.error);
            }
            return result;
        });
    } catch (const core::TimeoutException& e) {
        return OrderResult::failed(OrderErrorKind::Timeout, e.what());
    } catch (const core::RateLimitException& e) {
        return OrderResult::failed(OrderErrorKind::RateLimited, e.what());
    } catch (const core::TransientException& e) {
        return OrderResult::failed(OrderErrorKind::Network, e.what());
    } catch (const core::AuthenticationException& e) {
        reportAuthFailure(e.what());
        return OrderResult::failed(OrderErrorKind::Authentication, e.what());
    }

    if (last.ok()) {
        logger->info("Order filled: {} -> id {} @ {:.2f}", operation, last.order_id, last.fill_price);
    } else {
        if (last.error->kind == OrderErrorKind::Authentication) {
            reportAuthFailure(last.error->message);
        }
        logger->error("Order failed: {} -> {} ({})", operation, orderErrorKindToString(last.error->kind), last.error->message);
    }
    return last;
}

std::vector<core::VenuePosition> ResilientOrderClient::getOpenPositions() {
    try {
        return policy_.execute("getOpenPositions", [this]() { return gateway_.getOpenPositions(); });
    } catch (const core::AuthenticationException& e) {
        reportAuthFailure(e.what());
        throw;
    }
}

} // namespace execution
