#include <catch2/catch_test_macros.hpp>

#include "vaultpp/pipeline/client_options.hpp"
#include "vaultpp/pipeline/pipeline.hpp"
#include "vaultpp/transport/backoff_policy.hpp"
#include "vaultpp/transport/retry_policy.hpp"
#include "mocks/mock_http_client.hpp"

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace vaultpp;
using namespace vaultpp::testing;

// ═══════════════════════════════════════════════════════════════════════════
// RetryPolicy Unit Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("RetryPolicy default configuration", "[retry][policy]") {
    RetryPolicy policy;

    SECTION("Default max attempts is 3") {
        REQUIRE(policy.max_attempts() == 3);
    }

    SECTION("Connection failures are retryable by default") {
        REQUIRE(policy.should_retry(HttpTransportError::Code::ConnectionFailed, 0) == true);
    }

    SECTION("Timeouts are retryable by default") {
        REQUIRE(policy.should_retry(HttpTransportError::Code::Timeout, 0) == true);
    }

    SECTION("SSL errors are NOT retryable by default") {
        REQUIRE(policy.should_retry(HttpTransportError::Code::SslError, 0) == false);
    }

    SECTION("Authentication failures are NOT retryable") {
        REQUIRE(policy.should_retry(HttpTransportError::Code::Authentication, 0) == false);
    }

    SECTION("Cancellation is NOT retryable") {
        REQUIRE(policy.should_retry(HttpTransportError::Code::Cancelled, 0) == false);
    }

    SECTION("Rejected requests are NOT retryable") {
        REQUIRE(policy.should_retry(HttpTransportError::Code::InvalidRequest, 0) == false);
    }
}

TEST_CASE("RetryPolicy respects max attempts", "[retry][policy]") {
    RetryPolicy policy;
    policy.with_max_attempts(3);

    SECTION("Allows retries up to max") {
        REQUIRE(policy.should_retry(HttpTransportError::Code::ConnectionFailed, 0) == true);
        REQUIRE(policy.should_retry(HttpTransportError::Code::ConnectionFailed, 1) == true);
        REQUIRE(policy.should_retry(HttpTransportError::Code::ConnectionFailed, 2) == true);
    }

    SECTION("Denies retry after max attempts") {
        REQUIRE(policy.should_retry(HttpTransportError::Code::ConnectionFailed, 3) == false);
        REQUIRE(policy.should_retry(HttpTransportError::Code::ConnectionFailed, 4) == false);
    }
}

TEST_CASE("RetryPolicy HTTP status code handling", "[retry][policy]") {
    RetryPolicy policy;

    SECTION("5xx gateway errors are retryable by default") {
        REQUIRE(policy.should_retry_http_status(500) == true);
        REQUIRE(policy.should_retry_http_status(502) == true);
        REQUIRE(policy.should_retry_http_status(503) == true);
        REQUIRE(policy.should_retry_http_status(504) == true);
    }

    SECTION("408 and 429 are retryable") {
        REQUIRE(policy.should_retry_http_status(408) == true);
        REQUIRE(policy.should_retry_http_status(429) == true);
    }

    SECTION("Other 4xx client errors are NOT retryable") {
        REQUIRE(policy.should_retry_http_status(400) == false);
        REQUIRE(policy.should_retry_http_status(401) == false);
        REQUIRE(policy.should_retry_http_status(403) == false);
        REQUIRE(policy.should_retry_http_status(404) == false);
    }

    SECTION("Combined check reads the status of an HttpError") {
        const auto unavailable = HttpTransportError::http_error(HttpClientResponse{503, {}, ""});
        const auto not_found = HttpTransportError::http_error(HttpClientResponse{404, {}, ""});

        REQUIRE(policy.should_retry(unavailable, 0) == true);
        REQUIRE(policy.should_retry(unavailable, 3) == false);
        REQUIRE(policy.should_retry(not_found, 0) == false);
    }
}

TEST_CASE("RetryPolicy builder pattern", "[retry][policy]") {
    auto policy = RetryPolicy{}
        .with_max_attempts(5)
        .with_retry_on_connection_error(false)
        .with_retry_on_ssl_error(true)
        .with_retryable_status(409)
        .without_retryable_status(500);

    REQUIRE(policy.max_attempts() == 5);
    REQUIRE(policy.should_retry(HttpTransportError::Code::ConnectionFailed, 0) == false);
    REQUIRE(policy.should_retry(HttpTransportError::Code::SslError, 0) == true);
    REQUIRE(policy.should_retry_http_status(409) == true);
    REQUIRE(policy.should_retry_http_status(500) == false);
}

// ═══════════════════════════════════════════════════════════════════════════
// Backoff Unit Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ExponentialBackoff grows and caps", "[retry][backoff]") {
    ExponentialBackoff backoff(
        std::chrono::milliseconds{100}, 2.0, std::chrono::milliseconds{1000}, 0.0);

    REQUIRE(backoff.next_delay(0) == std::chrono::milliseconds{100});
    REQUIRE(backoff.next_delay(1) == std::chrono::milliseconds{200});
    REQUIRE(backoff.next_delay(2) == std::chrono::milliseconds{400});
    REQUIRE(backoff.next_delay(4) == std::chrono::milliseconds{1000});
    REQUIRE(backoff.next_delay(20) == std::chrono::milliseconds{1000});
}

TEST_CASE("ExponentialBackoff jitter stays within bounds", "[retry][backoff]") {
    ExponentialBackoff backoff(
        std::chrono::milliseconds{1000}, 2.0, std::chrono::milliseconds{60'000}, 0.2);

    for (int i = 0; i < 50; ++i) {
        const auto delay = backoff.next_delay(0);
        REQUIRE(delay >= std::chrono::milliseconds{800});
        REQUIRE(delay <= std::chrono::milliseconds{1200});
    }
}

TEST_CASE("ExponentialBackoff defaults", "[retry][backoff]") {
    ExponentialBackoff backoff;
    REQUIRE(backoff.initial_delay() == std::chrono::milliseconds{800});
    REQUIRE(backoff.max_delay() == std::chrono::milliseconds{60'000});
}

TEST_CASE("FixedBackoff and NoBackoff", "[retry][backoff]") {
    FixedBackoff fixed(std::chrono::milliseconds{250});
    REQUIRE(fixed.next_delay(0) == std::chrono::milliseconds{250});
    REQUIRE(fixed.next_delay(7) == std::chrono::milliseconds{250});

    NoBackoff none;
    REQUIRE(none.next_delay(3) == std::chrono::milliseconds{0});
}

TEST_CASE("RetryOptions presets", "[retry][options]") {
    SECTION("Default is exponential with three retries") {
        RetryOptions options;
        REQUIRE(options.policy().max_attempts() == 3);
        REQUIRE(dynamic_cast<ExponentialBackoff*>(options.backoff().get()) != nullptr);
    }

    SECTION("Fixed") {
        auto options = RetryOptions::fixed({.max_retries = 5, .delay = std::chrono::milliseconds{10}});
        REQUIRE(options.policy().max_attempts() == 5);
        REQUIRE(options.backoff()->next_delay(4) == std::chrono::milliseconds{10});
    }

    SECTION("None") {
        auto options = RetryOptions::none();
        REQUIRE(options.policy().max_attempts() == 0);
        REQUIRE(options.policy().should_retry(HttpTransportError::Code::Timeout, 0) == false);
    }

    SECTION("Null backoff is ignored") {
        auto options = RetryOptions::none();
        options.with_backoff(nullptr);
        REQUIRE(options.backoff() != nullptr);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Pipeline Retry Integration Tests
// ═══════════════════════════════════════════════════════════════════════════

namespace {

struct RetryFixture {
    std::shared_ptr<MockHttpClient> mock = std::make_shared<MockHttpClient>();

    Pipeline make_pipeline(RetryOptions retry) {
        ClientOptions options;
        options.with_transport(mock).with_retry(std::move(retry));
        return Pipeline("vaultpp-test", "1.0.0", options, {}, {});
    }

    // Three retries, no waiting
    Pipeline make_pipeline() {
        return make_pipeline(RetryOptions::fixed({.max_retries = 3, .delay = std::chrono::milliseconds{0}}));
    }
};

HttpRequest test_request() {
    HttpRequest request;
    request.method = HttpMethod::Put;
    request.url = "https://vault.example/secrets/name?api-version=7.5";
    request.with_body(R"({"value":"v"})");
    return request;
}

}  // namespace

TEST_CASE("Pipeline retries on connection failure", "[pipeline][retry]") {
    RetryFixture f;
    auto pipeline = f.make_pipeline();

    f.mock->queue_connection_error("Connection refused");
    f.mock->queue_connection_error("Connection reset");
    f.mock->queue_json_response(200, R"({"value":"v"})");

    Context ctx;
    auto request = test_request();
    auto result = pipeline.send(ctx, request);

    REQUIRE(result.has_value());
    REQUIRE(f.mock->request_count() == 3);
}

TEST_CASE("Pipeline retries on timeout", "[pipeline][retry]") {
    RetryFixture f;
    auto pipeline = f.make_pipeline();

    f.mock->queue_timeout("Read timeout");
    f.mock->queue_json_response(200, R"({})");

    Context ctx;
    auto request = test_request();
    REQUIRE(pipeline.send(ctx, request).has_value());
    REQUIRE(f.mock->request_count() == 2);
}

TEST_CASE("Pipeline retries on 503 and 429", "[pipeline][retry]") {
    RetryFixture f;
    auto pipeline = f.make_pipeline();

    f.mock->queue_response(503, "Service Unavailable");
    f.mock->queue_response(429, "Too Many Requests");
    f.mock->queue_json_response(200, R"({})");

    Context ctx;
    auto request = test_request();
    REQUIRE(pipeline.send(ctx, request).has_value());
    REQUIRE(f.mock->request_count() == 3);
}

TEST_CASE("Pipeline does NOT retry on 400 Bad Request", "[pipeline][retry]") {
    RetryFixture f;
    auto pipeline = f.make_pipeline();

    f.mock->queue_response(400, "Bad Request");

    Context ctx;
    auto request = test_request();
    auto result = pipeline.send(ctx, request);

    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == HttpTransportError::Code::HttpError);
    REQUIRE(result.error().http_status == 400);
    REQUIRE(result.error().message == "HTTP 400: Bad Request");
    REQUIRE(f.mock->request_count() == 1);
}

TEST_CASE("Pipeline does NOT retry on SSL error", "[pipeline][retry]") {
    RetryFixture f;
    auto pipeline = f.make_pipeline();

    f.mock->queue_ssl_error("Certificate verification failed");

    Context ctx;
    auto request = test_request();
    auto result = pipeline.send(ctx, request);

    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == HttpTransportError::Code::SslError);
    REQUIRE(f.mock->request_count() == 1);
}

TEST_CASE("Pipeline exhausts retries and returns the last error", "[pipeline][retry]") {
    RetryFixture f;
    auto pipeline = f.make_pipeline();

    f.mock->queue_connection_error("Fail 1");
    f.mock->queue_connection_error("Fail 2");
    f.mock->queue_connection_error("Fail 3");
    f.mock->queue_connection_error("Fail 4");

    Context ctx;
    auto request = test_request();
    auto result = pipeline.send(ctx, request);

    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == HttpTransportError::Code::ConnectionFailed);
    REQUIRE(result.error().message == "Fail 4");
    REQUIRE(f.mock->request_count() == 4);  // 1 initial + 3 retries
}

TEST_CASE("Every attempt sends the same request", "[pipeline][retry]") {
    RetryFixture f;
    auto pipeline = f.make_pipeline();

    f.mock->queue_response(503, "");
    f.mock->queue_json_response(200, R"({})");

    Context ctx;
    auto request = test_request();
    REQUIRE(pipeline.send(ctx, request).has_value());

    const auto requests = f.mock->requests();
    REQUIRE(requests.size() == 2);
    REQUIRE(requests[0] == requests[1]);
    REQUIRE(requests[0].body == std::optional<std::string>{R"({"value":"v"})"});
}

TEST_CASE("Retry-After overrides the backoff delay", "[pipeline][retry]") {
    RetryFixture f;
    // A backoff this long would hang the test if Retry-After were ignored
    auto pipeline = f.make_pipeline(
        RetryOptions::fixed({.max_retries = 1, .delay = std::chrono::milliseconds{60'000}}));

    HeaderMap headers;
    headers["retry-after"] = "0";
    f.mock->queue_response(429, "slow down", headers);
    f.mock->queue_json_response(200, R"({})");

    Context ctx;
    auto request = test_request();
    const auto start = std::chrono::steady_clock::now();
    REQUIRE(pipeline.send(ctx, request).has_value());
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds{5});
    REQUIRE(f.mock->request_count() == 2);
}

TEST_CASE("Pipeline waits for the configured backoff", "[pipeline][retry][backoff]") {
    RetryFixture f;
    auto pipeline = f.make_pipeline(
        RetryOptions::fixed({.max_retries = 2, .delay = std::chrono::milliseconds{10}}));

    f.mock->queue_connection_error("Fail 1");
    f.mock->queue_connection_error("Fail 2");
    f.mock->queue_json_response(200, R"({})");

    Context ctx;
    auto request = test_request();
    const auto start = std::chrono::steady_clock::now();
    REQUIRE(pipeline.send(ctx, request).has_value());
    const auto elapsed = std::chrono::steady_clock::now() - start;

    // Two retries * 10ms, with some tolerance
    REQUIRE(elapsed >= std::chrono::milliseconds{15});
}

TEST_CASE("Retrying stops when the wait would pass the deadline", "[pipeline][retry][context]") {
    RetryFixture f;
    auto pipeline = f.make_pipeline(
        RetryOptions::fixed({.max_retries = 3, .delay = std::chrono::milliseconds{60'000}}));

    f.mock->queue_response(503, "Service Unavailable");

    Context ctx;
    ctx.with_timeout(std::chrono::seconds{5});
    auto request = test_request();
    auto result = pipeline.send(ctx, request);

    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().http_status == 503);
    REQUIRE(f.mock->request_count() == 1);
}

TEST_CASE("Cancellation between attempts stops the retry loop", "[pipeline][retry][context]") {
    RetryFixture f;
    auto pipeline = f.make_pipeline();

    auto token = std::make_shared<CancellationToken>();
    f.mock->set_response_handler([token](const HttpRequest&) -> HttpClientResult<HttpClientResponse> {
        token->cancel();
        return tl::unexpected(HttpClientError::connection_failed("Connection reset"));
    });

    Context ctx;
    ctx.with_cancellation(token);
    auto request = test_request();
    auto result = pipeline.send(ctx, request);

    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == HttpTransportError::Code::Cancelled);
    REQUIRE(f.mock->request_count() == 1);
}

TEST_CASE("Retry-After is capped at max_retry_after", "[pipeline][retry]") {
    RetryFixture f;
    auto pipeline = f.make_pipeline(
        RetryOptions::fixed({.max_retries = 1, .delay = std::chrono::milliseconds{0}})
            .with_max_retry_after(std::chrono::milliseconds{20}));

    HeaderMap headers;
    headers["Retry-After"] = "86400";
    f.mock->queue_response(503, "maintenance", headers);
    f.mock->queue_json_response(200, R"({})");

    Context ctx;
    auto request = test_request();
    const auto start = std::chrono::steady_clock::now();
    REQUIRE(pipeline.send(ctx, request).has_value());
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(elapsed >= std::chrono::milliseconds{15});
    REQUIRE(elapsed < std::chrono::seconds{5});
    REQUIRE(f.mock->request_count() == 2);
}

TEST_CASE("RetryOptions carries the Retry-After cap", "[retry][options]") {
    REQUIRE(RetryOptions().max_retry_after() == std::chrono::milliseconds{60'000});
    REQUIRE(RetryOptions::none().with_max_retry_after(std::chrono::seconds{5}).max_retry_after() ==
            std::chrono::milliseconds{5'000});
}

TEST_CASE("Cancellation during a retry wait ends it early", "[pipeline][retry][context]") {
    RetryFixture f;
    auto pipeline = f.make_pipeline(
        RetryOptions::fixed({.max_retries = 3, .delay = std::chrono::milliseconds{30'000}}));

    f.mock->queue_response(503, "Service Unavailable");

    auto token = std::make_shared<CancellationToken>();
    std::thread canceller([token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds{100});
        token->cancel();
    });

    Context ctx;
    ctx.with_cancellation(token);
    auto request = test_request();
    const auto start = std::chrono::steady_clock::now();
    auto result = pipeline.send(ctx, request);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == HttpTransportError::Code::Cancelled);
    REQUIRE(elapsed < std::chrono::seconds{5});
    REQUIRE(f.mock->request_count() == 1);
}
