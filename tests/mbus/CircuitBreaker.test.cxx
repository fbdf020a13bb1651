#include "unity.h"
#include "mbus/CircuitBreaker.hxx"

using namespace mbusMQTT;

namespace {
    CircuitBreaker makeBreaker(const uint32_t threshold, const std::chrono::seconds timeout) {
        CircuitBreaker cb;
        cb.failure_threshold = threshold;
        cb.timeout = timeout;
        return cb;
    }
}

static void test_breaker_opens_at_threshold() {
    const auto t0 = SteadyClock::now();
    CircuitBreaker cb = makeBreaker(3, std::chrono::seconds{60});

    cb = breakerOnFailure(cb, t0);
    cb = breakerOnFailure(cb, t0);
    TEST_ASSERT_EQUAL(BreakerState::Closed, cb.state);
    TEST_ASSERT_TRUE(breakerTryAcquire(cb, t0).allowed);

    cb = breakerOnFailure(cb, t0);
    TEST_ASSERT_EQUAL(BreakerState::Open, cb.state);
    TEST_ASSERT_EQUAL_UINT32(3, cb.failure_count);
    TEST_ASSERT_FALSE(breakerTryAcquire(cb, t0 + std::chrono::seconds{59}).allowed);
}

static void test_success_resets_failures() {
    const auto t0 = SteadyClock::now();
    CircuitBreaker cb = makeBreaker(3, std::chrono::seconds{60});

    cb = breakerOnFailure(cb, t0);
    cb = breakerOnFailure(cb, t0);
    cb = breakerOnSuccess(cb);
    TEST_ASSERT_EQUAL_UINT32(0, cb.failure_count);

    cb = breakerOnFailure(cb, t0);
    TEST_ASSERT_EQUAL(BreakerState::Closed, cb.state);
}

static void test_half_open_allows_single_trial() {
    const auto t0 = SteadyClock::now();
    CircuitBreaker cb = makeBreaker(1, std::chrono::seconds{60});
    cb = breakerOnFailure(cb, t0);
    TEST_ASSERT_EQUAL(BreakerState::Open, cb.state);

    const auto later = t0 + std::chrono::seconds{60};
    auto gate = breakerTryAcquire(cb, later);
    TEST_ASSERT_TRUE(gate.allowed);
    TEST_ASSERT_EQUAL(BreakerState::HalfOpen, gate.next.state);
    cb = gate.next;

    // Второй запрос, пока пробный не завершён
    gate = breakerTryAcquire(cb, later);
    TEST_ASSERT_FALSE(gate.allowed);

    cb = breakerOnSuccess(cb);
    TEST_ASSERT_EQUAL(BreakerState::Closed, cb.state);
    TEST_ASSERT_FALSE(cb.probe_in_flight);
}

static void test_half_open_failure_reopens() {
    const auto t0 = SteadyClock::now();
    CircuitBreaker cb = makeBreaker(2, std::chrono::seconds{10});
    cb = breakerOnFailure(cb, t0);
    cb = breakerOnFailure(cb, t0);

    const auto t1 = t0 + std::chrono::seconds{10};
    cb = breakerTryAcquire(cb, t1).next;
    TEST_ASSERT_EQUAL(BreakerState::HalfOpen, cb.state);

    cb = breakerOnFailure(cb, t1);
    TEST_ASSERT_EQUAL(BreakerState::Open, cb.state);
    // The timeout counts from the failed trial
    TEST_ASSERT_FALSE(breakerTryAcquire(cb, t1 + std::chrono::seconds{5}).allowed);
    TEST_ASSERT_TRUE(breakerTryAcquire(cb, t1 + std::chrono::seconds{10}).allowed);
}

void run_circuit_breaker_tests() {
    RUN_TEST(test_breaker_opens_at_threshold);
    RUN_TEST(test_success_resets_failures);
    RUN_TEST(test_half_open_allows_single_trial);
    RUN_TEST(test_half_open_failure_reopens);
}
