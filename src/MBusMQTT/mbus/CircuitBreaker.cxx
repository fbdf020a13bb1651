#include "mbus/CircuitBreaker.hxx"

namespace mbusMQTT {

    BreakerGate breakerTryAcquire(const CircuitBreaker& cb, const SteadyClock::time_point now) {
        CircuitBreaker next = cb;
        switch (cb.state) {
            case BreakerState::Closed:
                return {next, true};

            case BreakerState::Open:
                if (now - cb.last_failure_time < cb.timeout) {
                    return {next, false};
                }
                next.state = BreakerState::HalfOpen;
                next.probe_in_flight = true;
                return {next, true};

            case BreakerState::HalfOpen:
                if (cb.probe_in_flight) {
                    return {next, false};
                }
                next.probe_in_flight = true;
                return {next, true};
        }
        return {next, false};
    }

    CircuitBreaker breakerOnSuccess(const CircuitBreaker& cb) {
        CircuitBreaker next = cb;
        next.state = BreakerState::Closed;
        next.failure_count = 0;
        next.probe_in_flight = false;
        return next;
    }

    CircuitBreaker breakerOnFailure(const CircuitBreaker& cb, const SteadyClock::time_point now) {
        CircuitBreaker next = cb;
        next.last_failure_time = now;
        next.probe_in_flight = false;

        if (cb.state == BreakerState::HalfOpen) {
            next.state = BreakerState::Open;
            return next;
        }

        next.failure_count = cb.failure_count + 1;
        if (next.failure_count >= cb.failure_threshold) {
            next.state = BreakerState::Open;
        }
        return next;
    }
} // mbusMQTT
