#ifndef MBUSMQTT_CIRCUITBREAKER_HXX
#define MBUSMQTT_CIRCUITBREAKER_HXX

#include "mbus/MBusTypes.hxx"

namespace mbusMQTT
{
    enum class BreakerState : uint8_t {
        Closed,
        Open,
        HalfOpen
    };

    struct CircuitBreaker {
        BreakerState state{BreakerState::Closed};
        uint32_t failure_count{0};
        SteadyClock::time_point last_failure_time{};
        uint32_t failure_threshold{5};
        std::chrono::seconds timeout{300};
        bool probe_in_flight{false};     // half-open: the single trial attempt was handed out
    };

    struct BreakerGate {
        CircuitBreaker next;
        bool allowed;
    };

    /**
     * @brief Decide whether a bus attempt may proceed at time now.
     * Open turns into HalfOpen once timeout has elapsed since the last failure,
     * and HalfOpen lets exactly one attempt through until its outcome is reported.
     */
    [[nodiscard]] BreakerGate breakerTryAcquire(const CircuitBreaker& cb, SteadyClock::time_point now);

    [[nodiscard]] CircuitBreaker breakerOnSuccess(const CircuitBreaker& cb);
    [[nodiscard]] CircuitBreaker breakerOnFailure(const CircuitBreaker& cb, SteadyClock::time_point now);

    constexpr const char* breakerStateToString(const BreakerState state) {
        switch (state) {
            case BreakerState::Closed:   return "closed";
            case BreakerState::Open:     return "open";
            case BreakerState::HalfOpen: return "half-open";
        }
        return "unknown";
    }
} // mbusMQTT

#endif //MBUSMQTT_CIRCUITBREAKER_HXX
