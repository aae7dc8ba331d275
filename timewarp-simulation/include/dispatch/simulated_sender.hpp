#pragma once

#include "clock/time_source.hpp"
#include "dispatch/event_sender.hpp"
#include "util/random.hpp"

class LogQueue;

/**
 * @brief Stand-in for the outbound message channel.
 *
 * Accepts every event except for a configurable share of injected
 * transient and terminal failures, and logs each delivery.
 */
class SimulatedSender : public EventSender {
public:
    /**
     * @param transientPercent chance (0..100) of a TransientFailure per call.
     * @param terminalPercent chance (0..100) of a TerminalFailure per call.
     * @param seed RNG seed for the failure draws.
     */
    SimulatedSender(int transientPercent, int terminalPercent, unsigned int seed,
                    const TimeSource& time, LogQueue* log = nullptr);

    DeliveryStatus deliver(const EventDescriptor& event, DeliveryReceipt& receipt,
                           std::string& error) override;

    long long callCount() const { return calls_; }

private:
    int transientPercent_;
    int terminalPercent_;
    RandomGenerator rng_;
    const TimeSource& time_;
    LogQueue* log_;
    long long calls_;
};
