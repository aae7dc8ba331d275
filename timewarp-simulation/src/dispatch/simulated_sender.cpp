#include "dispatch/simulated_sender.hpp"

#include "logging/logger.hpp"

#include <string>

SimulatedSender::SimulatedSender(int transientPercent, int terminalPercent, unsigned int seed,
                                 const TimeSource& time, LogQueue* log)
    : transientPercent_(transientPercent),
      terminalPercent_(terminalPercent),
      rng_(seed),
      time_(time),
      log_(log),
      calls_(0) {}

DeliveryStatus SimulatedSender::deliver(const EventDescriptor& event, DeliveryReceipt& receipt,
                                        std::string& error) {
    ++calls_;
    int roll = rng_.uniformInt(1, 100);
    if (roll <= terminalPercent_) {
        error = "channel rejected event " + std::to_string(event.id);
        return DeliveryStatus::TerminalFailure;
    }
    if (roll <= terminalPercent_ + transientPercent_) {
        error = "channel timeout for event " + std::to_string(event.id);
        return DeliveryStatus::TransientFailure;
    }

    receipt.eventId = event.id;
    receipt.deliveredAtMs = time_.nowMs();
    receipt.reference = "TW-" + std::to_string(event.cycleNumber) + "-" + std::to_string(event.id);
    logEvent(log_, Role::Sender,
             "delivered id=" + std::to_string(event.id) + " prio=" + priorityName(event.priority)
             + " cat=" + event.category + " targets=" + std::to_string(event.targetCount)
             + " day=" + std::to_string(event.simDay) + " hour=" + std::to_string(event.simHour));
    return DeliveryStatus::Delivered;
}
