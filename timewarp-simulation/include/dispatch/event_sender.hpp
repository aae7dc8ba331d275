#pragma once

#include "model/events.hpp"
#include "model/types.hpp"

#include <string>

/**
 * @brief External channel that delivers one event.
 *
 * Called only from the dispatch consumer context, one call at a time.
 */
class EventSender {
public:
    virtual ~EventSender() = default;

    /**
     * @brief Deliver one event.
     * @param event event to send.
     * @param receipt filled on Delivered.
     * @param error reason on a failure status.
     * @return Delivered, TransientFailure (worth retrying) or TerminalFailure.
     */
    virtual DeliveryStatus deliver(const EventDescriptor& event, DeliveryReceipt& receipt,
                                   std::string& error) = 0;
};
