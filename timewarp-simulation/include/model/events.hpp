#pragma once

#include "types.hpp"

#include <string>

// One unit of outbound work; consumed exactly once by the DispatchQueue.
struct EventDescriptor {
    long long   id{0};
    Priority    priority{Priority::Normal};
    std::string category;
    int         targetCount{1};   // business volume the event stands for
    int         simDay{1};
    int         simHour{0};
    int         cycleNumber{1};
};

// Returned by the sender for a successful delivery.
struct DeliveryReceipt {
    long long   eventId{0};
    long long   deliveredAtMs{0}; // real monotonic ms
    int         attempts{0};
    std::string reference;
};

// Entries destined for the logger thread
struct LogMessage {
    long long   wallMs{0};        // real monotonic ms at submission
    Role        role{Role::Director};
    std::string text;             // metrics prefix + payload, no newline
};
