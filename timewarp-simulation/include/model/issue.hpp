#pragma once

#include "types.hpp"

#include <string>

struct Issue {
    int           id{0};
    std::string   kind;              // e.g. "supplier_delay"
    std::string   title;
    std::string   category;          // business area: supply, quality, ...
    IssueSeverity severity{IssueSeverity::Medium};
    int           createdAtSimDay{1};
    int           createdAtSimHour{0};
    IssueStatus   status{IssueStatus::Active};
    double        escalationShare{0.0}; // share of each tier promoted one tier up while active
};
