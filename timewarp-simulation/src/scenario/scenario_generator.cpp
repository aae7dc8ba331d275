#include "scenario/scenario_generator.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace {
struct IssueTemplate {
    const char*   kind;
    const char*   title;
    const char*   category;
    IssueSeverity severity;
};

const IssueTemplate kIssueTemplates[] = {
    {"server_overload", "Server Overload", "it", IssueSeverity::High},
    {"weekend_order_backlog", "Weekend Order Backlog", "sales", IssueSeverity::Medium},
    {"quality_complaints", "Quality Complaint Spike", "quality", IssueSeverity::High},
    {"defective_batch", "Defective Production Batch", "quality", IssueSeverity::Critical},
    {"supplier_delay", "Supplier Delivery Delay", "supply", IssueSeverity::Critical},
    {"material_shortage", "Material Shortage", "supply", IssueSeverity::High},
    {"customer_complaints", "Customer Complaint Escalation", "support", IssueSeverity::Critical},
    {"delivery_delays", "Delivery Delays", "logistics", IssueSeverity::High},
    {"system_overload", "System Overload", "it", IssueSeverity::High},
    {"staff_shortage", "Staff Shortage", "hr", IssueSeverity::Medium},
    {"urgent_orders", "Urgent Order Surge", "sales", IssueSeverity::High},
};

double shareFor(IssueSeverity severity) {
    switch (severity) {
        case IssueSeverity::Medium: return 0.10;
        case IssueSeverity::High: return 0.20;
        case IssueSeverity::Critical: return 0.35;
    }
    return 0.0;
}

const IssueTemplate* findTemplate(const char* kind) {
    for (const auto& t : kIssueTemplates) {
        if (std::strcmp(t.kind, kind) == 0) return &t;
    }
    return nullptr;
}

const std::vector<DayTheme>& themes() {
    static const std::vector<DayTheme> kThemes = {
        {"Monday Morning Rush", 12,
         {{"weekly_order", Priority::High, 8},
          {"order_backlog", Priority::High, 12},
          {"customer_inquiry", Priority::Normal, 5},
          {"internal_coordination", Priority::Low, 3}},
         {"server_overload", "weekend_order_backlog"}},
        {"Quality Control Crisis", 5,
         {{"defective_batch", Priority::Critical, 6},
          {"quality_complaint", Priority::High, 15},
          {"oem_order", Priority::Normal, 3},
          {"production_planning", Priority::Low, 2}},
         {"quality_complaints", "defective_batch"}},
        {"Supply Chain Disruption", 12,
         {{"material_delay", Priority::Critical, 4},
          {"material_shortage", Priority::High, 8},
          {"supplier_coordination", Priority::Normal, 3},
          {"internal_status", Priority::Low, 2}},
         {"supplier_delay", "material_shortage"}},
        {"Customer Escalation Day", 20,
         {{"executive_escalation", Priority::Critical, 3},
          {"refund_demand", Priority::High, 22},
          {"logistics_update", Priority::Normal, 2},
          {"management_report", Priority::Low, 1}},
         {"customer_complaints", "delivery_delays"}},
        {"Friday Pressure Cooker", 35,
         {{"emergency_order", Priority::Critical, 5},
          {"capacity_alert", Priority::Critical, 1},
          {"week_summary", Priority::Normal, 2},
          {"internal_planning", Priority::Low, 3}},
         {"system_overload", "staff_shortage", "urgent_orders"}},
    };
    return kThemes;
}

int hoursSince(const Issue& issue, int simDay, int simHour) {
    return (simDay - issue.createdAtSimDay) * 24 + (simHour - issue.createdAtSimHour);
}

bool kindActive(const std::vector<Issue>& issues, const char* kind) {
    for (const auto& i : issues) {
        if (i.status == IssueStatus::Active && i.kind == kind) return true;
    }
    return false;
}
} // namespace

ScenarioGenerator::ScenarioGenerator(unsigned int seed) : rng_(seed), nextEventId_(1), nextIssueId_(1) {}

void ScenarioGenerator::reseed(unsigned int seed) {
    rng_.reseed(seed);
    nextEventId_ = 1;
    nextIssueId_ = 1;
}

const DayTheme& ScenarioGenerator::themeForDay(int simDay) {
    const auto& all = themes();
    int idx = (simDay - 1) % static_cast<int>(all.size());
    if (idx < 0) idx += static_cast<int>(all.size());
    return all[static_cast<size_t>(idx)];
}

double ScenarioGenerator::hourMultiplier(int simHour) {
    if (simHour >= 9 && simHour <= 11) return 1.5;   // morning peak
    if (simHour >= 13 && simHour <= 15) return 1.3;  // after lunch
    if (simHour >= 16 && simHour <= 18) return 1.8;  // end of day rush
    return 1.0;
}

bool ScenarioGenerator::isBusinessHour(int simHour) {
    return simHour >= 9 && simHour <= 18;
}

std::vector<int> ScenarioGenerator::apportion(int count, const std::vector<int>& weights) {
    std::vector<int> out(weights.size(), 0);
    long long total = 0;
    for (int w : weights) total += std::max(0, w);
    if (count <= 0 || total == 0) return out;

    std::vector<std::pair<long long, size_t>> remainders;
    int assigned = 0;
    for (size_t i = 0; i < weights.size(); ++i) {
        long long scaled = static_cast<long long>(count) * std::max(0, weights[i]);
        out[i] = static_cast<int>(scaled / total);
        assigned += out[i];
        remainders.emplace_back(scaled % total, i);
    }
    // Largest remainder first; ties keep pattern order.
    std::stable_sort(remainders.begin(), remainders.end(),
                     [](const std::pair<long long, size_t>& a, const std::pair<long long, size_t>& b) {
                         return a.first > b.first;
                     });
    for (size_t k = 0; assigned < count && k < remainders.size(); ++k, ++assigned) {
        out[remainders[k].second] += 1;
    }
    return out;
}

double ScenarioGenerator::escalationShare(const std::vector<Issue>& issues) {
    double keep = 1.0;
    for (const auto& i : issues) {
        if (i.status == IssueStatus::Active) keep *= (1.0 - i.escalationShare);
    }
    return 1.0 - keep;
}

bool ScenarioGenerator::resolveIssue(std::vector<Issue>& issues, int issueId) {
    for (auto it = issues.begin(); it != issues.end(); ++it) {
        if (it->id == issueId && it->status == IssueStatus::Active) {
            issues.erase(it);
            return true;
        }
    }
    return false;
}

int ScenarioGenerator::activeIssueCount(const std::vector<Issue>& issues) {
    return static_cast<int>(std::count_if(issues.begin(), issues.end(),
                                          [](const Issue& i) { return i.status == IssueStatus::Active; }));
}

int ScenarioGenerator::optimizationOpportunities(const std::vector<Issue>& issues) {
    int score = 0;
    for (const auto& i : issues) {
        if (i.status != IssueStatus::Active) continue;
        if (i.severity == IssueSeverity::High) score += 1;
        else if (i.severity == IssueSeverity::Critical) score += 2;
    }
    return score;
}

Issue ScenarioGenerator::makeIssue(const char* kind, int simDay, int simHour) {
    Issue issue;
    issue.id = nextIssueId_++;
    issue.kind = kind;
    const IssueTemplate* t = findTemplate(kind);
    if (t) {
        issue.title = t->title;
        issue.category = t->category;
        issue.severity = t->severity;
    } else {
        issue.title = kind;
        issue.category = "general";
    }
    issue.createdAtSimDay = simDay;
    issue.createdAtSimHour = simHour;
    issue.status = IssueStatus::Active;
    issue.escalationShare = shareFor(issue.severity);
    return issue;
}

ScenarioTick ScenarioGenerator::generate(int simDay, int simHour, std::vector<Issue>& issues, int cycleNumber) {
    ScenarioTick tick;
    const DayTheme& theme = themeForDay(simDay);
    tick.theme = theme.name;

    for (auto it = issues.begin(); it != issues.end();) {
        if (it->status == IssueStatus::Active && hoursSince(*it, simDay, simHour) >= kResolveMinAgeHours &&
            rng_.chance(kResolveChance)) {
            Issue done = *it;
            done.status = IssueStatus::Resolved;
            tick.resolved.push_back(done);
            it = issues.erase(it);
        } else {
            ++it;
        }
    }

    double jitter = rng_.uniformReal(kJitterMin, kJitterMax);
    tick.totalCount = static_cast<int>(std::lround(theme.baseRate * hourMultiplier(simHour) * jitter));

    std::vector<int> weights;
    for (const auto& p : theme.patterns) weights.push_back(p.weight);
    std::vector<int> split = apportion(tick.totalCount, weights);

    double share = escalationShare(issues);
    auto emit = [&](const EventPattern& pattern, Priority priority, int volume) {
        if (volume <= 0) return;
        for (auto& ev : tick.events) {
            if (ev.priority == priority && ev.category == pattern.category) {
                ev.targetCount += volume;
                return;
            }
        }
        EventDescriptor ev;
        ev.id = nextEventId_++;
        ev.priority = priority;
        ev.category = pattern.category;
        ev.targetCount = volume;
        ev.simDay = simDay;
        ev.simHour = simHour;
        ev.cycleNumber = cycleNumber;
        tick.events.push_back(ev);
    };
    for (size_t i = 0; i < theme.patterns.size(); ++i) {
        const EventPattern& pattern = theme.patterns[i];
        int promoted = static_cast<int>(std::floor(split[i] * share));
        emit(pattern, pattern.priority, split[i] - promoted);
        emit(pattern, promote(pattern.priority), promoted);
    }

    double chance = isBusinessHour(simHour) ? kBusinessHourIssueChance : kOffHourIssueChance;
    for (const char* kind : theme.issueKinds) {
        if (kindActive(issues, kind)) continue;
        if (rng_.chance(chance)) {
            Issue issue = makeIssue(kind, simDay, simHour);
            issues.push_back(issue);
            tick.raised.push_back(issue);
        }
    }
    return tick;
}
