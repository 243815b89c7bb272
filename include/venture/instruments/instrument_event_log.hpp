#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "venture/core/date.hpp"

namespace venture {
namespace instruments {

enum class InstrumentEventType {
    CREATED,
    ACCRUED,
    TERMS_UPDATED,
    CONVERTED,
    REPAID
};

std::string to_string(InstrumentEventType type);

struct InstrumentEvent {
    int event_id = 0;
    std::string instrument_id;
    InstrumentEventType type = InstrumentEventType::CREATED;
    core::Timestamp at;
    double amount = 0.0;          // interest added, amount converted, or amount repaid
    double balance_after = 0.0;   // principal + accrued interest after the event
    double price = 0.0;           // conversion price (CONVERTED only)
    double shares = 0.0;          // shares issued (CONVERTED only)
    std::string detail;
};

struct InstrumentEventSummary {
    int total_events = 0;
    int created = 0;
    int accruals = 0;
    int term_updates = 0;
    int conversions = 0;
    int repayments = 0;
    double total_interest_accrued = 0.0;
    double total_converted = 0.0;
    double total_repaid = 0.0;
};

// Append-only audit trail of instrument lifecycle events. Safe to share
// between threads.
class InstrumentEventLog {
public:
    InstrumentEventLog() = default;
    ~InstrumentEventLog() = default;

    void record(const InstrumentEvent& event);

    std::vector<InstrumentEvent> events() const;
    std::vector<InstrumentEvent> events_for_instrument(const std::string& instrument_id) const;
    InstrumentEventSummary get_summary() const;
    int num_events() const;

    void export_to_csv(const std::string& filepath) const;
    void print_summary() const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<InstrumentEvent> events_;
    int next_event_id_ = 0;
};

} // namespace instruments
} // namespace venture
