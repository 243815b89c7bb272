/**
 * @file instrument_event_log.cpp
 * @brief Implementation of InstrumentEventLog
 */

#include "venture/instruments/instrument_event_log.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace venture {
namespace instruments {

namespace {

std::string quote_csv(const std::string &text)
{
    std::string quoted = "\"";
    for (char c : text)
    {
        if (c == '"')
        {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

} // anonymous namespace

std::string to_string(InstrumentEventType type)
{
    switch (type)
    {
    case InstrumentEventType::CREATED:
        return "CREATED";
    case InstrumentEventType::ACCRUED:
        return "ACCRUED";
    case InstrumentEventType::TERMS_UPDATED:
        return "TERMS_UPDATED";
    case InstrumentEventType::CONVERTED:
        return "CONVERTED";
    case InstrumentEventType::REPAID:
        return "REPAID";
    }
    return "UNKNOWN";
}

void InstrumentEventLog::record(const InstrumentEvent &event)
{
    std::lock_guard<std::mutex> lock(mutex_);
    InstrumentEvent e = event;
    e.event_id = next_event_id_++;
    events_.push_back(e);
}

std::vector<InstrumentEvent> InstrumentEventLog::events() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

std::vector<InstrumentEvent> InstrumentEventLog::events_for_instrument(const std::string &instrument_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<InstrumentEvent> out;
    for (const auto &e : events_)
    {
        if (e.instrument_id == instrument_id)
            out.push_back(e);
    }
    return out;
}

InstrumentEventSummary InstrumentEventLog::get_summary() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    InstrumentEventSummary s;
    s.total_events = static_cast<int>(events_.size());

    for (const auto &e : events_)
    {
        switch (e.type)
        {
        case InstrumentEventType::CREATED:
            ++s.created;
            break;
        case InstrumentEventType::ACCRUED:
            ++s.accruals;
            s.total_interest_accrued += e.amount;
            break;
        case InstrumentEventType::TERMS_UPDATED:
            ++s.term_updates;
            break;
        case InstrumentEventType::CONVERTED:
            ++s.conversions;
            s.total_converted += e.amount;
            break;
        case InstrumentEventType::REPAID:
            ++s.repayments;
            s.total_repaid += e.amount;
            break;
        }
    }

    return s;
}

int InstrumentEventLog::num_events() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(events_.size());
}

void InstrumentEventLog::export_to_csv(const std::string &filepath) const
{
    std::filesystem::path path(filepath);
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(filepath);
    if (!file.is_open())
    {
        throw std::runtime_error("Could not open file for writing: " + filepath);
    }

    auto snapshot = events();

    file << "event_id,instrument_id,type,date,epoch_seconds,amount,balance_after,price,shares,detail\n";
    file << std::fixed << std::setprecision(8);

    for (const auto &e : snapshot)
    {
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(e.at.time_since_epoch()).count();
        file << e.event_id << ","
             << e.instrument_id << ","
             << to_string(e.type) << ","
             << core::Date::from_timestamp(e.at).to_string() << ","
             << secs << ","
             << e.amount << ","
             << e.balance_after << ","
             << e.price << ","
             << e.shares << ","
             << quote_csv(e.detail) << "\n";
    }

    file.close();
}

void InstrumentEventLog::print_summary() const
{
    auto s = get_summary();
    std::cout << "\n=== Instrument Event Summary ===\n";
    std::cout << "Total events: " << s.total_events << "\n";
    std::cout << "Created: " << s.created << "  Accruals: " << s.accruals
              << "  Term updates: " << s.term_updates << "\n";
    std::cout << "Conversions: " << s.conversions << "  Repayments: " << s.repayments << "\n";
    std::cout << "Interest accrued: " << s.total_interest_accrued << "\n";
    std::cout << "Amount converted: " << s.total_converted << "\n";
    std::cout << "Amount repaid: " << s.total_repaid << "\n";
    std::cout << "================================\n";
}

void InstrumentEventLog::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
    next_event_id_ = 0;
}

} // namespace instruments
} // namespace venture
