#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "venture/core/clock.hpp"
#include "venture/core/errors.hpp"
#include "venture/instruments/convertible_instrument_engine.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <thread>
#include <vector>

using namespace venture;
using namespace venture::instruments;
using Catch::Matchers::WithinAbs;

namespace {

InstrumentTerms note_terms(double principal = 100000.0, double rate = 8.0)
{
    InstrumentTerms t;
    t.investment_id = "INV-1";
    t.startup_id = "S1";
    t.investor_id = "ANGEL-1";
    t.kind = InstrumentKind::CONVERTIBLE_NOTE;
    t.principal = principal;
    t.interest_rate = rate;
    t.issue_date = core::Date(2024, 1, 1);
    t.maturity_date = core::Date(2026, 1, 1);
    return t;
}

InstrumentTerms safe_terms(double principal = 100000.0)
{
    InstrumentTerms t = note_terms(principal, 0.0);
    t.kind = InstrumentKind::SAFE;
    t.valuation_cap = 10000000.0;
    return t;
}

FinancingRound round_at(double price, double shares = 10000000.0, double raised = 2000000.0)
{
    FinancingRound r;
    r.round_id = "SERIES-A";
    r.price_per_share = price;
    r.fully_diluted_shares = shares;
    r.amount_raised = raised;
    return r;
}

struct EngineFixture {
    InMemoryInstrumentStore store;
    core::ManualClock clock{core::Date(2024, 1, 1)};
    InstrumentEventLog log;
    ConvertibleInstrumentEngine engine{store, clock, &log};
};

} // namespace

// ---------------------------------------------------------------------------
// Creation and validation
// ---------------------------------------------------------------------------

TEST_CASE("create_instrument stores an ACTIVE record", "[ConvertibleInstrumentEngine]") {
    EngineFixture f;
    auto ci = f.engine.create_instrument(note_terms());

    REQUIRE(ci.id == "CI-000001");
    REQUIRE(ci.status == InstrumentStatus::ACTIVE);
    REQUIRE(ci.accrued_interest == 0.0);
    REQUIRE(ci.version == 1);
    REQUIRE(core::Date::from_timestamp(ci.last_accrual) == core::Date(2024, 1, 1));
    REQUIRE(f.engine.get(ci.id).terms.principal == Catch::Approx(100000.0));

    REQUIRE(f.log.num_events() == 1);
    REQUIRE(f.log.events().front().type == InstrumentEventType::CREATED);

    auto safe = f.engine.create_instrument(safe_terms());
    REQUIRE(safe.terms.safe_type.has_value());
    REQUIRE(*safe.terms.safe_type == SafeType::POST_MONEY);
}

TEST_CASE("create_instrument names the invalid field", "[ConvertibleInstrumentEngine]") {
    EngineFixture f;

    auto expect_field = [&](const InstrumentTerms& terms, const std::string& field) {
        try {
            f.engine.create_instrument(terms);
            FAIL("expected ValidationError for " << field);
        } catch (const core::ValidationError& e) {
            REQUIRE(e.field() == field);
        }
    };

    auto t = note_terms();
    t.principal = 0.0;
    expect_field(t, "principal");

    t = note_terms();
    t.interest_rate = 120.0;
    expect_field(t, "interest_rate");

    t = note_terms();
    t.maturity_date = t.issue_date;
    expect_field(t, "maturity_date");

    t = note_terms();
    t.discount_rate = -5.0;
    expect_field(t, "discount_rate");

    t = note_terms();
    t.valuation_cap = 0.0;
    expect_field(t, "valuation_cap");

    t = note_terms();
    t.investment_id.clear();
    expect_field(t, "investment_id");

    t = safe_terms();
    t.interest_rate = 5.0;
    expect_field(t, "interest_rate");

    t = note_terms();
    t.safe_type = SafeType::PRE_MONEY;
    expect_field(t, "safe_type");

    SECTION("SAFE without a cap or discount") {
        t = safe_terms();
        t.valuation_cap.reset();
        expect_field(t, "valuation_cap");

        t.discount_rate = 20.0;
        REQUIRE_NOTHROW(t.validate());
    }

    REQUIRE(f.store.size() == 0);
    REQUIRE(f.log.num_events() == 0);
}

TEST_CASE("get on an unknown id throws NotFoundError", "[ConvertibleInstrumentEngine]") {
    EngineFixture f;
    REQUIRE_THROWS_AS(f.engine.get("CI-000042"), core::NotFoundError);
    REQUIRE_THROWS_AS(f.engine.accrue_interest("CI-000042"), core::NotFoundError);
}

// ---------------------------------------------------------------------------
// Interest accrual
// ---------------------------------------------------------------------------

TEST_CASE("Simple interest accrues on principal", "[ConvertibleInstrumentEngine]") {
    EngineFixture f;
    auto ci = f.engine.create_instrument(note_terms(100000.0, 8.0));

    f.clock.advance_days(180);
    auto result = f.engine.accrue_interest(ci.id);

    REQUIRE_THAT(result.interest_added, WithinAbs(100000.0 * 0.08 * 180.0 / 365.0, 1e-6));
    REQUIRE_THAT(result.interest_added, WithinAbs(3945.205, 1e-3));
    REQUIRE_THAT(result.days_elapsed, WithinAbs(180.0, 1e-9));
    REQUIRE(result.instrument.version == 2);

    // simple interest does not compound on accrued interest
    f.clock.advance_days(180);
    auto second = f.engine.accrue_interest(ci.id);
    REQUIRE_THAT(second.interest_added, WithinAbs(3945.205, 1e-3));
    REQUIRE_THAT(second.instrument.accrued_interest, WithinAbs(7890.411, 1e-3));

    auto s = f.log.get_summary();
    REQUIRE(s.accruals == 2);
    REQUIRE_THAT(s.total_interest_accrued, WithinAbs(7890.411, 1e-3));
}

TEST_CASE("Compound interest is independent of accrual frequency", "[ConvertibleInstrumentEngine]") {
    InMemoryInstrumentStore store;
    core::ManualClock clock(core::Date(2024, 1, 1));
    ConvertibleInstrumentEngine engine(store, clock);

    auto terms = note_terms(100000.0, 10.0);
    terms.compounding = CompoundingMode::COMPOUND;
    auto once = engine.create_instrument(terms);
    auto often = engine.create_instrument(terms);

    // accrue one instrument daily, the other only at the end
    for (int day = 0; day < 365; ++day) {
        clock.advance_days(1);
        engine.accrue_interest(often.id);
    }
    engine.accrue_interest(once.id);

    double expected = 100000.0 * 0.10;
    REQUIRE_THAT(engine.get(once.id).accrued_interest, WithinAbs(expected, 1e-6));
    REQUIRE_THAT(engine.get(often.id).accrued_interest, WithinAbs(expected, 1e-6));
}

TEST_CASE("Accrual ignores a clock that moved backwards", "[ConvertibleInstrumentEngine]") {
    EngineFixture f;
    auto ci = f.engine.create_instrument(note_terms());

    f.clock.advance_days(100);
    auto first = f.engine.accrue_interest(ci.id);
    REQUIRE(first.interest_added > 0.0);

    f.clock.advance_days(-50);
    auto second = f.engine.accrue_interest(ci.id);
    REQUIRE(second.interest_added == 0.0);
    REQUIRE(second.days_elapsed == 0.0);
    REQUIRE(second.instrument.version == first.instrument.version);
    REQUIRE(second.instrument.accrued_interest == first.instrument.accrued_interest);

    // no ACCRUED event for the no-op
    REQUIRE(f.log.get_summary().accruals == 1);
}

TEST_CASE("SAFE agreements never accrue interest", "[ConvertibleInstrumentEngine]") {
    EngineFixture f;
    auto safe = f.engine.create_instrument(safe_terms());

    f.clock.advance_days(400);
    auto result = f.engine.accrue_interest(safe.id);
    REQUIRE(result.interest_added == 0.0);
    REQUIRE(result.instrument.accrued_interest == 0.0);
    REQUIRE(f.log.get_summary().accruals == 0);
}

TEST_CASE("interest_for_period edge cases", "[ConvertibleInstrumentEngine]") {
    ConvertibleInstrument ci;
    ci.terms = note_terms(50000.0, 6.0);

    REQUIRE(ConvertibleInstrumentEngine::interest_for_period(ci, 0.0) == 0.0);
    REQUIRE(ConvertibleInstrumentEngine::interest_for_period(ci, -10.0) == 0.0);
    REQUIRE_THAT(ConvertibleInstrumentEngine::interest_for_period(ci, 365.0), WithinAbs(3000.0, 1e-9));
    REQUIRE_THAT(ConvertibleInstrumentEngine::interest_for_period(ci, 360.0, 360.0), WithinAbs(3000.0, 1e-9));

    ci.terms.compounding = CompoundingMode::COMPOUND;
    ci.accrued_interest = 3000.0;
    REQUIRE_THAT(ConvertibleInstrumentEngine::interest_for_period(ci, 365.0), WithinAbs(53000.0 * 0.06, 1e-6));
}

// ---------------------------------------------------------------------------
// Conversion pricing
// ---------------------------------------------------------------------------

TEST_CASE("Conversion price takes the lowest of discount, cap and round price", "[ConvertibleInstrumentEngine]") {
    auto terms = note_terms();
    terms.discount_rate = 20.0;
    terms.valuation_cap = 5000000.0;

    // cap price 5M / 10M = 0.50 beats discount price 1.60
    REQUIRE_THAT(ConvertibleInstrumentEngine::resolve_conversion_price(terms, round_at(2.0)),
                 WithinAbs(0.50, 1e-12));

    // cap price 0.50 loses to discount price 0.40
    REQUIRE_THAT(ConvertibleInstrumentEngine::resolve_conversion_price(terms, round_at(0.50)),
                 WithinAbs(0.40, 1e-12));

    terms.valuation_cap.reset();
    REQUIRE_THAT(ConvertibleInstrumentEngine::resolve_conversion_price(terms, round_at(2.0)),
                 WithinAbs(1.60, 1e-12));

    terms.discount_rate.reset();
    REQUIRE_THAT(ConvertibleInstrumentEngine::resolve_conversion_price(terms, round_at(2.0)),
                 WithinAbs(2.0, 1e-12));

    // a cap above the round valuation never raises the price
    terms.valuation_cap = 1e12;
    REQUIRE_THAT(ConvertibleInstrumentEngine::resolve_conversion_price(terms, round_at(2.0)),
                 WithinAbs(2.0, 1e-12));
}

TEST_CASE("Conversion price rejects an invalid round", "[ConvertibleInstrumentEngine]") {
    EngineFixture f;
    auto ci = f.engine.create_instrument(note_terms());

    try {
        f.engine.calculate_conversion_price(ci.id, round_at(0.0));
        FAIL("expected ValidationError");
    } catch (const core::ValidationError& e) {
        REQUIRE(e.field() == "price_per_share");
    }

    REQUIRE_THROWS_AS(f.engine.calculate_conversion_price(ci.id, round_at(1.0, 0.0)), core::ValidationError);
}

// ---------------------------------------------------------------------------
// Conversion and repayment
// ---------------------------------------------------------------------------

TEST_CASE("convert accrues final interest and issues whole shares", "[ConvertibleInstrumentEngine]") {
    EngineFixture f;
    auto terms = note_terms(100000.0, 8.0);
    terms.discount_rate = 20.0;
    terms.valuation_cap = 5000000.0;
    auto ci = f.engine.create_instrument(terms);

    f.clock.advance_days(365);
    auto result = f.engine.convert(ci.id, round_at(2.0));

    REQUIRE_THAT(result.final_interest, WithinAbs(8000.0, 1e-6));
    REQUIRE_THAT(result.total_amount, WithinAbs(108000.0, 1e-6));
    REQUIRE_THAT(result.conversion_price, WithinAbs(0.5, 1e-12));
    REQUIRE(result.shares == std::floor(result.total_amount / result.conversion_price));

    const auto& stored = result.instrument;
    REQUIRE(stored.status == InstrumentStatus::CONVERTED);
    REQUIRE(stored.conversion_price.has_value());
    REQUIRE(*stored.conversion_shares == result.shares);
    REQUIRE(stored.closed_at.has_value());
    REQUIRE(f.engine.get(ci.id).status == InstrumentStatus::CONVERTED);

    auto events = f.log.events_for_instrument(ci.id);
    REQUIRE(events.size() == 3);
    REQUIRE(events[1].type == InstrumentEventType::ACCRUED);
    REQUIRE(events[2].type == InstrumentEventType::CONVERTED);
    REQUIRE(events[2].shares == result.shares);
}

TEST_CASE("convert floors fractional shares", "[ConvertibleInstrumentEngine]") {
    EngineFixture f;
    auto terms = safe_terms(100000.0);
    terms.valuation_cap = 3000000.0;
    auto safe = f.engine.create_instrument(terms);

    // cap price 0.30, 100000 / 0.30 = 333333.33
    auto result = f.engine.convert(safe.id, round_at(1.0));
    REQUIRE(result.shares == 333333.0);
    REQUIRE(result.final_interest == 0.0);
}

TEST_CASE("Terminal instruments reject further operations", "[ConvertibleInstrumentEngine]") {
    EngineFixture f;
    auto converted = f.engine.create_instrument(note_terms());
    auto repaid = f.engine.create_instrument(note_terms());

    f.clock.advance_days(30);
    f.engine.convert(converted.id, round_at(1.0));
    f.engine.repay(repaid.id, 1e9);

    for (const auto& id : {converted.id, repaid.id}) {
        REQUIRE_THROWS_AS(f.engine.accrue_interest(id), core::InvalidStateError);
        REQUIRE_THROWS_AS(f.engine.convert(id, round_at(1.0)), core::InvalidStateError);
        REQUIRE_THROWS_AS(f.engine.repay(id, 1e9), core::InvalidStateError);
        TermsUpdate update;
        update.discount_rate = 10.0;
        REQUIRE_THROWS_AS(f.engine.update_terms(id, update), core::InvalidStateError);
    }
    REQUIRE(f.engine.get(repaid.id).status == InstrumentStatus::REPAID);
}

TEST_CASE("Insufficient repayment leaves the instrument untouched", "[ConvertibleInstrumentEngine]") {
    EngineFixture f;
    auto ci = f.engine.create_instrument(note_terms(100000.0, 8.0));
    f.clock.advance_days(180);

    try {
        f.engine.repay(ci.id, 100000.0);
        FAIL("expected InsufficientRepaymentError");
    } catch (const core::InsufficientRepaymentError& e) {
        REQUIRE_THAT(e.amount_owed(), WithinAbs(103945.205, 1e-3));
        REQUIRE(e.amount_offered() == 100000.0);
        REQUIRE(e.code() == "INSUFFICIENT_REPAYMENT");
    }

    auto unchanged = f.engine.get(ci.id);
    REQUIRE(unchanged.status == InstrumentStatus::ACTIVE);
    REQUIRE(unchanged.version == 1);
    REQUIRE(unchanged.accrued_interest == 0.0);
    REQUIRE(f.log.num_events() == 1);

    auto paid = f.engine.repay(ci.id, 110000.0);
    REQUIRE(paid.instrument.status == InstrumentStatus::REPAID);
    REQUIRE_THAT(paid.total_owed, WithinAbs(103945.205, 1e-3));
    REQUIRE(paid.repayment_amount == 110000.0);
    REQUIRE(f.log.get_summary().repayments == 1);
}

TEST_CASE("repay rejects a negative amount", "[ConvertibleInstrumentEngine]") {
    EngineFixture f;
    auto ci = f.engine.create_instrument(note_terms());
    try {
        f.engine.repay(ci.id, -1.0);
        FAIL("expected ValidationError");
    } catch (const core::ValidationError& e) {
        REQUIRE(e.field() == "repayment_amount");
    }
}

TEST_CASE("Concurrent convert and repay commit exactly once", "[ConvertibleInstrumentEngine]") {
    EngineFixture f;
    std::vector<std::string> ids;
    for (int i = 0; i < 20; ++i) {
        ids.push_back(f.engine.create_instrument(note_terms()).id);
    }
    f.clock.advance_days(90);

    std::atomic<int> conversions{0};
    std::atomic<int> repayments{0};
    std::atomic<int> rejected{0};

    for (const auto& id : ids) {
        std::thread a([&] {
            try {
                f.engine.convert(id, round_at(1.0));
                ++conversions;
            } catch (const core::InvalidStateError&) {
                ++rejected;
            }
        });
        std::thread b([&] {
            try {
                f.engine.repay(id, 1e9);
                ++repayments;
            } catch (const core::InvalidStateError&) {
                ++rejected;
            }
        });
        a.join();
        b.join();
    }

    REQUIRE(conversions.load() + repayments.load() == 20);
    REQUIRE(rejected.load() == 20);
    for (const auto& id : ids) {
        auto ci = f.engine.get(id);
        REQUIRE_FALSE(ci.is_active());
        REQUIRE(ci.version == 2);
    }
    REQUIRE(f.engine.tracked_lock_count() == 0);
}

TEST_CASE("Instrument locks are released once an instrument is closed", "[ConvertibleInstrumentEngine]") {
    EngineFixture f;
    auto a = f.engine.create_instrument(note_terms());
    auto b = f.engine.create_instrument(note_terms());
    REQUIRE(f.engine.tracked_lock_count() == 0);

    f.clock.advance_days(30);
    f.engine.accrue_interest(a.id);
    f.engine.accrue_interest(b.id);
    REQUIRE(f.engine.tracked_lock_count() == 2);

    // a failed repayment keeps the instrument open
    REQUIRE_THROWS_AS(f.engine.repay(a.id, 1.0), core::InsufficientRepaymentError);
    REQUIRE(f.engine.tracked_lock_count() == 2);

    f.engine.convert(a.id, round_at(1.0));
    REQUIRE(f.engine.tracked_lock_count() == 1);

    f.engine.repay(b.id, 1e9);
    REQUIRE(f.engine.tracked_lock_count() == 0);

    // rejected calls on closed instruments do not leave entries behind
    REQUIRE_THROWS_AS(f.engine.convert(b.id, round_at(1.0)), core::InvalidStateError);
    REQUIRE_THROWS_AS(f.engine.accrue_interest("CI-000099"), core::NotFoundError);
    REQUIRE(f.engine.tracked_lock_count() == 0);
    REQUIRE(f.engine.get(b.id).status == InstrumentStatus::REPAID);
}

// ---------------------------------------------------------------------------
// Terms and qualification
// ---------------------------------------------------------------------------

TEST_CASE("update_terms applies and re-validates changes", "[ConvertibleInstrumentEngine]") {
    EngineFixture f;
    auto ci = f.engine.create_instrument(note_terms());

    TermsUpdate update;
    update.discount_rate = 15.0;
    update.auto_conversion = false;
    auto updated = f.engine.update_terms(ci.id, update);
    REQUIRE(*updated.terms.discount_rate == 15.0);
    REQUIRE_FALSE(updated.terms.auto_conversion);
    REQUIRE(updated.version == 2);
    REQUIRE(f.log.get_summary().term_updates == 1);

    TermsUpdate bad;
    bad.discount_rate = 150.0;
    try {
        f.engine.update_terms(ci.id, bad);
        FAIL("expected ValidationError");
    } catch (const core::ValidationError& e) {
        REQUIRE(e.field() == "discount_rate");
    }
    REQUIRE(*f.engine.get(ci.id).terms.discount_rate == 15.0);
    REQUIRE(f.engine.get(ci.id).version == 2);

    auto same = f.engine.update_terms(ci.id, TermsUpdate());
    REQUIRE(same.version == 2);
}

TEST_CASE("check_qualified_financing compares against the threshold", "[ConvertibleInstrumentEngine]") {
    EngineFixture f;
    auto terms = note_terms();
    terms.qualified_financing_threshold = 1000000.0;
    auto gated = f.engine.create_instrument(terms);
    auto open = f.engine.create_instrument(note_terms());

    REQUIRE_FALSE(f.engine.check_qualified_financing(gated.id, 999999.0));
    REQUIRE(f.engine.check_qualified_financing(gated.id, 1000000.0));
    REQUIRE(f.engine.check_qualified_financing(open.id, 1.0));
}

// ---------------------------------------------------------------------------
// Queries and batch jobs
// ---------------------------------------------------------------------------

namespace {

struct MaturityFixture : EngineFixture {
    std::string overdue, soon, later, far, closed;

    MaturityFixture()
    {
        clock.set(core::Date(2025, 1, 1));
        auto make = [&](int y, unsigned m, unsigned d) {
            auto t = note_terms();
            t.maturity_date = core::Date(y, m, d);
            return engine.create_instrument(t).id;
        };
        later = make(2025, 1, 20);
        overdue = make(2024, 12, 15);
        far = make(2025, 6, 1);
        soon = make(2025, 1, 10);
        closed = make(2025, 1, 5);
        engine.repay(closed, 1e9);
    }
};

} // namespace

TEST_CASE("list_maturing_within includes overdue notes in maturity order", "[ConvertibleInstrumentEngine]") {
    MaturityFixture f;

    auto due = f.engine.list_maturing_within(30);
    REQUIRE(due.size() == 3);
    REQUIRE(due[0].id == f.overdue);
    REQUIRE(due[1].id == f.soon);
    REQUIRE(due[2].id == f.later);

    REQUIRE(f.engine.list_maturing_within(0).size() == 1);
    REQUIRE(f.engine.list_maturing_within(365).size() == 4);

    try {
        f.engine.list_maturing_within(-1);
        FAIL("expected ValidationError");
    } catch (const core::ValidationError& e) {
        REQUIRE(e.field() == "days");
    }
}

TEST_CASE("list_by_startup and list_by_investor", "[ConvertibleInstrumentEngine]") {
    EngineFixture f;
    auto t = note_terms();
    f.engine.create_instrument(t);
    t.startup_id = "S2";
    t.investor_id = "ANGEL-2";
    f.engine.create_instrument(t);

    REQUIRE(f.engine.list_by_startup("S1").size() == 1);
    REQUIRE(f.engine.list_by_investor("ANGEL-2").front().terms.startup_id == "S2");
    REQUIRE(f.engine.list_by_investor("nobody").empty());
}

TEST_CASE("accrue_all_active reports maturity warnings", "[ConvertibleInstrumentEngine]") {
    MaturityFixture f;

    auto summary = f.engine.accrue_all_active();
    REQUIRE(summary.total_instruments == 4);
    REQUIRE(summary.processed == 4);
    REQUIRE(summary.skipped == 0);
    REQUIRE(summary.failures.empty());
    REQUIRE(summary.interest_accrued > 0.0);

    REQUIRE(summary.overdue.size() == 1);
    REQUIRE(summary.overdue.front() == f.overdue);

    REQUIRE(summary.approaching_maturity.size() == 2);
    REQUIRE(std::find(summary.approaching_maturity.begin(), summary.approaching_maturity.end(), f.soon) !=
            summary.approaching_maturity.end());
    REQUIRE(std::find(summary.approaching_maturity.begin(), summary.approaching_maturity.end(), f.far) ==
            summary.approaching_maturity.end());

    // a second run on the same day adds nothing
    auto again = f.engine.accrue_all_active();
    REQUIRE(again.processed == 4);
    REQUIRE(again.interest_accrued == 0.0);
}

TEST_CASE("process_financing_round converts only qualifying auto-converting notes", "[ConvertibleInstrumentEngine]") {
    EngineFixture f;

    auto auto_note = f.engine.create_instrument(note_terms());

    auto manual = note_terms();
    manual.auto_conversion = false;
    auto manual_note = f.engine.create_instrument(manual);

    auto gated = note_terms();
    gated.qualified_financing_threshold = 5000000.0;
    auto gated_note = f.engine.create_instrument(gated);

    auto other = note_terms();
    other.startup_id = "S2";
    auto other_note = f.engine.create_instrument(other);

    f.clock.advance_days(200);
    auto outcome = f.engine.process_financing_round("S1", round_at(1.0, 10000000.0, 2000000.0));

    REQUIRE(outcome.converted.size() == 1);
    REQUIRE(outcome.converted.front().instrument.id == auto_note.id);
    REQUIRE(outcome.skipped.size() == 2);
    REQUIRE(outcome.failures.empty());

    REQUIRE(f.engine.get(manual_note.id).is_active());
    REQUIRE(f.engine.get(gated_note.id).is_active());
    REQUIRE(f.engine.get(other_note.id).is_active());
    REQUIRE(f.engine.get(auto_note.id).status == InstrumentStatus::CONVERTED);

    REQUIRE_THROWS_AS(f.engine.process_financing_round("S1", round_at(-1.0)), core::ValidationError);
}

TEST_CASE("InstrumentTerms from JSON", "[ConvertibleInstrumentEngine]") {
    auto note = InstrumentTerms::from_json(nlohmann::json::parse(R"({
        "investment_id": "INV-7",
        "startup_id": "S1",
        "investor_id": "I1",
        "principal": 25000,
        "interest_rate": 6,
        "issue_date": "2024-01-01",
        "maturity_date": "2026-01-01",
        "discount_rate": 20,
        "compounding": "COMPOUND",
        "auto_conversion": false
    })"));

    REQUIRE(note.kind == InstrumentKind::CONVERTIBLE_NOTE);
    REQUIRE(note.compounding == CompoundingMode::COMPOUND);
    REQUIRE(note.discount_rate.value() == 20.0);
    REQUIRE_FALSE(note.valuation_cap.has_value());
    REQUIRE_FALSE(note.auto_conversion);
    REQUIRE(note.maturity_date == core::Date(2026, 1, 1));
    REQUIRE_NOTHROW(note.validate());

    auto safe = InstrumentTerms::from_json(nlohmann::json::parse(R"({
        "investment_id": "INV-8",
        "kind": "SAFE",
        "principal": 10000,
        "issue_date": "2024-01-01",
        "maturity_date": "2025-01-01",
        "valuation_cap": 8000000
    })"));
    REQUIRE(safe.kind == InstrumentKind::SAFE);
    REQUIRE(safe.safe_type == SafeType::POST_MONEY);
    REQUIRE(safe.auto_conversion);

    REQUIRE_THROWS_AS(InstrumentTerms::from_json(nlohmann::json::parse(
                          R"({"kind": "WARRANT", "issue_date": "2024-01-01", "maturity_date": "2025-01-01"})")),
                      core::ValidationError);
}
