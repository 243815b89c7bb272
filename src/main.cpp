/**
 * @file main.cpp
 * @brief Main entry point for the Venture Analytics command-line tool
 *
 * Loads configuration and portfolio records, computes performance, risk,
 * benchmark and peer analytics for one portfolio, and optionally runs the
 * convertible instrument accrual job over an instrument file.
 */

#include "venture/analytics/portfolio_analytics_service.hpp"
#include "venture/core/clock.hpp"
#include "venture/core/errors.hpp"
#include "venture/data/data_loader.hpp"
#include "venture/instruments/convertible_instrument_engine.hpp"
#include "venture/instruments/instrument_event_log.hpp"
#include "venture/instruments/instrument_store.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace venture;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Venture Analytics v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (default: built-in defaults)\n"
              << "  --portfolio PATH      Path to portfolio records JSON file\n"
              << "  --id ID               Portfolio to analyze\n"
              << "  --start YYYY-MM-DD    Range start (default: open)\n"
              << "  --end YYYY-MM-DD      Range end (default: portfolio as-of date)\n"
              << "  --benchmark PATH      Benchmark return series (JSON or CSV)\n"
              << "  --peers LIST          Comma-separated peer annualized returns\n"
              << "  --instruments PATH    Convertible instrument terms JSON; runs the accrual job\n"
              << "  --as-of YYYY-MM-DD    Accrual date for --instruments (default: today)\n"
              << "  --events-out PATH     Export instrument events to CSV\n"
              << "  --json                Print results as JSON\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --portfolio data/portfolios.json --id P1 --benchmark data/sp500.csv\n"
              << "  " << program_name << " --instruments data/instruments.json --as-of 2025-06-30 --verbose\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       Venture Analytics v1.0.0                                 \n"
              << "       Portfolio Performance & Convertible Instruments          \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string portfolio_path;
    std::string portfolio_id;
    std::string start_date;
    std::string end_date;
    std::string benchmark_path;
    std::string peers;
    std::string instruments_path;
    std::string as_of;
    std::string events_out;
    bool json = false;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--portfolio" && i + 1 < argc)
            {
                args.portfolio_path = argv[++i];
            }
            else if (arg == "--id" && i + 1 < argc)
            {
                args.portfolio_id = argv[++i];
            }
            else if (arg == "--start" && i + 1 < argc)
            {
                args.start_date = argv[++i];
            }
            else if (arg == "--end" && i + 1 < argc)
            {
                args.end_date = argv[++i];
            }
            else if (arg == "--benchmark" && i + 1 < argc)
            {
                args.benchmark_path = argv[++i];
            }
            else if (arg == "--peers" && i + 1 < argc)
            {
                args.peers = argv[++i];
            }
            else if (arg == "--instruments" && i + 1 < argc)
            {
                args.instruments_path = argv[++i];
            }
            else if (arg == "--as-of" && i + 1 < argc)
            {
                args.as_of = argv[++i];
            }
            else if (arg == "--events-out" && i + 1 < argc)
            {
                args.events_out = argv[++i];
            }
            else if (arg == "--json")
            {
                args.json = true;
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool wants_portfolio() const
    {
        return !portfolio_path.empty() && !portfolio_id.empty();
    }

    bool is_valid() const
    {
        return !show_help && (wants_portfolio() || !instruments_path.empty());
    }
};

/**
 * @brief Parse "0.1,0.25,-0.05" into a vector
 */
std::vector<double> parse_peer_list(const std::string &text)
{
    std::vector<double> values;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ','))
    {
        if (item.empty())
            continue;
        try
        {
            values.push_back(std::stod(item));
        }
        catch (const std::exception &)
        {
            throw std::invalid_argument("Invalid peer return: '" + item + "'");
        }
    }
    return values;
}

/**
 * @brief Portfolio analytics section
 */
void run_portfolio(const CommandLineArgs &args, const EngineConfig &config, const core::Clock &clock,
                   nlohmann::json &json_out)
{
    data::InMemoryPortfolioSource source;
    for (auto &records : data::DataLoader::load_portfolios(args.portfolio_path))
    {
        source.add(std::move(records));
    }

    data::DateRange range;
    if (!args.start_date.empty())
        range.start = core::Date::parse(args.start_date);
    if (!args.end_date.empty())
        range.end = core::Date::parse(args.end_date);

    analytics::PortfolioAnalyticsService service(source, clock, config);

    if (!args.json)
        std::cout << "Computing performance for " << args.portfolio_id << "..." << std::endl;

    auto performance = service.performance(args.portfolio_id, range);
    auto risk = service.risk_report(args.portfolio_id, range);

    if (args.json)
    {
        json_out["performance"] = nlohmann::json::parse(performance.to_json());
        json_out["risk"] = nlohmann::json::parse(risk.to_json());
    }
    else
    {
        std::cout << "\n" << performance.summary() << "\n" << risk.summary();
    }

    if (!args.benchmark_path.empty())
    {
        auto benchmark = data::DataLoader::load_benchmark(args.benchmark_path);
        if (args.verbose)
        {
            std::cout << "Loaded benchmark '" << benchmark.name << "' with " << benchmark.returns.size()
                      << " returns" << std::endl;
        }

        try
        {
            auto comparison = service.compare_to_index(args.portfolio_id, benchmark, range);
            if (args.json)
                json_out["benchmark"] = nlohmann::json::parse(comparison.to_json());
            else
                std::cout << "\n" << comparison.summary();
        }
        catch (const core::InsufficientDataError &e)
        {
            std::cerr << "Warning: benchmark comparison skipped: " << e.what() << std::endl;
            if (args.json)
                json_out["benchmark"] = {{"error", e.code()}, {"message", e.what()}};
        }
    }

    if (!args.peers.empty())
    {
        auto peers = service.compare_to_peers(args.portfolio_id, parse_peer_list(args.peers), range);
        if (args.json)
            json_out["peers"] = nlohmann::json::parse(peers.to_json());
        else
            std::cout << "\n" << peers.summary();
    }
}

/**
 * @brief Convertible instrument accrual job section
 */
void run_instruments(const CommandLineArgs &args, const EngineConfig &config, nlohmann::json &json_out)
{
    core::Date as_of = args.as_of.empty() ? core::SystemClock().today() : core::Date::parse(args.as_of);
    core::ManualClock clock(as_of);

    instruments::InMemoryInstrumentStore store;
    instruments::InstrumentEventLog event_log;
    instruments::ConvertibleInstrumentEngine engine(store, clock, &event_log, config.instruments);

    auto j = data::DataLoader::load_json(args.instruments_path);
    const auto &list = j.contains("instruments") ? j["instruments"] : j;

    int created = 0;
    for (const auto &entry : list)
    {
        instruments::InstrumentTerms terms;
        try
        {
            terms = instruments::InstrumentTerms::from_json(entry);
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("Invalid instrument entry in " + args.instruments_path + ": " + e.what());
        }
        engine.create_instrument(terms);
        ++created;
    }

    if (!args.json)
        std::cout << "\nLoaded " << created << " instruments, accruing to " << as_of.to_string() << "..." << std::endl;

    auto summary = engine.accrue_all_active();
    auto maturing = engine.list_maturing_within(config.instruments.maturity_warning_days);

    if (args.json)
    {
        nlohmann::json job;
        job["as_of"] = as_of.to_string();
        job["total_instruments"] = summary.total_instruments;
        job["processed"] = summary.processed;
        job["interest_accrued"] = summary.interest_accrued;
        job["approaching_maturity"] = summary.approaching_maturity;
        job["overdue"] = summary.overdue;
        job["failures"] = nlohmann::json::array();
        for (const auto &f : summary.failures)
        {
            job["failures"].push_back({{"instrument_id", f.instrument_id}, {"code", f.code}, {"message", f.message}});
        }
        job["instruments"] = nlohmann::json::array();
        for (const auto &ci : store.find_by_status(instruments::InstrumentStatus::ACTIVE))
        {
            job["instruments"].push_back(ci.to_json());
        }
        json_out["accrual_job"] = job;
    }
    else
    {
        std::cout << "\nAccrual Job\n";
        std::cout << std::string(60, '-') << "\n";
        std::cout << "  Processed:           " << summary.processed << " / " << summary.total_instruments << "\n";
        std::cout << "  Interest Accrued:    " << std::fixed << std::setprecision(2) << summary.interest_accrued << "\n";
        std::cout << "  Failures:            " << summary.failures.size() << "\n";

        std::cout << "\nMaturing within " << config.instruments.maturity_warning_days << " days:\n";
        for (const auto &ci : maturing)
        {
            std::cout << "  " << ci.id << "  " << ci.terms.investment_id << "  matures "
                      << ci.terms.maturity_date.to_string() << "  balance " << std::setprecision(2)
                      << ci.balance() << "\n";
        }
        if (maturing.empty())
        {
            std::cout << "  (none)\n";
        }

        if (args.verbose)
        {
            event_log.print_summary();
        }
    }

    if (!args.events_out.empty())
    {
        event_log.export_to_csv(args.events_out);
        if (!args.json)
            std::cout << "\n  Events exported to: " << args.events_out << "\n";
    }
}

/**
 * @brief Run the requested analyses
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        EngineConfig config;
        if (!args.config_path.empty())
        {
            if (args.verbose && !args.json)
                std::cout << "Loading configuration from: " << args.config_path << std::endl;
            config = data::DataLoader::load_config(args.config_path);
        }
        if (args.verbose)
        {
            config.verbose = true;
            config.instruments.verbose = true;
        }

        core::SystemClock clock;
        nlohmann::json json_out;

        if (args.wants_portfolio())
        {
            run_portfolio(args, config, clock, json_out);
        }

        if (!args.instruments_path.empty())
        {
            run_instruments(args, config, json_out);
        }

        if (args.json)
        {
            std::cout << json_out.dump(2) << std::endl;
            return 0;
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();

        std::cout << "\n================================================================\n";
        std::cout << "Analysis completed successfully in " << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const core::EngineError &e)
    {
        std::cerr << "\nError [" << e.code() << "]: " << e.what() << std::endl;
        return 2;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    auto args = CommandLineArgs::parse(argc, argv);

    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    if (!args.json)
    {
        print_banner();
    }

    return run(args);
}
