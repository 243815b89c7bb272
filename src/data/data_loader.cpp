/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader
 */

#include "venture/data/data_loader.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace venture
{
    namespace data
    {

        // ===========================
        // JSON
        // ===========================

        nlohmann::json DataLoader::load_json(const std::string &filepath)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open JSON file: " + filepath);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error("JSON parsing error in " + filepath + ": " + std::string(e.what()));
            }

            file.close();
            return j;
        }

        EngineConfig DataLoader::load_config(const std::string &config_path)
        {
            auto j = load_json(config_path);

            try
            {
                return EngineConfig::from_json(j);
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error("Invalid configuration in " + config_path + ": " + std::string(e.what()));
            }
        }

        std::vector<PortfolioRecords> DataLoader::load_portfolios(const std::string &filepath)
        {
            auto j = load_json(filepath);

            std::vector<PortfolioRecords> portfolios;
            try
            {
                if (j.contains("portfolios"))
                {
                    for (const auto &p : j["portfolios"])
                    {
                        portfolios.push_back(PortfolioRecords::from_json(p));
                    }
                }
                else
                {
                    portfolios.push_back(PortfolioRecords::from_json(j));
                }
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error("Invalid portfolio data in " + filepath + ": " + std::string(e.what()));
            }

            return portfolios;
        }

        // ===========================
        // Benchmarks
        // ===========================

        BenchmarkSeries DataLoader::load_benchmark(const std::string &filepath)
        {
            if (std::filesystem::path(filepath).extension() == ".csv")
            {
                return load_benchmark_csv(filepath);
            }

            auto j = load_json(filepath);
            try
            {
                return BenchmarkSeries::from_json(j);
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error("Invalid benchmark data in " + filepath + ": " + std::string(e.what()));
            }
        }

        BenchmarkSeries DataLoader::load_benchmark_csv(const std::string &filepath)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file: " + filepath);
            }

            std::string line;
            if (!std::getline(file, line))
            {
                throw std::runtime_error("Empty CSV file: " + filepath);
            }

            auto header = parse_csv_line(line);
            if (header.size() < 2 || trim(header[0]) != "date")
            {
                throw std::runtime_error("CSV must start with 'date' column");
            }

            BenchmarkSeries series;
            series.name = std::filesystem::path(filepath).stem().string();

            size_t line_number = 1;
            while (std::getline(file, line))
            {
                ++line_number;
                if (trim(line).empty())
                    continue;

                auto fields = parse_csv_line(line);
                if (fields.size() < 2)
                {
                    throw std::runtime_error("Malformed row at line " + std::to_string(line_number) + " of " + filepath);
                }

                DatedReturn point;
                point.date = core::Date::parse(trim(fields[0]));
                try
                {
                    point.value = std::stod(trim(fields[1]));
                }
                catch (const std::exception &)
                {
                    throw std::runtime_error("Invalid return value '" + fields[1] + "' at line " +
                                             std::to_string(line_number) + " of " + filepath);
                }
                series.returns.push_back(point);
            }

            std::stable_sort(series.returns.begin(), series.returns.end(),
                             [](const DatedReturn &a, const DatedReturn &b)
                             { return a.date < b.date; });
            return series;
        }

        // ===========================
        // Helpers
        // ===========================

        std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
        {
            std::vector<std::string> tokens;
            std::string token;
            bool in_quotes = false;

            for (char c : line)
            {
                if (c == '"')
                {
                    in_quotes = !in_quotes;
                }
                else if (c == ',' && !in_quotes)
                {
                    tokens.push_back(token);
                    token.clear();
                }
                else
                {
                    token += c;
                }
            }

            tokens.push_back(token);
            return tokens;
        }

        std::string DataLoader::trim(const std::string &str)
        {
            size_t first = str.find_first_not_of(" \t\r\n");
            if (first == std::string::npos)
                return "";

            size_t last = str.find_last_not_of(" \t\r\n");
            return str.substr(first, last - first + 1);
        }

    } // namespace data
} // namespace venture
