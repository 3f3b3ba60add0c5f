#include "csv_loader.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace data {

    namespace {

        constexpr size_t kRequiredColumns = 6; // Date,Open,High,Low,Close,Volume

        std::string trim(const std::string& text) {
            const auto first = std::find_if_not(text.begin(), text.end(),
                                                [](unsigned char c) { return std::isspace(c); });
            const auto last = std::find_if_not(text.rbegin(), text.rend(),
                                               [](unsigned char c) { return std::isspace(c); }).base();
            return (first < last) ? std::string(first, last) : std::string();
        }

        std::vector<std::string> split(const std::string& line, char delimiter) {
            std::vector<std::string> tokens;
            std::stringstream ss(line);
            std::string token;
            while (std::getline(ss, token, delimiter)) {
                tokens.push_back(trim(token));
            }
            return tokens;
        }

        bool looksLikeHeader(const std::vector<std::string>& tokens) {
            if (tokens.empty()) {
                return false;
            }
            std::string first = tokens.front();
            std::transform(first.begin(), first.end(), first.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return first == "date";
        }

        // Whole-field conversion; "12abc" is rejected rather than read as 12
        double parseNumber(const std::string& token, const char* column,
                           const std::string& source, size_t line_num) {
            size_t consumed = 0;
            double value = 0.0;
            try {
                value = std::stod(token, &consumed);
            } catch (const std::logic_error&) {
                consumed = 0;
            }
            if (token.empty() || consumed != token.size()) {
                throw core::DataLoadException(
                    fmt::format("{}:{}: invalid {} value '{}'", source, line_num, column, token));
            }
            return value;
        }

        // Some exports write volume as a float; it still has to fit a long long
        long long parseVolume(const std::string& token, const std::string& source, size_t line_num) {
            const double value = parseNumber(token, "volume", source, line_num);
            constexpr double kLimit = 9223372036854775808.0; // 2^63
            if (!std::isfinite(value) || value >= kLimit || value < -kLimit) {
                throw core::DataLoadException(
                    fmt::format("{}:{}: volume '{}' is not a representable share count", source, line_num, token));
            }
            return static_cast<long long>(value);
        }

    } // end anonymous namespace

    core::PriceSeries CsvLoader::loadFile(const std::string& path) {
        auto logger = core::logging::getLogger();

        std::ifstream file(path);
        if (!file.is_open()) {
            logger->error("Cannot open CSV file: {}", path);
            throw core::DataLoadException(fmt::format("Cannot open CSV file '{}'.", path));
        }

        core::PriceSeries bars = parse(file, path);
        logger->info("Loaded {} bars from {}", bars.size(), path);
        return bars;
    }

    core::PriceSeries CsvLoader::parse(std::istream& input, const std::string& source_name) {
        auto logger = core::logging::getLogger();

        core::PriceSeries bars;
        std::string line;
        size_t line_num = 0;
        bool seen_content = false;

        while (std::getline(input, line)) {
            line_num++;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (trim(line).empty()) {
                continue;
            }

            const std::vector<std::string> tokens = split(line, ',');
            if (!seen_content) {
                seen_content = true;
                if (looksLikeHeader(tokens)) {
                    continue;
                }
            }

            if (tokens.size() < kRequiredColumns) {
                logger->error("{}:{}: expected {} columns, found {}", source_name, line_num,
                              kRequiredColumns, tokens.size());
                throw core::DataLoadException(fmt::format("{}:{}: expected {} columns, found {}",
                                                          source_name, line_num, kRequiredColumns, tokens.size()));
            }

            core::PriceBar bar;
            try {
                bar.timestamp = core::utils::dateToTimestamp(tokens[0]);
            } catch (const std::invalid_argument&) {
                logger->error("{}:{}: invalid date '{}'", source_name, line_num, tokens[0]);
                throw core::DataLoadException(
                    fmt::format("{}:{}: invalid date '{}'", source_name, line_num, tokens[0]));
            }
            bar.open = parseNumber(tokens[1], "open", source_name, line_num);
            bar.high = parseNumber(tokens[2], "high", source_name, line_num);
            bar.low = parseNumber(tokens[3], "low", source_name, line_num);
            bar.close = parseNumber(tokens[4], "close", source_name, line_num);
            bar.volume = parseVolume(tokens[5], source_name, line_num);

            bars.push_back(bar);
        }

        std::stable_sort(bars.begin(), bars.end());
        logger->debug("Parsed {} bars from {} ({} lines).", bars.size(), source_name, line_num);
        return bars;
    }

} // namespace data
