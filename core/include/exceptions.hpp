#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class BacktesterException : public std::runtime_error {
    public:
        explicit BacktesterException(const std::string& message)
            : std::runtime_error(message) {}

        explicit BacktesterException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigurationException : public BacktesterException {
    public: using BacktesterException::BacktesterException; };

    // Non-finite or negative prices, non-increasing dates
    class DataQualityException : public BacktesterException {
    public: using BacktesterException::BacktesterException; };

    // Signal series does not line up with the price series it is replayed against
    class AlignmentException : public BacktesterException {
    public: using BacktesterException::BacktesterException; };

    class DataLoadException : public BacktesterException {
    public: using BacktesterException::BacktesterException; };

    class IndicatorCalculationException : public BacktesterException {
    public: using BacktesterException::BacktesterException; };

} // namespace core
