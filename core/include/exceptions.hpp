#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class BacktestEngineException : public std::runtime_error {
    public:
        explicit BacktestEngineException(const std::string& message)
            : std::runtime_error(message) {}

        explicit BacktestEngineException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public BacktestEngineException {
    public: using BacktestEngineException::BacktestEngineException; };

    class DataLoadException : public BacktestEngineException {
    public: using BacktestEngineException::BacktestEngineException; };

    // Structurally malformed price series (empty, unordered, bad prices)
    class InvalidSeriesException : public BacktestEngineException {
    public: using BacktestEngineException::BacktestEngineException; };

    class BacktestException : public BacktestEngineException {
    public: using BacktestEngineException::BacktestEngineException; };

} // namespace core
