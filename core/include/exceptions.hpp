#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class SignalGeneratorException : public std::runtime_error {
    public:
        explicit SignalGeneratorException(const std::string& message)
            : std::runtime_error(message) {}

        explicit SignalGeneratorException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public SignalGeneratorException {
    public: using SignalGeneratorException::SignalGeneratorException; };

    // Missing or stale market data. Skips a symbol or a strategy, never the run.
    class DataUnavailableException : public SignalGeneratorException {
    public: using SignalGeneratorException::SignalGeneratorException; };

    class ApiRequestException : public SignalGeneratorException {
    public: using SignalGeneratorException::SignalGeneratorException; };

    // Brokerage rejected the credentials. Fatal for the whole run.
    class AuthenticationException : public ApiRequestException {
    public: using ApiRequestException::ApiRequestException; };

    // Negative or missing buying power. Fatal before allocation.
    class CapitalStateException : public SignalGeneratorException {
    public: using SignalGeneratorException::SignalGeneratorException; };

    class IndicatorCalculationException : public SignalGeneratorException {
    public: using SignalGeneratorException::SignalGeneratorException; };

    // Not enough history for an indicator's lookback.
    class IndicatorWarmupException : public IndicatorCalculationException {
    public: using IndicatorCalculationException::IndicatorCalculationException; };

    class StrategyException : public SignalGeneratorException {
    public: using SignalGeneratorException::SignalGeneratorException; };

    class OutputException : public SignalGeneratorException {
    public: using SignalGeneratorException::SignalGeneratorException; };

} // namespace core
