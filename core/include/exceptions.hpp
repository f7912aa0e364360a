#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class EngineException : public std::runtime_error {
    public:
        explicit EngineException(const std::string& message)
            : std::runtime_error(message) {}

        explicit EngineException(const char* message)
            : std::runtime_error(message) {}
    };

    // --- Fatal: engine refuses to start ---
    class ConfigException : public EngineException {
    public: using EngineException::EngineException; };

    class FatalStartupException : public EngineException {
    public: using EngineException::EngineException; };

    // --- Transient: retried with backoff ---
    class TransientException : public EngineException {
    public: using EngineException::EngineException; };

    class TimeoutException : public TransientException {
    public: using TransientException::TransientException; };

    class RateLimitException : public TransientException {
    public: using TransientException::TransientException; };

    class DisconnectedException : public TransientException {
    public: using TransientException::TransientException; };

    // --- Critical: entries suspended, exits continue ---
    class AuthenticationException : public EngineException {
    public: using EngineException::EngineException; };

    // --- Data: instrument skipped for this cycle ---
    class DataException : public EngineException {
    public: using EngineException::EngineException; };

    class DataLoadException : public DataException {
    public: using DataException::DataException; };

    class IndicatorCalculationException : public DataException {
    public: using DataException::DataException; };

    // --- Component level ---
    class ApiRequestException : public EngineException {
    public: using EngineException::EngineException; };

    class StrategyException : public EngineException {
    public: using EngineException::EngineException; };

    class ScreeningException : public EngineException {
    public: using EngineException::EngineException; };

} // namespace core
