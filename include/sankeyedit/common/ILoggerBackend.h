#pragma once

#include <source_location>
#include <string>

namespace sankeyedit {

/**
 * @brief Log level enumeration
 */
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/**
 * @brief Logger backend interface for dependency injection
 *
 * Implement this interface to route sankeyedit diagnostics into the host
 * application's own logging system.
 *
 * Example:
 * @code
 * class HostLogger : public sankeyedit::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string& message,
 *              const std::source_location& loc) override {
 *         host->write(level, message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(LogLevel level) override { host->setMinLevel(level); }
 *     void flush() override { host->flush(); }
 * };
 *
 * sankeyedit::Logger::setBackend(std::make_unique<HostLogger>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @brief Log a message with source location
     * @param level Log level
     * @param message Pre-formatted message
     * @param loc Source location (file, line, function)
     */
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    /**
     * @brief Set minimum log level
     */
    virtual void setLevel(LogLevel level) = 0;

    /**
     * @brief Flush log buffers
     */
    virtual void flush() = 0;
};

}  // namespace sankeyedit
