#pragma once

#include "sankeyedit/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace sankeyedit {

/**
 * @brief spdlog-based logger backend
 *
 * Console sink always, plus a truncating file sink when a log directory is
 * given. Honors the LOG_LEVEL / SPDLOG_LEVEL environment variables.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend(const std::string& logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;
    spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace sankeyedit
