#include "core/reporting.hpp"

#include <algorithm>

#include "core/logging.hpp"

namespace dicom_stacker::core {

LoggingReporting::LoggingReporting(const std::string& loggerName)
    : logger_(logging::LoggerFactory::create(loggerName))
{
}

LoggingReporting::~LoggingReporting() = default;

void LoggingReporting::showProgress(const std::string& label)
{
    currentLabel_ = label;
    lastPercent_ = -1;
    logger_->info("{}", label);
}

void LoggingReporting::updateProgress(int percent)
{
    percent = std::clamp(percent, 0, 100);
    if (percent == lastPercent_) {
        return;
    }
    lastPercent_ = percent;
    logger_->debug("{}: {}%", currentLabel_, percent);
}

void LoggingReporting::completeProgress()
{
    if (lastPercent_ != 100) {
        logger_->debug("{}: 100%", currentLabel_);
    }
    lastPercent_ = 100;
}

void LoggingReporting::showWarning(const std::string& identifier, const std::string& text)
{
    logger_->warn("[{}] {}", identifier, text);
}

void LoggingReporting::showMessage(const std::string& identifier, const std::string& text)
{
    logger_->info("[{}] {}", identifier, text);
}

}  // namespace dicom_stacker::core
