#include "ErrorReporter.hpp"
#include <plog/Log.h>
#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace utils
{

namespace
{

std::string currentTimestamp()
{
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace

std::mutex ErrorReporter::s_mutex;
std::vector<ErrorReport> ErrorReporter::s_queue;
std::string ErrorReporter::s_log_path;
bool ErrorReporter::s_log_initialized = false;

SourceLocation SourceLocation::atByte(std::size_t offset) const
{
    SourceLocation located = *this;
    located.byte = offset;
    return located;
}

std::string SourceLocation::toString() const
{
    std::string out = source;
    if (line > 0)
        out += ":" + std::to_string(line);
    if (byte)
    {
        if (!out.empty())
            out += ", ";
        out += "byte " + std::to_string(*byte);
    }
    return out;
}

void ErrorReporter::Report(ErrorCategory category, ErrorSeverity severity, const std::string& message,
                           const SourceLocation& location, const std::string& details)
{
    ErrorReport report;
    report.category = category;
    report.severity = severity;
    report.message = message;
    report.details = details;
    report.location = location;
    report.timestamp = currentTimestamp();

    std::string log_msg = "[" + CategoryToString(category) + "] " + message;
    if (!location.empty())
        log_msg += " at " + location.toString();
    if (!details.empty())
        log_msg += " | " + details;

    if (severity == ErrorSeverity::Warning)
        PLOG_WARNING << log_msg;
    else
        PLOG_ERROR << log_msg;

    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_queue.size() >= kMaxQueueSize)
        s_queue.erase(s_queue.begin());
    s_queue.push_back(std::move(report));
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& message, const SourceLocation& location,
                                const std::string& details)
{
    Report(category, ErrorSeverity::Error, message, location, details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& message, const SourceLocation& location,
                                  const std::string& details)
{
    Report(category, ErrorSeverity::Warning, message, location, details);
}

std::vector<ErrorReport> ErrorReporter::TakePending()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> taken;
    taken.swap(s_queue);
    for (const auto& report : taken)
        writeToLogFileLocked(report);
    return taken;
}

std::size_t ErrorReporter::CountPending(ErrorSeverity severity)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return static_cast<std::size_t>(std::count_if(s_queue.begin(), s_queue.end(),
                                                  [severity](const ErrorReport& report)
                                                  { return report.severity == severity; }));
}

void ErrorReporter::InitializeLogFile(const std::string& path, std::ios::openmode mode)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_log_path = path;
    s_log_initialized = false;

    std::ofstream ofs(s_log_path, mode);
    if (ofs)
    {
        ofs << "\n=== Run started " << currentTimestamp() << " ===\n";
        s_log_initialized = true;
    }
}

std::string ErrorReporter::Format(const ErrorReport& report)
{
    std::string out = SeverityToString(report.severity) + ": " + report.message;
    if (!report.location.empty())
        out += " (" + report.location.toString() + ")";
    if (!report.details.empty())
        out += ": " + report.details;
    return out;
}

std::string ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Input:
        return "Input";
    case ErrorCategory::Encoding:
        return "Encoding";
    case ErrorCategory::Typography:
        return "Typography";
    case ErrorCategory::Output:
        return "Output";
    }
    return "Unknown";
}

std::string ErrorReporter::SeverityToString(ErrorSeverity severity)
{
    return severity == ErrorSeverity::Warning ? "Warning" : "Error";
}

void ErrorReporter::writeToLogFileLocked(const ErrorReport& report)
{
    if (!s_log_initialized)
        return;

    std::ofstream ofs(s_log_path, std::ios::app);
    if (!ofs)
        return;

    ofs << "[" << report.timestamp << "] [" << CategoryToString(report.category) << "] " << Format(report) << '\n';
}

} // namespace utils
