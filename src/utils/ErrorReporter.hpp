#pragma once

#include <cstddef>
#include <ios>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // Log directory, log files
    Configuration,  // config.toml parsing and values
    Input,          // Unreadable input files
    Encoding,       // Fields that are not valid UTF-8
    Typography,     // Cloze warnings, failed transforms
    Output          // Writing results
};

enum class ErrorSeverity
{
    Warning, // The field or setting was still used
    Error    // The field or setting was rejected
};

// What a report points at: an input or config file, a line in it and a byte in that line
struct SourceLocation
{
    std::string source;              // File path or "<stdin>"
    std::size_t line = 0;            // 1-based, 0 when not tied to a line
    std::optional<std::size_t> byte; // Byte offset inside the field

    [[nodiscard]] bool empty() const noexcept { return source.empty() && line == 0 && !byte; }
    [[nodiscard]] SourceLocation atByte(std::size_t offset) const;

    // "deck.txt:12, byte 40"
    [[nodiscard]] std::string toString() const;
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Input;
    ErrorSeverity severity = ErrorSeverity::Error;
    std::string message;  // Short, user-facing
    std::string details;  // Parser or exception text
    SourceLocation location;
    std::string timestamp;
};

/**
 * @brief Collects the warnings and errors of one run
 *
 * Every report is logged through plog when raised and queued until the
 * application takes the queue for its end-of-run output. Taken reports are
 * appended to the error log file once one is set.
 *
 * Usage:
 *   ErrorReporter::ReportWarning(ErrorCategory::Typography,
 *                                "unterminated cloze block",
 *                                { .source = "deck.txt", .line = 12, .byte = 40 });
 */
class ErrorReporter
{
public:
    static void Report(ErrorCategory category, ErrorSeverity severity, const std::string& message,
                       const SourceLocation& location = {}, const std::string& details = "");

    static void ReportError(ErrorCategory category, const std::string& message,
                            const SourceLocation& location = {}, const std::string& details = "");

    static void ReportWarning(ErrorCategory category, const std::string& message,
                              const SourceLocation& location = {}, const std::string& details = "");

    /**
     * @brief Empty the queue and return its reports, oldest first
     */
    static std::vector<ErrorReport> TakePending();

    static std::size_t CountPending(ErrorSeverity severity);

    /**
     * @brief Append taken reports to a plain text file
     */
    static void InitializeLogFile(const std::string& path, std::ios::openmode mode = std::ios::app);

    // "Warning: unterminated cloze block (deck.txt:12, byte 40)"
    static std::string Format(const ErrorReport& report);

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);

private:
    static void writeToLogFileLocked(const ErrorReport& report);

    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_queue;
    static std::string s_log_path;
    static bool s_log_initialized;
    static constexpr std::size_t kMaxQueueSize = 1000;
};

} // namespace utils
