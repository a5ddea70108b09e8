#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace greekeval::utils
{

enum class ErrorCategory
{
    Configuration, // TOML parsing, invalid settings
    Logging,       // Log directory, appender registration
    Serialization, // JSON encode/decode of metrics records
    Unknown
};

enum class ErrorSeverity
{
    Info,    // Informational, no action needed
    Warning, // Value ignored, defaults kept
    Error,   // Operation failed, caller can continue
    Fatal    // Host should not continue
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Short description of what went wrong
    std::string technical_details; // Parser message, path, offending value
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Thread-safe error reporter for the evaluation library's outer layers.
 *
 * Every report is logged through plog and queued so a host application can
 * drain and display it. The metrics engine itself never reports here; only
 * configuration loading, logging setup and serialization do.
 *
 * Usage:
 *   ErrorReporter::ReportWarning(ErrorCategory::Configuration,
 *                                "Ignoring invalid rate cap", "metrics.rate_cap = -5");
 *
 *   if (ErrorReporter::HasPendingErrors()) {
 *       for (const auto& report : ErrorReporter::GetPendingErrors()) { ... }
 *   }
 */
class ErrorReporter
{
public:
    /**
     * @brief Report an error to the system
     * @param category Error category
     * @param severity Error severity
     * @param user_message Short message
     * @param technical_details Technical details for debugging
     */
    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                            const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category,
                            const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportError(ErrorCategory category,
                            const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category,
                              const std::string& user_message,
                              const std::string& technical_details = "");

    static bool HasPendingErrors();

    /**
     * @brief Get all pending errors and clear the queue
     */
    static std::vector<ErrorReport> GetPendingErrors();

    /**
     * @brief Get the most recent pending error, or a default report if none
     */
    static ErrorReport GetLastError();

    static void ClearErrors();

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);
    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static constexpr size_t MAX_QUEUE_SIZE = 100;
};

} // namespace greekeval::utils
