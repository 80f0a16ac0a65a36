#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// Filled from [global] and [app.debug] by the settings layer
struct LogSettings
{
    bool append = true;
    plog::Severity level = plog::info;
    std::filesystem::path directory = "logs";
};

/**
 * @brief Owns the plog appenders of the run
 *
 * Initialize() once with the resolved settings, then register one rolling
 * file logger per plog instance. stdout carries the processed fields, so the
 * optional console mirror always writes to stderr.
 */
class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filename; // Relative to LogSettings::directory
        std::optional<plog::Severity> level_override;
        std::size_t max_file_size = 5 * 1024 * 1024;
        int backup_count = 2;
        bool mirror_to_stderr = false;
    };

    // Creates the log directory; returns false when it cannot be used
    static bool Initialize(const LogSettings& settings);

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static void Shutdown();

    static bool IsInitialized() noexcept { return s_initialized; }

    static std::filesystem::path PathFor(const std::string& filename);

private:
    LogManager() = default;

    static bool s_initialized;
    static LogSettings s_settings;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
