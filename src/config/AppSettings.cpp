#include "AppSettings.hpp"
#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <cstdint>

namespace
{

void warnIgnored(const ConfigManager& config, const std::string& key, int64_t value, const char* expected)
{
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Ignoring " + key + " = " +
                                                                                 std::to_string(value),
                                        { .source = config.configPath() }, expected);
}

} // namespace

bool AppSettings::registerWith(ConfigManager& config)
{
    bool ok = config.registerTable("global",
                                   { [this](const toml::table& section)
                                     { logging.append = section["append_logs"].value_or(logging.append); } },
                                   { "append_logs" });

    ok = config.registerTable("typography",
                              { [this](const toml::table& section)
                                {
                                    typography.french_mode = section["french"].value_or(typography.french_mode);
                                    typography.smart_quotes =
                                        section["smart_quotes"].value_or(typography.smart_quotes);
                                } },
                              { "french", "smart_quotes" }) &&
         ok;

    ok = config.registerTable("app.debug",
                              { [this, &config](const toml::table& section)
                                {
                                    if (auto level = section["logging_level"].value<int64_t>())
                                    {
                                        if (*level >= plog::none && *level <= plog::verbose)
                                            logging.level = static_cast<plog::Severity>(*level);
                                        else
                                            warnIgnored(config, "logging_level", *level, "expected 0 to 6");
                                    }

                                    diagnostics.verbose = section["verbose"].value_or(diagnostics.verbose);

                                    if (auto bytes = section["preview_bytes"].value<int64_t>())
                                    {
                                        if (*bytes > 0)
                                            diagnostics.preview_bytes = static_cast<std::size_t>(*bytes);
                                        else
                                            warnIgnored(config, "preview_bytes", *bytes, "expected a positive size");
                                    }
                                } },
                              { "logging_level", "verbose", "preview_bytes" }) &&
         ok;

    return ok;
}

void AppSettings::applyOverrides(bool french_flag, bool smart_quotes_flag, bool verbose_flag)
{
    typography.french_mode = typography.french_mode || french_flag;
    typography.smart_quotes = typography.smart_quotes || smart_quotes_flag;
    diagnostics.verbose = diagnostics.verbose || verbose_flag;
}
