#include <catch2/catch_test_macros.hpp>
#include "config/ConfigManager.hpp"
#include "config/AppSettings.hpp"
#include "utils/ErrorReporter.hpp"

#include <filesystem>
#include <fstream>
#include <string>

TEST_CASE("AppSettings - defaults when sections are absent", "[config]")
{
    ConfigManager config("unused.toml");
    AppSettings settings;
    REQUIRE(settings.registerWith(config));

    REQUIRE(config.loadFromString("[global]\nappend_logs = false\n"));
    REQUIRE_FALSE(settings.typography.french_mode);
    REQUIRE_FALSE(settings.typography.smart_quotes);
    REQUIRE_FALSE(settings.diagnostics.verbose);
    REQUIRE(settings.diagnostics.preview_bytes == 160);
    REQUIRE_FALSE(settings.logging.append);
    REQUIRE(settings.logging.level == plog::info);
}

TEST_CASE("AppSettings - reads typography and debug tables", "[config]")
{
    ConfigManager config("unused.toml");
    AppSettings settings;
    REQUIRE(settings.registerWith(config));

    REQUIRE(config.loadFromString(R"(
[typography]
french = true
smart_quotes = true

[app.debug]
logging_level = 5
verbose = true
preview_bytes = 64
)"));

    REQUIRE(settings.typography.french_mode);
    REQUIRE(settings.typography.smart_quotes);
    REQUIRE(settings.diagnostics.verbose);
    REQUIRE(settings.diagnostics.preview_bytes == 64);
    REQUIRE(settings.logging.append);
    REQUIRE(settings.logging.level == plog::debug);
}

TEST_CASE("AppSettings - out of range debug values are ignored with a warning", "[config]")
{
    (void)utils::ErrorReporter::TakePending();

    ConfigManager config("deck_config.toml");
    AppSettings settings;
    REQUIRE(settings.registerWith(config));

    REQUIRE(config.loadFromString("[app.debug]\npreview_bytes = 0\nlogging_level = 9\n"));
    REQUIRE(settings.diagnostics.preview_bytes == 160);
    REQUIRE(settings.logging.level == plog::info);

    auto reports = utils::ErrorReporter::TakePending();
    REQUIRE(reports.size() == 2);
    for (const auto& report : reports)
    {
        REQUIRE(report.category == utils::ErrorCategory::Configuration);
        REQUIRE(report.severity == utils::ErrorSeverity::Warning);
        REQUIRE(report.location.source == "deck_config.toml");
    }
}

TEST_CASE("AppSettings - command line flags override the file", "[config]")
{
    AppSettings settings;
    settings.typography.french_mode = true;

    settings.applyOverrides(false, true, false);
    REQUIRE(settings.typography.french_mode);
    REQUIRE(settings.typography.smart_quotes);
    REQUIRE_FALSE(settings.diagnostics.verbose);

    settings.applyOverrides(false, false, true);
    REQUIRE(settings.diagnostics.verbose);
}

TEST_CASE("ConfigManager - parse errors are reported", "[config]")
{
    (void)utils::ErrorReporter::TakePending();

    ConfigManager config("unused.toml");
    AppSettings settings;
    REQUIRE(settings.registerWith(config));

    REQUIRE_FALSE(config.loadFromString("[typography\nfrench = true\n"));
    REQUIRE(std::string(config.lastError()).find("config parse error") != std::string::npos);

    auto reports = utils::ErrorReporter::TakePending();
    REQUIRE(reports.size() == 1);
    REQUIRE(reports[0].category == utils::ErrorCategory::Configuration);
    REQUIRE(reports[0].severity == utils::ErrorSeverity::Error);
    REQUIRE(reports[0].location.source == "unused.toml");
    REQUIRE(reports[0].location.line >= 1);

}

TEST_CASE("ConfigManager - duplicate key ownership is rejected", "[config]")
{
    ConfigManager config("unused.toml");
    AppSettings first;
    AppSettings second;

    REQUIRE(first.registerWith(config));
    REQUIRE_FALSE(second.registerWith(config));
    REQUIRE(std::string(config.lastError()).find("Duplicate ownership") != std::string::npos);
}

TEST_CASE("ConfigManager - missing file falls back to defaults", "[config]")
{
    const std::string path = "ankiprep_missing_config_test.toml";
    std::filesystem::remove(path);

    ConfigManager config(path);
    AppSettings settings;
    REQUIRE(settings.registerWith(config));
    REQUIRE(config.load());
    REQUIRE_FALSE(settings.typography.any());
    REQUIRE(config.root().empty());
}

TEST_CASE("ConfigManager - loads settings from a file", "[config]")
{
    const std::string path = "ankiprep_config_test.toml";
    {
        std::ofstream out(path, std::ios::trunc);
        out << "[typography]\nfrench = true\n";
    }

    ConfigManager config(path);
    AppSettings settings;
    REQUIRE(settings.registerWith(config));
    REQUIRE(config.load());
    REQUIRE(settings.typography.french_mode);
    REQUIRE_FALSE(settings.typography.smart_quotes);
    REQUIRE(config.root().contains("typography"));

    std::filesystem::remove(path);
}
