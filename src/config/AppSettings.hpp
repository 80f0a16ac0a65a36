#pragma once

#include "../processing/Diagnostics.hpp"
#include "../processing/TextProcessingTypes.hpp"
#include "../utils/LogManager.hpp"

class ConfigManager;

// Settings read from config.toml:
//
//   [global]                  append_logs
//   [typography]              french, smart_quotes
//   [app.debug]               logging_level (plog 0-6), verbose, preview_bytes
//
// Command-line flags are applied on top with applyOverrides().
struct AppSettings
{
    text_processing::TypographyOptions typography;
    processing::Diagnostics::Settings diagnostics;
    utils::LogSettings logging;

    // The instance must outlive the manager's load()
    bool registerWith(ConfigManager& config);

    void applyOverrides(bool french_flag, bool smart_quotes_flag, bool verbose_flag);
};
