#include "Application.hpp"

#include "config/ConfigManager.hpp"
#include "config/AppSettings.hpp"
#include "processing/Diagnostics.hpp"
#include "processing/FieldPipeline.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"
#include "utils/Profile.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <utility>
#include <vector>

#include <plog/Log.h>

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { utils::LogManager::Shutdown(); }

int Application::run()
{
    auto parsed = ParseCommandLine(argc_, argv_);
    if (parsed.error)
    {
        std::cerr << "Error: " << *parsed.error << "\n\n";
        PrintUsage(std::cerr, argv_[0]);
        return ExitConfigurationError;
    }
    options_ = std::move(parsed.options);

    if (options_.show_help)
    {
        PrintUsage(std::cout, argv_[0]);
        return ExitSuccess;
    }
    if (options_.show_version)
    {
        PrintVersion(std::cout);
        return ExitSuccess;
    }

    // Config errors are queued and flushed once logging is up, or right away on failure
    AppSettings settings;
    if (!loadSettings(settings))
    {
        flushReports();
        return ExitConfigurationError;
    }

    if (!initializeLogging(settings))
        std::cerr << "Warning: logging is unavailable, continuing without log files\n";

    PLOG_INFO << "Typography options: french=" << settings.typography.french_mode
              << " smart_quotes=" << settings.typography.smart_quotes;
    if (!settings.typography.any())
        PLOG_INFO << "No typography option enabled, fields are copied through unchanged";

    processing::FieldPipeline pipeline(settings.typography);
    int exit_code = processInputs(pipeline, std::cout);

    reportSummary(pipeline);
    flushReports();

    if (exit_code == ExitSuccess && pipeline.stats().rejected > 0)
        exit_code = ExitProcessingError;
    return exit_code;
}

bool Application::loadSettings(AppSettings& settings)
{
    ConfigManager config(options_.config_path);
    if (!settings.registerWith(config))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Invalid configuration handlers",
                                          { .source = config.configPath() }, config.lastError());
        return false;
    }

    if (!config.load())
        return false;

    settings.applyOverrides(options_.french, options_.smart_quotes, options_.verbose);
    processing::Diagnostics::Configure(settings.diagnostics);
    return true;
}

bool Application::initializeLogging(const AppSettings& settings)
{
    PROFILE_SCOPE_FUNCTION();

    if (!utils::LogManager::Initialize(settings.logging))
        return false;

    bool ok = utils::LogManager::RegisterLogger<0>(
        { .name = "main", .filename = "run.log", .mirror_to_stderr = options_.console_log });

    std::optional<plog::Severity> diagnostics_level;
    if (settings.diagnostics.verbose)
        diagnostics_level = plog::debug;
    ok = utils::LogManager::RegisterLogger<processing::Diagnostics::kLogInstance>(
             { .name = "diagnostics", .filename = "typography.log", .level_override = diagnostics_level }) &&
         ok;

#if ANKIPREP_PROFILING_LEVEL >= 1
    ok = utils::LogManager::RegisterLogger<profiling::kProfilingLogInstance>(
             { .name = "profiling", .filename = "profiling.log", .level_override = plog::debug }) &&
         ok;
#endif

    utils::ErrorReporter::InitializeLogFile(utils::LogManager::PathFor("errors.log").string());
    return ok;
}

int Application::processInputs(processing::FieldPipeline& pipeline, std::ostream& out)
{
    std::vector<std::string> inputs = options_.inputs;
    if (inputs.empty())
        inputs.emplace_back("-");

    for (const auto& input : inputs)
    {
        if (input == "-")
        {
            processStream(std::cin, "<stdin>", pipeline, out);
            continue;
        }

        std::ifstream file(input, std::ios::binary);
        if (!file)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Input, "Cannot open input file",
                                              { .source = input });
            return ExitInputError;
        }

        PLOG_INFO << "Processing " << input;
        processStream(file, input, pipeline, out);
    }

    out.flush();
    if (!out)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Output, "Failed to write results",
                                          { .source = "<stdout>" });
        return ExitOutputError;
    }
    return ExitSuccess;
}

void Application::processStream(std::istream& in, const std::string& source, processing::FieldPipeline& pipeline,
                                std::ostream& out)
{
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line))
    {
        ++line_number;

        bool crlf = !line.empty() && line.back() == '\r';
        if (crlf)
            line.pop_back();

        auto outcome = pipeline.process(line, { .source = source, .line = line_number });
        out << outcome.text << (crlf ? "\r\n" : "\n");
    }
}

void Application::reportSummary(const processing::FieldPipeline& pipeline)
{
    const auto& stats = pipeline.stats();
    PLOG_INFO << "Processed " << stats.fields << " field(s): changed=" << stats.changed
              << " cloze_blocks=" << stats.cloze_blocks << " warnings=" << stats.warnings
              << " rejected=" << stats.rejected;

    if (!processing::Diagnostics::IsVerbose())
        return;

    std::cerr << "Fields processed: " << stats.fields << "\n";
    std::cerr << "Fields changed:   " << stats.changed << "\n";
    std::cerr << "Cloze blocks:     " << stats.cloze_blocks << "\n";
    std::cerr << "Warnings:         " << stats.warnings << "\n";
    std::cerr << "Rejected fields:  " << stats.rejected << "\n";
}

void Application::flushReports()
{
    const bool verbose = processing::Diagnostics::IsVerbose();
    std::size_t hidden = 0;
    for (const auto& report : utils::ErrorReporter::TakePending())
    {
        if (report.severity == utils::ErrorSeverity::Warning && !verbose)
        {
            ++hidden;
            continue;
        }
        std::cerr << utils::ErrorReporter::Format(report) << "\n";
    }

    if (hidden > 0)
        std::cerr << hidden << " warning(s), run with -v to list them\n";
}
