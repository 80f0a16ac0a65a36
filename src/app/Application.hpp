#pragma once

#include "CommandLine.hpp"

#include <iosfwd>
#include <string>

struct AppSettings;

namespace processing
{
class FieldPipeline;
}

class Application
{
public:
    enum ExitCode
    {
        ExitSuccess = 0,
        ExitGeneralError = 1,
        ExitInputError = 2,
        ExitOutputError = 3,
        ExitProcessingError = 4,
        ExitConfigurationError = 5
    };

    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    bool loadSettings(AppSettings& settings);
    bool initializeLogging(const AppSettings& settings);

    int processInputs(processing::FieldPipeline& pipeline, std::ostream& out);
    void processStream(std::istream& in, const std::string& source, processing::FieldPipeline& pipeline,
                       std::ostream& out);

    void reportSummary(const processing::FieldPipeline& pipeline);
    void flushReports();

    int argc_;
    char** argv_;
    CommandLineOptions options_;
};
