#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

struct CommandLineOptions
{
    bool french = false;
    bool smart_quotes = false;
    bool verbose = false;
    bool console_log = false;
    bool show_help = false;
    bool show_version = false;
    std::string config_path = "config.toml";
    std::vector<std::string> inputs; // Empty or "-" means stdin
};

struct CommandLineParseResult
{
    CommandLineOptions options;
    std::optional<std::string> error;
};

// Accepts long options, short options and bundled short flags ("-fq")
[[nodiscard]] CommandLineParseResult ParseCommandLine(int argc, const char* const* argv);

void PrintUsage(std::ostream& out, const char* program_name);
void PrintVersion(std::ostream& out);
