#include "CommandLine.hpp"

#include <cstring>
#include <ostream>

namespace
{

constexpr const char* kVersion = "1.0.0";

// Returns false for an unknown flag character
bool applyShortFlag(char flag, CommandLineOptions& options)
{
    switch (flag)
    {
    case 'f':
        options.french = true;
        return true;
    case 'q':
        options.smart_quotes = true;
        return true;
    case 'v':
        options.verbose = true;
        return true;
    case 'h':
        options.show_help = true;
        return true;
    default:
        return false;
    }
}

} // namespace

CommandLineParseResult ParseCommandLine(int argc, const char* const* argv)
{
    CommandLineParseResult result;
    CommandLineOptions& options = result.options;
    bool only_inputs = false;

    for (int i = 1; i < argc; ++i)
    {
        const char* arg = argv[i];

        if (only_inputs || arg[0] != '-' || std::strcmp(arg, "-") == 0)
        {
            options.inputs.emplace_back(arg);
        }
        else if (std::strcmp(arg, "--") == 0)
        {
            only_inputs = true;
        }
        else if (std::strcmp(arg, "--french") == 0)
        {
            options.french = true;
        }
        else if (std::strcmp(arg, "--smart-quotes") == 0)
        {
            options.smart_quotes = true;
        }
        else if (std::strcmp(arg, "--verbose") == 0)
        {
            options.verbose = true;
        }
        else if (std::strcmp(arg, "--console-log") == 0)
        {
            options.console_log = true;
        }
        else if (std::strcmp(arg, "--help") == 0)
        {
            options.show_help = true;
        }
        else if (std::strcmp(arg, "--version") == 0)
        {
            options.show_version = true;
        }
        else if (std::strcmp(arg, "--config") == 0 || std::strcmp(arg, "-c") == 0)
        {
            if (i + 1 >= argc)
            {
                result.error = std::string("missing value for ") + arg;
                return result;
            }
            options.config_path = argv[++i];
        }
        else if (std::strncmp(arg, "--config=", 9) == 0)
        {
            options.config_path = arg + 9;
        }
        else if (arg[1] != '-')
        {
            for (const char* flag = arg + 1; *flag != '\0'; ++flag)
            {
                if (!applyShortFlag(*flag, options))
                {
                    result.error = std::string("unknown flag -") + *flag;
                    return result;
                }
            }
        }
        else
        {
            result.error = std::string("unknown option ") + arg;
            return result;
        }
    }

    if (options.config_path.empty())
        result.error = "empty config path";

    return result;
}

void PrintUsage(std::ostream& out, const char* program_name)
{
    out << "Usage: " << program_name << " [OPTIONS] [FILES...]\n";
    out << "Normalizes French typography in flashcard fields, one field per line.\n";
    out << "Cloze deletions ({{c1::...}}) are left untouched.\n\n";
    out << "Options:\n";
    out << "  -f, --french           Narrow no-break space before : ; ! ? and inside guillemets\n";
    out << "  -q, --smart-quotes     Convert straight quotes to curly quotes\n";
    out << "  -v, --verbose          Trace every field and print a summary to stderr\n";
    out << "  -c, --config PATH      Configuration file (default: config.toml)\n";
    out << "      --console-log      Mirror the application log to stderr\n";
    out << "  -h, --help             Show this help message\n";
    out << "      --version          Show version information\n";
    out << "\nWithout FILES (or with -) fields are read from stdin. Results go to stdout.\n";
}

void PrintVersion(std::ostream& out)
{
    out << "ankiprep-typography " << kVersion << "\n";
    out << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}
