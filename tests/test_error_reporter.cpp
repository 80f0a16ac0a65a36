#include <catch2/catch_test_macros.hpp>
#include "utils/ErrorReporter.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace utils;

TEST_CASE("ErrorReporter - queues reports until they are taken", "[error_reporter]")
{
    (void)ErrorReporter::TakePending();

    ErrorReporter::ReportWarning(ErrorCategory::Typography, "unterminated cloze block",
                                 { .source = "deck.txt", .line = 1, .byte = 0 });
    ErrorReporter::ReportError(ErrorCategory::Input, "Cannot open input file", { .source = "missing.txt" });

    REQUIRE(ErrorReporter::CountPending(ErrorSeverity::Warning) == 1);
    REQUIRE(ErrorReporter::CountPending(ErrorSeverity::Error) == 1);

    auto reports = ErrorReporter::TakePending();
    REQUIRE(reports.size() == 2);
    REQUIRE(reports[0].category == ErrorCategory::Typography);
    REQUIRE(reports[0].location.line == 1);
    REQUIRE(reports[1].location.source == "missing.txt");
    REQUIRE_FALSE(reports[1].timestamp.empty());

    REQUIRE(ErrorReporter::TakePending().empty());
    REQUIRE(ErrorReporter::CountPending(ErrorSeverity::Error) == 0);
}

TEST_CASE("SourceLocation - renders file, line and byte", "[error_reporter]")
{
    SourceLocation where{ .source = "deck.txt", .line = 12 };
    REQUIRE(where.toString() == "deck.txt:12");
    REQUIRE(where.atByte(40).toString() == "deck.txt:12, byte 40");
    REQUIRE_FALSE(where.byte.has_value());

    REQUIRE(SourceLocation{}.empty());
    REQUIRE(SourceLocation{}.toString().empty());
    REQUIRE(SourceLocation{}.atByte(3).toString() == "byte 3");
    REQUIRE(SourceLocation{ .source = "config.toml" }.toString() == "config.toml");
}

TEST_CASE("ErrorReporter - formats reports for the terminal", "[error_reporter]")
{
    ErrorReport warning;
    warning.severity = ErrorSeverity::Warning;
    warning.message = "unterminated cloze block";
    warning.location = { .source = "deck.txt", .line = 12, .byte = 40 };
    REQUIRE(ErrorReporter::Format(warning) == "Warning: unterminated cloze block (deck.txt:12, byte 40)");

    ErrorReport error;
    error.severity = ErrorSeverity::Error;
    error.message = "Configuration file has errors";
    error.location = { .source = "config.toml", .line = 3 };
    error.details = "expected ']'";
    REQUIRE(ErrorReporter::Format(error) == "Error: Configuration file has errors (config.toml:3): expected ']'");

    ErrorReport bare;
    bare.message = "Failed to write results";
    REQUIRE(ErrorReporter::Format(bare) == "Error: Failed to write results");
}

TEST_CASE("ErrorReporter - taken reports are appended to the log file", "[error_reporter]")
{
    const std::string path = "ankiprep_error_reporter_test.log";
    std::filesystem::remove(path);
    (void)ErrorReporter::TakePending();

    ErrorReporter::InitializeLogFile(path);
    ErrorReporter::ReportError(ErrorCategory::Encoding, "Field is not valid UTF-8, left unchanged",
                               { .source = "deck.txt", .line = 2, .byte = 5 });
    (void)ErrorReporter::TakePending();

    std::ifstream in(path);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(contents.find("[Encoding] Error: Field is not valid UTF-8, left unchanged (deck.txt:2, byte 5)") !=
            std::string::npos);

    in.close();
    std::filesystem::remove(path);
}

TEST_CASE("ErrorReporter - category and severity names", "[error_reporter]")
{
    REQUIRE(ErrorReporter::CategoryToString(ErrorCategory::Encoding) == "Encoding");
    REQUIRE(ErrorReporter::CategoryToString(ErrorCategory::Typography) == "Typography");
    REQUIRE(ErrorReporter::SeverityToString(ErrorSeverity::Warning) == "Warning");
    REQUIRE(ErrorReporter::SeverityToString(ErrorSeverity::Error) == "Error");
}
