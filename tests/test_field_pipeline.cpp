#include <catch2/catch_test_macros.hpp>
#include "processing/FieldPipeline.hpp"
#include "utils/ErrorReporter.hpp"
#include <string>

using processing::FieldPipeline;

namespace
{

text_processing::TypographyOptions frenchOnly()
{
    text_processing::TypographyOptions options;
    options.french_mode = true;
    return options;
}

} // namespace

TEST_CASE("FieldPipeline - normalizes accepted fields", "[field_pipeline]")
{
    (void)utils::ErrorReporter::TakePending();
    FieldPipeline pipeline(frenchOnly());

    auto outcome = pipeline.process("Bonjour :", { .source = "cards.txt", .line = 1 });
    REQUIRE(outcome.accepted);
    REQUIRE(outcome.text == "Bonjour\u202F:");
    REQUIRE(outcome.cloze_count == 0);
    REQUIRE(outcome.warning_count == 0);

    auto unchanged = pipeline.process("Rien", { .source = "cards.txt", .line = 2 });
    REQUIRE(unchanged.text == "Rien");

    const auto& stats = pipeline.stats();
    REQUIRE(stats.fields == 2);
    REQUIRE(stats.changed == 1);
    REQUIRE(stats.rejected == 0);
    REQUIRE(utils::ErrorReporter::TakePending().empty());
}

TEST_CASE("FieldPipeline - counts cloze blocks across fields", "[field_pipeline]")
{
    FieldPipeline pipeline(frenchOnly());

    (void)pipeline.process("{{c1::a}} et {{c2::b}}", { .source = "cards.txt", .line = 1 });
    (void)pipeline.process("{{c1::c}}", { .source = "cards.txt", .line = 2 });

    REQUIRE(pipeline.stats().cloze_blocks == 3);
}

TEST_CASE("FieldPipeline - forwards scanner warnings with their location", "[field_pipeline]")
{
    (void)utils::ErrorReporter::TakePending();
    FieldPipeline pipeline(frenchOnly());

    auto outcome = pipeline.process("ab {{c1::incomplete", { .source = "cards.txt", .line = 7 });
    REQUIRE(outcome.accepted);
    REQUIRE(outcome.text == "ab {{c1::incomplete");
    REQUIRE(outcome.warning_count == 1);
    REQUIRE(pipeline.stats().warnings == 1);

    auto reports = utils::ErrorReporter::TakePending();
    REQUIRE(reports.size() == 1);
    REQUIRE(reports[0].category == utils::ErrorCategory::Typography);
    REQUIRE(reports[0].severity == utils::ErrorSeverity::Warning);
    REQUIRE(reports[0].message == "unterminated cloze block");
    REQUIRE(reports[0].location.source == "cards.txt");
    REQUIRE(reports[0].location.line == 7);
    REQUIRE(reports[0].location.byte == std::size_t{ 3 });
}

TEST_CASE("FieldPipeline - rejects invalid UTF-8 and keeps the original", "[field_pipeline]")
{
    (void)utils::ErrorReporter::TakePending();
    FieldPipeline pipeline(frenchOnly());

    std::string bad = std::string("Bonjour :") + '\xFF';
    auto outcome = pipeline.process(bad, { .source = "cards.txt", .line = 3 });
    REQUIRE_FALSE(outcome.accepted);
    REQUIRE(outcome.text == bad);
    REQUIRE(pipeline.stats().rejected == 1);
    REQUIRE(pipeline.stats().changed == 0);

    REQUIRE(utils::ErrorReporter::CountPending(utils::ErrorSeverity::Error) == 1);
    auto reports = utils::ErrorReporter::TakePending();
    REQUIRE(reports.size() == 1);
    REQUIRE(reports[0].category == utils::ErrorCategory::Encoding);
    REQUIRE(reports[0].location.toString() == "cards.txt:3, byte 9");
}

TEST_CASE("FieldPipeline - passes text through when no option is enabled", "[field_pipeline]")
{
    FieldPipeline pipeline(text_processing::TypographyOptions{});

    auto outcome = pipeline.process("« Bonjour : \"x\" »", { .source = "<stdin>", .line = 1 });
    REQUIRE(outcome.accepted);
    REQUIRE(outcome.text == "« Bonjour : \"x\" »");
    REQUIRE(pipeline.stats().changed == 0);
}
