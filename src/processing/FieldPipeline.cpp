#include "FieldPipeline.hpp"
#include "Diagnostics.hpp"
#include "StageRunner.hpp"
#include "TypographyProcessor.hpp"
#include "../utils/Profile.hpp"

#include <plog/Log.h>

namespace processing
{

namespace
{

using TypographyStage = text_processing::StageResult<text_processing::ProcessingResult>;

void logInput(const utils::SourceLocation& where, const std::string& input)
{
    if (Diagnostics::IsVerbose())
        PLOG_INFO_(Diagnostics::kLogInstance) << "[FieldPipeline] at=" << where.toString()
                                              << " stage=input raw=" << Diagnostics::Preview(input);
}

void reportRejected(const utils::SourceLocation& where, const TypographyStage& stage)
{
    PLOG_WARNING_(Diagnostics::kLogInstance)
        << "[FieldPipeline] at=" << where.toString() << " stage=" << stage.stage_name << " status=error duration="
        << stage.duration.count() << "us reason=" << stage.error.value_or("unknown");

    if (stage.error_offset)
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Encoding, "Field is not valid UTF-8, left unchanged",
                                          where.atByte(*stage.error_offset), stage.error.value_or(""));
    else
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Typography, "Field could not be processed, left unchanged",
                                          where, stage.error.value_or(""));
}

} // namespace

struct FieldPipeline::Impl
{
    explicit Impl(text_processing::TypographyOptions options)
        : processor(options)
    {
    }

    TypographyProcessor processor;
    Stats stats;
};

FieldPipeline::FieldPipeline(text_processing::TypographyOptions options)
    : impl_(std::make_unique<Impl>(options))
{
}

FieldPipeline::~FieldPipeline() = default;

const FieldPipeline::Stats& FieldPipeline::stats() const noexcept { return impl_->stats; }

FieldPipeline::FieldOutcome FieldPipeline::process(const std::string& field, const utils::SourceLocation& where)
{
    PROFILE_SCOPE_CUSTOM("FieldPipeline::process");

    ++impl_->stats.fields;
    logInput(where, field);

    FieldOutcome outcome;
    outcome.text = field;

    // processText validates UTF-8 before any work
    auto stage = run_stage<text_processing::ProcessingResult>("typography",
                                                              [&]() { return impl_->processor.processText(field); });
    if (!stage.succeeded)
    {
        reportRejected(where, stage);
        ++impl_->stats.rejected;
        outcome.accepted = false;
        return outcome;
    }

    auto& result = stage.result;
    if (Diagnostics::IsVerbose())
        PLOG_INFO_(Diagnostics::kLogInstance) << "[FieldPipeline] at=" << where.toString()
                                              << " stage=typography status=ok duration=" << stage.duration.count()
                                              << "us " << Diagnostics::Summarize(result);

    for (const auto& warning : result.warnings)
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Typography, warning.message,
                                            where.atByte(warning.position));

    impl_->stats.cloze_blocks += result.cloze_count;
    impl_->stats.warnings += result.warnings.size();
    if (result.processed_text != field)
        ++impl_->stats.changed;

    outcome.cloze_count = result.cloze_count;
    outcome.warning_count = result.warnings.size();
    outcome.text = std::move(result.processed_text);
    return outcome;
}

} // namespace processing
