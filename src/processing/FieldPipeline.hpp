#pragma once

#include "TextProcessingTypes.hpp"
#include "../utils/ErrorReporter.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace processing
{

// Caller-side wrapper around TypographyProcessor for one stream of fields.
// Runs the transform as a traced stage, reports warnings and rejected fields
// with their location and keeps running totals.
class FieldPipeline
{
public:
    struct Stats
    {
        std::size_t fields = 0;
        std::size_t changed = 0;
        std::size_t cloze_blocks = 0;
        std::size_t warnings = 0;
        std::size_t rejected = 0;
    };

    struct FieldOutcome
    {
        std::string text;          // Normalized text, or the original when rejected
        bool accepted = true;      // False when the field failed a stage
        std::size_t cloze_count = 0;
        std::size_t warning_count = 0;
    };

    explicit FieldPipeline(text_processing::TypographyOptions options);
    ~FieldPipeline();

    FieldPipeline(const FieldPipeline&) = delete;
    FieldPipeline& operator=(const FieldPipeline&) = delete;

    // where names the input file and line; reports add the byte offset
    [[nodiscard]] FieldOutcome process(const std::string& field, const utils::SourceLocation& where);

    [[nodiscard]] const Stats& stats() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace processing
