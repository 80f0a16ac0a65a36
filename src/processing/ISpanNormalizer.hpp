#pragma once

#include <string>

namespace processing
{

// Open/closed state of the straight-quote toggles. Carried from one literal
// span to the next across unterminated markers, reset by cloze blocks.
struct QuoteToggles
{
    bool double_open = false;
    bool single_open = false;
};

// Where a literal span sits inside the field it was cut from
struct SpanContext
{
    bool at_text_start = true;      // Span starts at offset 0 of the field
    bool at_text_end = true;        // Span ends at the end of the field
    QuoteToggles* quotes = nullptr; // Shared toggles; null means fresh toggles for this span
};

class ISpanNormalizer
{
public:
    virtual ~ISpanNormalizer() = default;

    // Rewrites one literal span. Implementations hold no state of their own.
    [[nodiscard]] virtual std::u32string normalize(const std::u32string& span, const SpanContext& context) const = 0;

    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

} // namespace processing
