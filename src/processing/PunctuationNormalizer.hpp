#pragma once

#include "ISpanNormalizer.hpp"

namespace processing
{

// French double punctuation: exactly one NNBSP (U+202F) before : ; ! ?
//
// A run of spaces, no-break spaces or NNBSP right before the mark collapses
// into the single NNBSP. Marks written back to back ("?!", "::") form one
// cluster and only the first carries the space. Nothing is inserted at the
// start of the field or right after a line break.
// French mode spacing: every no-break space (U+00A0) becomes a narrow
// no-break space, wherever it sits in the span.
class NarrowSpaceNormalizer : public ISpanNormalizer
{
public:
    [[nodiscard]] std::u32string normalize(const std::u32string& span, const SpanContext& context) const override;
    [[nodiscard]] const char* name() const noexcept override { return "narrow_spaces"; }
};

class PunctuationNormalizer : public ISpanNormalizer
{
public:
    [[nodiscard]] std::u32string normalize(const std::u32string& span, const SpanContext& context) const override;
    [[nodiscard]] const char* name() const noexcept override { return "punctuation"; }
};

} // namespace processing
