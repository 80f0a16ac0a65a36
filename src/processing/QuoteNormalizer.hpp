#pragma once

#include "ISpanNormalizer.hpp"

namespace processing
{

// Exactly one NNBSP after every « and before every ».
// Existing runs of spaces, no-break spaces or NNBSP collapse into it. No space
// is added between a guillemet and the field edge or a line break.
class GuillemetNormalizer : public ISpanNormalizer
{
public:
    [[nodiscard]] std::u32string normalize(const std::u32string& span, const SpanContext& context) const override;
    [[nodiscard]] const char* name() const noexcept override { return "guillemets"; }
};

// Straight quotes to curly quotes by position: the first " opens, the second
// closes, and so on; ' toggles independently. The toggles start from
// SpanContext::quotes when given and are written back to it. Apostrophes are
// not told apart from quotation marks.
class SmartQuoteNormalizer : public ISpanNormalizer
{
public:
    [[nodiscard]] std::u32string normalize(const std::u32string& span, const SpanContext& context) const override;
    [[nodiscard]] const char* name() const noexcept override { return "smart_quotes"; }
};

} // namespace processing
