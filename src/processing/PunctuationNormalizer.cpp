#include "PunctuationNormalizer.hpp"
#include "TextUtils.hpp"

#include <algorithm>

namespace processing
{

std::u32string NarrowSpaceNormalizer::normalize(const std::u32string& span, const SpanContext&) const
{
    std::u32string out = span;
    std::replace(out.begin(), out.end(), NBSP, NARROW_NBSP);
    return out;
}

std::u32string PunctuationNormalizer::normalize(const std::u32string& span, const SpanContext& context) const
{
    std::u32string out;
    out.reserve(span.size() + span.size() / 8);

    for (char32_t cp : span)
    {
        if (!isDoublePunctuation(cp))
        {
            out.push_back(cp);
            continue;
        }

        if (!out.empty() && isDoublePunctuation(out.back()))
        {
            out.push_back(cp);
            continue;
        }

        while (!out.empty() && isFrenchSpacing(out.back()))
            out.pop_back();

        const bool at_line_start = out.empty() ? context.at_text_start : isLineBreak(out.back());
        if (!at_line_start)
            out.push_back(NARROW_NBSP);
        out.push_back(cp);
    }

    return out;
}

} // namespace processing
