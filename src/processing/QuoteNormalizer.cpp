#include "QuoteNormalizer.hpp"
#include "TextUtils.hpp"

namespace processing
{

std::u32string GuillemetNormalizer::normalize(const std::u32string& span, const SpanContext& context) const
{
    std::u32string out;
    out.reserve(span.size() + span.size() / 8);

    for (std::size_t i = 0; i < span.size(); ++i)
    {
        const char32_t cp = span[i];
        if (cp == LEFT_GUILLEMET)
        {
            out.push_back(cp);

            std::size_t next = i + 1;
            while (next < span.size() && isFrenchSpacing(span[next]))
                ++next;

            const bool at_line_end = next < span.size() ? isLineBreak(span[next]) : context.at_text_end;
            if (!at_line_end)
                out.push_back(NARROW_NBSP);
            i = next - 1;
        }
        else if (cp == RIGHT_GUILLEMET)
        {
            while (!out.empty() && isFrenchSpacing(out.back()))
                out.pop_back();

            const bool at_line_start = out.empty() ? context.at_text_start : isLineBreak(out.back());
            if (!at_line_start)
                out.push_back(NARROW_NBSP);
            out.push_back(cp);
        }
        else
        {
            out.push_back(cp);
        }
    }

    return out;
}

std::u32string SmartQuoteNormalizer::normalize(const std::u32string& span, const SpanContext& context) const
{
    std::u32string out = span;

    QuoteToggles local;
    QuoteToggles& toggles = context.quotes ? *context.quotes : local;
    for (char32_t& cp : out)
    {
        if (cp == U'"')
        {
            cp = toggles.double_open ? RIGHT_DOUBLE_QUOTE : LEFT_DOUBLE_QUOTE;
            toggles.double_open = !toggles.double_open;
        }
        else if (cp == U'\'')
        {
            cp = toggles.single_open ? RIGHT_SINGLE_QUOTE : LEFT_SINGLE_QUOTE;
            toggles.single_open = !toggles.single_open;
        }
    }

    return out;
}

} // namespace processing
