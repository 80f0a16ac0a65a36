#include "ClozeScanner.hpp"

#include <algorithm>
#include <limits>

namespace processing
{

namespace
{

constexpr std::string_view kOpenPrefix = "{{c";
constexpr std::string_view kSeparator = "::";
constexpr std::string_view kOpenBraces = "{{";
constexpr std::string_view kCloseBraces = "}}";

bool isAsciiDigit(char c) { return c >= '0' && c <= '9'; }

bool startsWithAt(std::string_view text, std::size_t pos, std::string_view needle)
{
    return text.size() >= pos + needle.size() && text.compare(pos, needle.size(), needle) == 0;
}

void appendSpan(std::vector<text_processing::Span>& spans, text_processing::SpanKind kind, std::size_t begin,
                std::size_t end)
{
    if (begin >= end)
        return;

    // Adjacent literal ranges are merged so the normalizers see whole runs of text
    if (kind == text_processing::SpanKind::Literal && !spans.empty() &&
        spans.back().kind == text_processing::SpanKind::Literal && spans.back().end == begin)
    {
        spans.back().end = end;
        return;
    }
    spans.push_back({ kind, begin, end });
}

unsigned long parseClozeNumber(std::string_view digits)
{
    constexpr unsigned long kMax = std::numeric_limits<unsigned long>::max();
    unsigned long value = 0;
    for (char c : digits)
    {
        unsigned long digit = static_cast<unsigned long>(c - '0');
        if (value > (kMax - digit) / 10)
            return kMax;
        value = value * 10 + digit;
    }
    return value;
}

// First "::" of the body that is not inside nested braces
std::size_t findHintSeparator(std::string_view body)
{
    int depth = 0;
    for (std::size_t i = 0; i + 1 < body.size(); ++i)
    {
        if (startsWithAt(body, i, kOpenBraces))
        {
            ++depth;
            ++i;
        }
        else if (startsWithAt(body, i, kCloseBraces))
        {
            if (depth > 0)
                --depth;
            ++i;
        }
        else if (depth == 0 && startsWithAt(body, i, kSeparator))
        {
            return i;
        }
    }
    return std::string_view::npos;
}

} // anonymous namespace

std::size_t ScanResult::wellFormedCount() const noexcept
{
    std::size_t count = 0;
    for (const auto& block : blocks)
    {
        if (block.well_formed)
            ++count;
    }
    return count;
}

std::optional<std::size_t> ClozeScanner::matchOpeningMarker(std::string_view text, std::size_t pos)
{
    if (!startsWithAt(text, pos, kOpenPrefix))
        return std::nullopt;

    std::size_t cursor = pos + kOpenPrefix.size();
    const std::size_t digits_begin = cursor;
    while (cursor < text.size() && isAsciiDigit(text[cursor]))
        ++cursor;

    if (cursor == digits_begin || !startsWithAt(text, cursor, kSeparator))
        return std::nullopt;

    return cursor + kSeparator.size() - pos;
}

text_processing::ClozeBlock ClozeScanner::parseBlock(std::string_view text, std::size_t begin,
                                                     std::size_t marker_len, std::size_t end)
{
    text_processing::ClozeBlock block;
    block.begin = begin;
    block.end = end;
    block.well_formed = true;
    block.raw_text = std::string(text.substr(begin, end - begin));

    const std::size_t digits_begin = begin + kOpenPrefix.size();
    const std::size_t digits_len = marker_len - kOpenPrefix.size() - kSeparator.size();
    block.number = parseClozeNumber(text.substr(digits_begin, digits_len));

    const std::size_t body_begin = begin + marker_len;
    std::string_view body = text.substr(body_begin, end - kCloseBraces.size() - body_begin);
    const std::size_t separator = findHintSeparator(body);
    if (separator == std::string_view::npos)
    {
        block.content = std::string(body);
    }
    else
    {
        block.content = std::string(body.substr(0, separator));
        block.hint = std::string(body.substr(separator + kSeparator.size()));
    }
    return block;
}

ScanResult ClozeScanner::scan(std::string_view text) const
{
    struct OpenDelimiter
    {
        std::size_t begin;
        std::size_t length;
        bool is_marker;
        std::size_t pending_mark; // Size of `pending` when this delimiter opened
    };

    struct ClosedBlock
    {
        std::size_t begin;
        std::size_t marker_len;
        std::size_t end;
    };

    std::vector<OpenDelimiter> open;
    std::vector<ClosedBlock> closed;  // Blocks closed at depth 0
    std::vector<ClosedBlock> pending; // Blocks closed while an outer delimiter is still open

    std::size_t pos = 0;
    while (pos < text.size())
    {
        const char c = text[pos];
        if (c == '{')
        {
            if (auto marker_len = matchOpeningMarker(text, pos))
            {
                open.push_back({ pos, *marker_len, true, pending.size() });
                pos += *marker_len;
                continue;
            }
            // "{{{c1::" opens its marker on the second brace
            if (!open.empty() && startsWithAt(text, pos, kOpenBraces) && !matchOpeningMarker(text, pos + 1))
            {
                open.push_back({ pos, kOpenBraces.size(), false, pending.size() });
                pos += kOpenBraces.size();
                continue;
            }
        }
        else if (c == '}' && !open.empty() && startsWithAt(text, pos, kCloseBraces))
        {
            OpenDelimiter delimiter = open.back();
            open.pop_back();
            pos += kCloseBraces.size();

            // A closed plain "{{ }}" pair leaves its blocks with the enclosing delimiter
            if (!delimiter.is_marker)
                continue;

            pending.resize(delimiter.pending_mark);
            ClosedBlock block{ delimiter.begin, delimiter.length, pos };
            if (open.empty())
                closed.push_back(block);
            else
                pending.push_back(block);
            continue;
        }
        ++pos;
    }

    ScanResult result;

    // Whatever is still open never closed. Each unterminated marker is reported
    // once and the blocks that closed after it are promoted to depth 0.
    std::vector<OpenDelimiter> unterminated;
    for (const auto& delimiter : open)
    {
        if (delimiter.is_marker)
            unterminated.push_back(delimiter);
    }
    closed.insert(closed.end(), pending.begin(), pending.end());

    struct Region
    {
        std::size_t begin;
        std::size_t end;
        std::size_t marker_len;
        bool well_formed;
    };

    std::vector<Region> regions;
    regions.reserve(closed.size() + unterminated.size());
    for (const auto& block : closed)
        regions.push_back({ block.begin, block.end, block.marker_len, true });
    for (const auto& marker : unterminated)
        regions.push_back({ marker.begin, marker.begin + marker.length, marker.length, false });
    std::sort(regions.begin(), regions.end(),
              [](const Region& a, const Region& b) { return a.begin < b.begin; });

    std::size_t literal_begin = 0;
    for (const auto& region : regions)
    {
        appendSpan(result.spans, text_processing::SpanKind::Literal, literal_begin, region.begin);
        if (region.well_formed)
        {
            appendSpan(result.spans, text_processing::SpanKind::Opaque, region.begin, region.end);
            result.blocks.push_back(parseBlock(text, region.begin, region.marker_len, region.end));
        }
        else
        {
            appendSpan(result.spans, text_processing::SpanKind::Marker, region.begin, region.end);

            text_processing::ClozeBlock candidate;
            candidate.begin = region.begin;
            candidate.end = region.end;
            candidate.well_formed = false;
            candidate.raw_text = std::string(text.substr(region.begin, region.marker_len));
            candidate.number = parseClozeNumber(
                text.substr(region.begin + kOpenPrefix.size(), region.marker_len - kOpenPrefix.size() - kSeparator.size()));
            result.blocks.push_back(std::move(candidate));
            result.warnings.push_back({ region.begin, "unterminated cloze block" });
        }
        literal_begin = region.end;
    }
    appendSpan(result.spans, text_processing::SpanKind::Literal, literal_begin, text.size());

    return result;
}

} // namespace processing
