#include "TypographyProcessor.hpp"
#include "PunctuationNormalizer.hpp"
#include "QuoteNormalizer.hpp"
#include "TextUtils.hpp"

namespace processing
{

TypographyProcessor::TypographyProcessor(text_processing::TypographyOptions options)
    : options_(options)
{
    if (options_.french_mode)
    {
        normalizers_.push_back(std::make_unique<NarrowSpaceNormalizer>());
        normalizers_.push_back(std::make_unique<PunctuationNormalizer>());
        normalizers_.push_back(std::make_unique<GuillemetNormalizer>());
    }
    if (options_.smart_quotes)
    {
        normalizers_.push_back(std::make_unique<SmartQuoteNormalizer>());
    }
}

TypographyProcessor::~TypographyProcessor() = default;

text_processing::ProcessingResult TypographyProcessor::processText(std::string_view text) const
{
    require_valid_utf8(text);

    text_processing::ProcessingResult result;
    if (text.empty())
        return result;

    ScanResult scan = scanner_.scan(text);
    result.cloze_count = scan.wellFormedCount();
    result.warnings = std::move(scan.warnings);

    if (normalizers_.empty())
    {
        result.processed_text = std::string(text);
        return result;
    }

    // An unterminated marker does not interrupt the literal text around it,
    // so quote toggles survive it; a cloze block starts them afresh.
    QuoteToggles quotes;

    result.processed_text.reserve(text.size() + text.size() / 8);
    for (const auto& span : scan.spans)
    {
        std::string_view piece = span.view(text);
        switch (span.kind)
        {
        case text_processing::SpanKind::Opaque:
            quotes = {};
            result.processed_text.append(piece);
            break;
        case text_processing::SpanKind::Marker:
            result.processed_text.append(piece);
            break;
        case text_processing::SpanKind::Literal:
        {
            SpanContext context;
            context.at_text_start = span.begin == 0;
            context.at_text_end = span.end == text.size();
            context.quotes = &quotes;
            result.processed_text += normalizeLiteral(piece, context);
            break;
        }
        }
    }

    return result;
}

std::string TypographyProcessor::normalizeLiteral(std::string_view literal, const SpanContext& context) const
{
    std::u32string code_points = utf8ToUtf32(literal);
    for (const auto& normalizer : normalizers_)
    {
        code_points = normalizer->normalize(code_points, context);
    }
    return utf32ToUtf8(code_points);
}

text_processing::ProcessingResult process_text(std::string_view text, bool french_mode, bool smart_quotes)
{
    text_processing::TypographyOptions options;
    options.french_mode = french_mode;
    options.smart_quotes = smart_quotes;
    return TypographyProcessor{ options }.processText(text);
}

} // namespace processing
