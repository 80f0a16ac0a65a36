#pragma once

#include "ClozeScanner.hpp"
#include "ISpanNormalizer.hpp"
#include "TextProcessingTypes.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace processing
{

// Cloze-aware typography transform for a single field.
//
// The field is scanned once; every literal span then goes through the
// narrow space, punctuation and guillemet normalizers (French mode) and the
// smart quote normalizer, in that order. Cloze blocks and unterminated markers
// are copied verbatim. The result is a pure function of (text, options): no state is
// kept between calls, so one instance may serve several threads.
class TypographyProcessor
{
public:
    explicit TypographyProcessor(text_processing::TypographyOptions options = {});
    ~TypographyProcessor();

    TypographyProcessor(const TypographyProcessor&) = delete;
    TypographyProcessor& operator=(const TypographyProcessor&) = delete;

    // Throws InvalidEncodingError when text is not valid UTF-8.
    // Empty input is a trivial success: empty text, no blocks, no warnings.
    [[nodiscard]] text_processing::ProcessingResult processText(std::string_view text) const;

    [[nodiscard]] const text_processing::TypographyOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] std::string normalizeLiteral(std::string_view literal, const SpanContext& context) const;

    text_processing::TypographyOptions options_;
    ClozeScanner scanner_;
    std::vector<std::unique_ptr<ISpanNormalizer>> normalizers_;
};

[[nodiscard]] text_processing::ProcessingResult process_text(std::string_view text, bool french_mode,
                                                             bool smart_quotes);

} // namespace processing
