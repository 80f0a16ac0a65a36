#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace text_processing {

// Core data contracts for the typography pipeline.
// Everything here is created per call and owned by the caller afterwards.

enum class SpanKind
{
    Literal, // Eligible for typography normalization
    Opaque,  // Well-formed cloze block, emitted verbatim
    Marker   // Opening marker of an unterminated cloze block, emitted verbatim
};

// Byte range into the scanned text. Spans never own text.
struct Span {
    SpanKind kind = SpanKind::Literal;
    std::size_t begin = 0;
    std::size_t end = 0;

    [[nodiscard]] std::size_t size() const noexcept { return end - begin; }
    [[nodiscard]] std::string_view view(std::string_view text) const { return text.substr(begin, end - begin); }
};

// {{c<number>::<content>}} or {{c<number>::<content>::<hint>}}
struct ClozeBlock {
    std::size_t begin = 0;                    // Offset of the first '{'
    std::size_t end = 0;                      // One past the last '}' (past the marker when unterminated)
    bool well_formed = false;                 // False for unterminated candidates
    std::string raw_text;                     // Verbatim text of the block, or of the marker alone
    unsigned long number = 0;                 // Digits after "{{c"
    std::string content;                      // Text between the marker and the hint/closing braces
    std::optional<std::string> hint;          // Text after the second "::", if any
};

struct Warning {
    std::size_t position = 0;                 // Byte offset in the input
    std::string message;
};

// Immutable switches for one transform call
struct TypographyOptions {
    bool french_mode = false;                 // NNBSP before : ; ! ? and inside guillemets
    bool smart_quotes = false;                // Straight quotes to curly quotes

    [[nodiscard]] bool any() const noexcept { return french_mode || smart_quotes; }
};

struct ProcessingResult {
    std::string processed_text;
    std::size_t cloze_count = 0;              // Well-formed blocks only
    std::vector<Warning> warnings;
};

// Pipeline execution result wrapper (common for all stages)
template<typename T>
struct StageResult {
    T result;                                 // The actual result payload
    bool succeeded = true;                    // Whether the stage completed successfully
    std::optional<std::string> error;         // Error message if stage failed
    std::chrono::microseconds duration{0};    // How long the stage took to execute
    std::string stage_name;                   // Name of the stage (for logging/metrics)
    std::optional<std::size_t> error_offset;  // Byte offset of the first invalid UTF-8 byte

    static StageResult success(T r, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.result = std::move(r);
        res.succeeded = true;
        res.duration = time;
        res.stage_name = name;
        return res;
    }

    static StageResult failure(const std::string& err, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.succeeded = false;
        res.error = err;
        res.duration = time;
        res.stage_name = name;
        return res;
    }
};

} // namespace text_processing
