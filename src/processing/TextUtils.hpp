#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace processing
{

/// Thrown when text handed to the typography transform is not valid UTF-8
class InvalidEncodingError : public std::runtime_error
{
public:
    InvalidEncodingError(const std::string& message, std::size_t offset)
        : std::runtime_error(message)
        , offset_(offset)
    {
    }

    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }

private:
    std::size_t offset_;
};

/// UTF-8 to UTF-32 conversion
std::u32string utf8ToUtf32(std::string_view utf8_str);

/// UTF-32 to UTF-8 conversion
std::string utf32ToUtf8(const std::u32string& utf32_str);

/// Byte offset of the first invalid UTF-8 sequence, or nullopt when the text is valid
[[nodiscard]] std::optional<std::size_t> find_invalid_utf8(std::string_view text);

[[nodiscard]] inline bool is_valid_utf8(std::string_view text) { return !find_invalid_utf8(text).has_value(); }

/// Throws InvalidEncodingError when the text is not valid UTF-8
void require_valid_utf8(std::string_view text);

constexpr char32_t NARROW_NBSP = U'\u202F';
constexpr char32_t NBSP = U'\u00A0';
constexpr char32_t LEFT_GUILLEMET = U'\u00AB';
constexpr char32_t RIGHT_GUILLEMET = U'\u00BB';
constexpr char32_t LEFT_DOUBLE_QUOTE = U'\u201C';
constexpr char32_t RIGHT_DOUBLE_QUOTE = U'\u201D';
constexpr char32_t LEFT_SINGLE_QUOTE = U'\u2018';
constexpr char32_t RIGHT_SINGLE_QUOTE = U'\u2019';

/// Space, no-break space or narrow no-break space
constexpr bool isFrenchSpacing(char32_t cp) noexcept
{
    return cp == U' ' || cp == NBSP || cp == NARROW_NBSP;
}

/// One of : ; ! ?
constexpr bool isDoublePunctuation(char32_t cp) noexcept
{
    return cp == U':' || cp == U';' || cp == U'!' || cp == U'?';
}

constexpr bool isLineBreak(char32_t cp) noexcept
{
    return cp == U'\n' || cp == U'\r';
}

} // namespace processing
