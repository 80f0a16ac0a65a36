#include "TextUtils.hpp"
#include <utf8proc.h>

namespace processing
{

std::u32string utf8ToUtf32(std::string_view utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;
    result.reserve(utf8_str.size());

    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.data());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(utf8_str.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
        {
            throw InvalidEncodingError("invalid UTF-8 sequence", static_cast<std::size_t>(pos));
        }
        result.push_back(static_cast<char32_t>(codepoint));
        pos += bytes;
    }
    return result;
}

std::string utf32ToUtf8(const std::u32string& utf32_str)
{
    std::string result;
    result.reserve(utf32_str.size());
    for (char32_t cp : utf32_str)
    {
        utf8proc_uint8_t buffer[4];
        utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
        if (bytes > 0)
        {
            result.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
        }
    }
    return result;
}

std::optional<std::size_t> find_invalid_utf8(std::string_view text)
{
    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(text.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        // Plain ASCII is by far the common case in spreadsheet fields
        if (str[pos] < 0x80)
        {
            ++pos;
            continue;
        }

        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
            return static_cast<std::size_t>(pos);
        pos += bytes;
    }
    return std::nullopt;
}

void require_valid_utf8(std::string_view text)
{
    if (auto offset = find_invalid_utf8(text))
    {
        throw InvalidEncodingError("invalid UTF-8 sequence at byte " + std::to_string(*offset), *offset);
    }
}

} // namespace processing
