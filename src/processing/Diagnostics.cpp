#include "Diagnostics.hpp"

#include <algorithm>

namespace processing
{

namespace
{

constexpr std::string_view kNarrowNbspUtf8 = "\xE2\x80\xAF";
constexpr std::string_view kNbspUtf8 = "\xC2\xA0";

bool isContinuationByte(char c) { return (static_cast<unsigned char>(c) & 0xC0) == 0x80; }

// Stray control bytes would break the one-line log format
void maskControlBytes(std::string& text)
{
    std::replace_if(
        text.begin(), text.end(),
        [](unsigned char c) { return c < 0x20 || c == 0x7F; }, '?');
}

} // namespace

std::mutex Diagnostics::mutex_;
Diagnostics::Settings Diagnostics::settings_;

void Diagnostics::Configure(const Settings& settings)
{
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = settings;
    if (settings_.preview_bytes == 0)
        settings_.preview_bytes = 1;
}

Diagnostics::Settings Diagnostics::Current()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

bool Diagnostics::IsVerbose() { return Current().verbose; }

std::string Diagnostics::Preview(std::string_view text)
{
    const std::size_t limit = Current().preview_bytes;

    std::size_t cut = std::min(text.size(), limit);
    while (cut > 0 && cut < text.size() && isContinuationByte(text[cut]))
        --cut;
    const std::string_view head = text.substr(0, cut);

    std::string out;
    out.reserve(head.size() + 16);
    for (std::size_t i = 0; i < head.size(); ++i)
    {
        if (head.compare(i, kNarrowNbspUtf8.size(), kNarrowNbspUtf8) == 0)
        {
            out += "<nnbsp>";
            i += kNarrowNbspUtf8.size() - 1;
        }
        else if (head.compare(i, kNbspUtf8.size(), kNbspUtf8) == 0)
        {
            out += "<nbsp>";
            i += kNbspUtf8.size() - 1;
        }
        else if (head[i] == '\n')
            out += "\\n";
        else if (head[i] == '\r')
            out += "\\r";
        else if (head[i] == '\t')
            out += "\\t";
        else
            out.push_back(head[i]);
    }

    if (text.size() > limit)
        out += "... (" + std::to_string(text.size()) + " bytes)";

    maskControlBytes(out);
    return out;
}

std::string Diagnostics::Summarize(const text_processing::ProcessingResult& result)
{
    std::string out = "blocks=" + std::to_string(result.cloze_count);
    out += " warnings=" + std::to_string(result.warnings.size());
    out += " output=" + Preview(result.processed_text);
    return out;
}

} // namespace processing
