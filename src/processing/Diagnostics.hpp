#pragma once

#include "TextProcessingTypes.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>

namespace processing
{

/**
 * @brief Switches and formatting for the per-field diagnostics log (plog instance 1)
 */
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    struct Settings
    {
        bool verbose = false;
        std::size_t preview_bytes = 160; // Longer fields are cut in log lines
    };

    static void Configure(const Settings& settings);
    [[nodiscard]] static Settings Current();
    [[nodiscard]] static bool IsVerbose();

    // Log-safe excerpt of a field: control characters escaped, NBSP and NNBSP
    // spelled out, cut on a UTF-8 boundary.
    [[nodiscard]] static std::string Preview(std::string_view text);

    // "blocks=2 warnings=1 output=..." for one processed field
    [[nodiscard]] static std::string Summarize(const text_processing::ProcessingResult& result);

private:
    static std::mutex mutex_;
    static Settings settings_;
};

} // namespace processing
