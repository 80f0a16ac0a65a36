#pragma once

#include "TextProcessingTypes.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace processing
{

struct ScanResult
{
    std::vector<text_processing::Span> spans;         // Partition of the input, in order
    std::vector<text_processing::ClozeBlock> blocks;  // Every candidate, well-formed or not
    std::vector<text_processing::Warning> warnings;

    [[nodiscard]] std::size_t wellFormedCount() const noexcept;
};

// Splits field text into Literal spans and opaque cloze blocks.
//
// A block opens on "{{c<digits>::" at depth 0. Inside a block every "{{"
// raises the depth and every "}}" lowers it; the block closes when the depth
// returns to 0. An opening marker that never closes becomes a Marker span and
// yields one warning; the text after it is read again as if the marker were
// absent, so blocks that do close inside it stay opaque.
//
// Single pass with an explicit stack of open delimiters, no recursion.
class ClozeScanner
{
public:
    [[nodiscard]] ScanResult scan(std::string_view text) const;

    // Length of the opening marker "{{c<digits>::" starting at pos, if any
    [[nodiscard]] static std::optional<std::size_t> matchOpeningMarker(std::string_view text, std::size_t pos);

private:
    [[nodiscard]] static text_processing::ClozeBlock parseBlock(std::string_view text, std::size_t begin,
                                                                std::size_t marker_len, std::size_t end);
};

} // namespace processing
