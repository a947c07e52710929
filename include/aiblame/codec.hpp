#pragma once
#include "aiblame/attribution.hpp"

#include <string>
#include <string_view>

namespace aiblame::codec {

// Version written in the header line ("ai-blame-record 1").
inline constexpr int kRecordVersion = 1;

// Serialize a record as a note body: one header, one line per fact.
// Entries are written sorted by (path, start).
std::string encode(const AttributionRecord& record);

// Parse a note body. Line order after the header does not matter and exact
// duplicate lines are ignored, so notes merged with cat_sort_uniq still
// decode. Throws CodecError on anything malformed.
AttributionRecord decode(std::string_view text);

// Backslash escaping of '\\', '\t', '\n' and '\r' used for every field.
std::string escape_field(std::string_view raw);
std::string unescape_field(std::string_view escaped);

} // namespace aiblame::codec
