#pragma once

#include <string>
#include <string_view>

// Copy of `text` with every ill-formed UTF-8 sequence replaced by U+FFFD,
// one replacement per maximal invalid subpart. ASCII bytes are never touched,
// so JSON structure survives.
std::string replace_invalid_utf8(std::string_view text);
