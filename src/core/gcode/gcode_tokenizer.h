#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../types.h"

namespace gv {
namespace gcode {

// A letter/value pair such as "G1", "X-2.5" or "F1200". Letter is upper-case.
struct Word {
    char letter = '\0';
    f32 value = 0.0f;

    // Integer code of a G/M/T word (G1.5 -> 1)
    int code() const;
};

// A code line split into its executable part and its trailing comment
struct LineParts {
    std::string code;    // Comments removed, trimmed
    std::string comment; // Text after the first ';' or '(' (raw, may be empty)
};

// True for lines that are nothing but commentary (start with ';' or '(')
bool isCommentLine(std::string_view line);

// Comment text of a comment line: leading marker and trailing ')' removed, trimmed
std::string commentText(std::string_view line);

// Strip "(...)" groups and ";..." tails from a code line
LineParts splitComment(std::string_view line);

// Extract letter/value pairs left to right. The number must follow the letter directly.
// Letters without a number and values that overflow to inf are skipped.
std::vector<Word> tokenize(std::string_view code);

// First value for a letter, if present
std::optional<f32> findWord(const std::vector<Word>& words, char letter);

// Does the code text carry the word spelled exactly (e.g. 'M', "0" matches M0 but not M00)?
bool hasExactCode(std::string_view code, char letter, std::string_view number);

} // namespace gcode
} // namespace gv
