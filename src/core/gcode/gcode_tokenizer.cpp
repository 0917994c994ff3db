#include "gcode_tokenizer.h"

#include <cctype>
#include <cmath>
#include <cstdlib>

#include "../utils/log.h"
#include "../utils/string_utils.h"

namespace gv {
namespace gcode {

int Word::code() const {
    return static_cast<int>(std::floor(value));
}

bool isCommentLine(std::string_view line) {
    return !line.empty() && (line.front() == ';' || line.front() == '(');
}

std::string commentText(std::string_view line) {
    if (isCommentLine(line)) {
        line.remove_prefix(1);
    }
    if (!line.empty() && line.back() == ')') {
        line.remove_suffix(1);
    }
    return str::trim(line);
}

LineParts splitComment(std::string_view line) {
    LineParts parts;

    auto commentPos = line.find_first_of(";(");
    if (commentPos != std::string_view::npos) {
        parts.comment = std::string(line.substr(commentPos + 1));
    }

    std::string code;
    code.reserve(line.size());
    bool inParen = false;
    for (char c : line) {
        if (!inParen && c == ';')
            break; // Rest of line is comment
        if (c == '(') {
            inParen = true;
            continue;
        }
        if (c == ')') {
            inParen = false;
            continue;
        }
        if (!inParen)
            code += c;
    }

    parts.code = str::trim(code);
    return parts;
}

std::vector<Word> tokenize(std::string_view code) {
    std::vector<Word> words;

    usize pos = 0;
    while (pos < code.size()) {
        unsigned char c = static_cast<unsigned char>(code[pos]);
        if (!std::isalpha(c)) {
            ++pos;
            continue;
        }

        char letter = static_cast<char>(std::toupper(c));
        usize numPos = pos + 1;

        usize start = numPos;
        if (numPos < code.size() && (code[numPos] == '-' || code[numPos] == '+'))
            ++numPos;

        bool hasDigits = false;
        bool hasPoint = false;
        while (numPos < code.size()) {
            char d = code[numPos];
            if (std::isdigit(static_cast<unsigned char>(d))) {
                hasDigits = true;
            } else if (d == '.' && !hasPoint) {
                hasPoint = true;
            } else {
                break;
            }
            ++numPos;
        }

        if (!hasDigits) {
            // Bare letter, e.g. the "N" of a word we do not understand
            ++pos;
            continue;
        }

        std::string numStr(code.substr(start, numPos - start));
        f32 value = std::strtof(numStr.c_str(), nullptr);
        pos = numPos;
        if (!std::isfinite(value)) {
            log::warningf("GCode", "Dropping out-of-range word %c%s", letter, numStr.c_str());
            continue;
        }
        words.push_back({letter, value});
    }

    return words;
}

std::optional<f32> findWord(const std::vector<Word>& words, char letter) {
    for (const auto& word : words) {
        if (word.letter == letter)
            return word.value;
    }
    return std::nullopt;
}

bool hasExactCode(std::string_view code, char letter, std::string_view number) {
    char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(letter)));
    for (usize pos = 0; pos + number.size() < code.size(); ++pos) {
        if (std::toupper(static_cast<unsigned char>(code[pos])) != upper)
            continue;
        if (code.substr(pos + 1, number.size()) != number)
            continue;
        usize after = pos + 1 + number.size();
        if (after == code.size())
            return true;
        unsigned char next = static_cast<unsigned char>(code[after]);
        if (!std::isalnum(next) && next != '_')
            return true;
    }
    return false;
}

} // namespace gcode
} // namespace gv
