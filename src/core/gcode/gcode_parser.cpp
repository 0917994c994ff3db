#include "gcode_parser.h"

#include <algorithm>
#include <sstream>

#include "../utils/file_utils.h"
#include "../utils/log.h"
#include "../utils/string_utils.h"

namespace gv {
namespace gcode {

Program Parser::parse(const std::string& content, const ProgressCallback& onProgress,
                      int progressInterval) {
    reset();

    int totalLines = static_cast<int>(std::count(content.begin(), content.end(), '\n'));
    if (!content.empty() && content.back() != '\n') {
        totalLines++;
    }

    std::istringstream stream(content);
    std::string line;
    int lineNumber = 0;

    while (std::getline(stream, line)) {
        lineNumber++;
        parseLine(line, lineNumber);

        if (onProgress && progressInterval > 0 && lineNumber % progressInterval == 0) {
            onProgress(lineNumber, totalLines);
        }
    }

    if (onProgress) {
        onProgress(lineNumber, totalLines);
    }

    log::debugf("GCode", "Parsed %d lines into %zu segments (%d arc errors)", lineNumber,
                m_motion.segments().size(), m_motion.arcErrorCount());

    return result();
}

Program Parser::parseFile(const Path& path, const ProgressCallback& onProgress,
                          int progressInterval) {
    auto content = file::readText(path);
    if (!content) {
        reset();
        m_lastError = "Failed to read file: " + path.string();
        log::error("GCode", m_lastError);
        return Program{};
    }

    return parse(*content, onProgress, progressInterval);
}

void Parser::reset() {
    m_state.reset();
    m_tools.reset();
    m_motion.reset();
    m_lineCount = 0;
    m_lastError.clear();
}

Program Parser::result() const {
    Program program;
    program.segments = m_motion.segments();
    program.bounds = m_motion.bounds();
    program.tools = m_tools;
    program.finalState = m_state;
    program.lineCount = m_lineCount;
    program.arcErrorCount = m_motion.arcErrorCount();
    return program;
}

void Parser::parseLine(const std::string& line, int lineNumber) {
    m_lineCount = std::max(m_lineCount, lineNumber);

    std::string trimmed = str::trim(line);

    // Whole-line comments only feed the tool directory
    if (isCommentLine(trimmed)) {
        m_tools.onComment(commentText(trimmed));
        return;
    }

    // Skip empty lines and program boundaries
    if (trimmed.empty() || trimmed[0] == '%') {
        return;
    }

    LineParts parts = splitComment(trimmed);
    std::vector<Word> words = tokenize(parts.code);

    // Manual tool change convention: M0 with a comment that mentions a tool
    if (hasExactCode(parts.code, 'M', "0") && str::containsIgnoreCase(parts.comment, "tool")) {
        m_state.currentTool++;
        m_state.pendingToolChange = ToolChange::Manual;
    }

    // Words act in order. F/T after a motion word only affect later motions.
    for (const auto& word : words) {
        applyWord(word, words, lineNumber);
    }
}

void Parser::applyWord(const Word& word, const std::vector<Word>& words, int lineNumber) {
    switch (word.letter) {
    case 'G': {
        int code = word.code();
        switch (code) {
        case 0: runMotion(MotionMode::Rapid, words, lineNumber); break;
        case 1: runMotion(MotionMode::Linear, words, lineNumber); break;
        case 2: runMotion(MotionMode::ClockwiseArc, words, lineNumber); break;
        case 3: runMotion(MotionMode::CounterClockwiseArc, words, lineNumber); break;
        default:
            if (!m_state.applyModalCode(code)) {
                log::debugf("GCode", "Ignoring unsupported G%d", code);
            }
            break;
        }
        break;
    }
    case 'M':
        if (word.code() == 6) {
            m_state.pendingToolChange = ToolChange::Automatic;
        }
        break;
    case 'T':
        m_state.currentTool = m_tools.resolveToolNumber(word.code());
        break;
    case 'F':
        m_state.feedRate = word.value;
        break;
    default:
        break;
    }
}

void Parser::runMotion(MotionMode mode, const std::vector<Word>& words, int lineNumber) {
    switch (mode) {
    case MotionMode::Rapid:
        m_motion.linearMove(m_state, words, SegmentType::Rapid, lineNumber);
        break;
    case MotionMode::Linear:
        m_motion.linearMove(m_state, words, SegmentType::Cut, lineNumber);
        break;
    case MotionMode::ClockwiseArc:
        m_motion.arcMove(m_state, words, true, lineNumber);
        break;
    case MotionMode::CounterClockwiseArc:
        m_motion.arcMove(m_state, words, false, lineNumber);
        break;
    }
}

} // namespace gcode
} // namespace gv
