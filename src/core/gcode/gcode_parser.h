#pragma once

#include <functional>
#include <string>
#include <vector>

#include "../types.h"
#include "gcode_tokenizer.h"
#include "gcode_types.h"
#include "modal_state.h"
#include "motion_generator.h"
#include "tool_directory.h"

namespace gv {
namespace gcode {

// Parsed G-code program
struct Program {
    std::vector<Segment> segments;
    Bounds bounds;
    ToolDirectory tools;
    ModalState finalState; // Modal state after the last line
    int lineCount = 0;
    int arcErrorCount = 0; // G2/G3 lines skipped for missing I/J/K
};

class Parser {
  public:
    // Called with (linesDone, totalLines)
    using ProgressCallback = std::function<void(int, int)>;

    static constexpr int kDefaultProgressInterval = 5000;

    Parser() = default;

    // Parse G-code from string. Resets first, so every call starts from a clean state.
    Program parse(const std::string& content, const ProgressCallback& onProgress = nullptr,
                  int progressInterval = kDefaultProgressInterval);

    // Parse G-code from file
    Program parseFile(const Path& path, const ProgressCallback& onProgress = nullptr,
                      int progressInterval = kDefaultProgressInterval);

    // Return to the freshly constructed state
    void reset();

    // Interpret one line against the current modal state
    void parseLine(const std::string& line, int lineNumber);

    // Snapshot of everything parsed since the last reset
    Program result() const;

    const ModalState& state() const { return m_state; }
    const ToolDirectory& tools() const { return m_tools; }
    const std::vector<Segment>& segments() const { return m_motion.segments(); }
    const Bounds& bounds() const { return m_motion.bounds(); }

    // Get last error message
    const std::string& lastError() const { return m_lastError; }

  private:
    void applyWord(const Word& word, const std::vector<Word>& words, int lineNumber);
    void runMotion(MotionMode mode, const std::vector<Word>& words, int lineNumber);

    ModalState m_state;
    ToolDirectory m_tools;
    MotionGenerator m_motion;
    int m_lineCount = 0;
    std::string m_lastError;
};

} // namespace gcode
} // namespace gv
