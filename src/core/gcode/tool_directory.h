#pragma once

#include <array>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "gcode_types.h"

namespace gv {
namespace gcode {

// Tool names and colors collected from a program's comments.
//
// Two conventions are understood and the first one seen decides the numbering:
//  - sequential: a "Required tools:" header followed by one comment per tool.
//    Tool N lives in slot N-1.
//  - inline: "(Tool N: name)" tags. The first tag inserts a "No Tool" slot 0 in
//    front of everything collected so far and from then on tool numbers are slot
//    indices. Repeating a tag for the same N adds a new slot named "name (k)";
//    T words walk through those slots in order.
class ToolDirectory {
  public:
    static constexpr const char* kNoToolName = "No Tool";
    static constexpr std::array<u32, 8> kPalette = {
        0x00ccff, 0x00ff88, 0xff4dff, 0xffff00, 0xff8800, 0x8888ff, 0xff0088, 0x00ffff,
    };

    void reset();

    // Feed the text of a whole-line comment (marker already removed)
    void onComment(std::string_view comment);

    // Map a T word to the tool number segments will carry
    int resolveToolNumber(int number);

    bool isInlineRegime() const { return m_inline; }
    bool isCapturingToolList() const { return m_capturingList; }

    // Display name, falling back to "Tool N"
    std::string nameFor(int toolNumber) const;

    // 0xRRGGBB: the comment's #RRGGBB if any, else kPalette[toolNumber mod 8]
    u32 colorValueFor(int toolNumber) const;
    Color colorFor(int toolNumber) const { return Color::fromHex(colorValueFor(toolNumber)); }

    const std::vector<ToolEntry>& entries() const { return m_entries; }

    // Tools used by cut segments, ascending, with resolved names and colors
    std::vector<ToolEntry> usedTools(const std::vector<Segment>& segments) const;

    bool operator==(const ToolDirectory& other) const {
        return m_entries == other.m_entries && m_inline == other.m_inline &&
               m_capturingList == other.m_capturingList && m_inlineSlots == other.m_inlineSlots &&
               m_inlineCursor == other.m_inlineCursor;
    }

  private:
    const ToolEntry* slotFor(int toolNumber) const;
    void parseInlineTag(std::string_view comment);
    void addListEntry(std::string_view description);

    std::vector<ToolEntry> m_entries;
    bool m_inline = false;
    bool m_capturingList = false;

    // Inline regime: tag number -> slot indices in order of appearance
    std::map<int, std::vector<int>> m_inlineSlots;
    // Inline regime: tag number -> how many of its slots T words have used
    std::map<int, usize> m_inlineCursor;
};

} // namespace gcode
} // namespace gv
