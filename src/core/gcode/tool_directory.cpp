#include "tool_directory.h"

#include <cctype>
#include <cstdlib>
#include <set>

#include "../utils/log.h"
#include "../utils/string_utils.h"

namespace gv {
namespace gcode {

namespace {

bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Pull a standalone "#RRGGBB" out of a tool description.
// Returns the description without it; `color` is set when one was found.
std::string extractColor(std::string_view text, std::optional<u32>& color) {
    usize pos = text.find('#');
    while (pos != std::string_view::npos) {
        usize end = pos + 7;
        bool bounded = end == text.size() || (end < text.size() && !isWordChar(text[end]));
        if (end <= text.size() && bounded && str::isHexColor(text.substr(pos + 1, 6))) {
            std::string hex(text.substr(pos + 1, 6));
            color = static_cast<u32>(std::strtoul(hex.c_str(), nullptr, 16));
            std::string cleaned(text.substr(0, pos));
            cleaned += text.substr(end);
            return str::trim(cleaned);
        }
        pos = text.find('#', pos + 1);
    }
    return str::trim(text);
}

// "required tool:" or "required tools:" anywhere in the comment, any case
bool isToolListHeader(std::string_view comment) {
    std::string lower = str::toLower(comment);
    constexpr std::string_view kKey = "required tool";

    usize pos = lower.find(kKey);
    while (pos != std::string::npos) {
        usize after = pos + kKey.size();
        if (after < lower.size() && lower[after] == 's')
            ++after;
        if (after < lower.size() && lower[after] == ':')
            return true;
        pos = lower.find(kKey, pos + 1);
    }
    return false;
}

} // namespace

void ToolDirectory::reset() {
    *this = ToolDirectory{};
}

void ToolDirectory::onComment(std::string_view comment) {
    if (isToolListHeader(comment)) {
        m_capturingList = true;
        return;
    }

    if (m_capturingList) {
        if (comment.empty()) {
            m_capturingList = false;
            return;
        }
        if (!str::containsIgnoreCase(comment, "required")) {
            addListEntry(comment);
        }
        return;
    }

    parseInlineTag(comment);
}

void ToolDirectory::addListEntry(std::string_view description) {
    ToolEntry entry;
    entry.number = static_cast<int>(m_entries.size()) + (m_inline ? 0 : 1);
    entry.name = extractColor(description, entry.color);
    m_entries.push_back(std::move(entry));
}

// Matches "Tool <N>: <name> [#RRGGBB]"
void ToolDirectory::parseInlineTag(std::string_view comment) {
    if (comment.size() < 5 || !str::startsWith(str::toLower(comment.substr(0, 4)), "tool"))
        return;

    usize pos = 4;
    while (pos < comment.size() && std::isspace(static_cast<unsigned char>(comment[pos])))
        ++pos;

    usize digitsStart = pos;
    while (pos < comment.size() && std::isdigit(static_cast<unsigned char>(comment[pos])))
        ++pos;

    int number = 0;
    if (pos == digitsStart || !str::parseInt(comment.substr(digitsStart, pos - digitsStart), number))
        return;

    while (pos < comment.size() && std::isspace(static_cast<unsigned char>(comment[pos])))
        ++pos;
    if (pos >= comment.size() || comment[pos] != ':')
        return;

    if (!m_inline) {
        // First tag: switch numbering and reserve slot 0
        m_inline = true;
        m_entries.insert(m_entries.begin(), ToolEntry{0, kNoToolName, std::nullopt});
        log::debug("GCode", "Inline tool tags detected, using inline tool numbering");
    }

    auto& slots = m_inlineSlots[number];

    ToolEntry entry;
    entry.number = number;
    entry.name = extractColor(comment.substr(pos + 1), entry.color);
    if (entry.name.empty())
        entry.name = "Tool " + std::to_string(number);
    if (!slots.empty())
        entry.name += " (" + std::to_string(slots.size() + 1) + ")";

    slots.push_back(static_cast<int>(m_entries.size()));
    m_entries.push_back(std::move(entry));
}

int ToolDirectory::resolveToolNumber(int number) {
    if (!m_inline)
        return number;

    auto it = m_inlineSlots.find(number);
    if (it == m_inlineSlots.end() || it->second.empty())
        return number;

    usize& used = m_inlineCursor[number];
    if (used < it->second.size())
        return it->second[used++];
    return it->second.back();
}

const ToolEntry* ToolDirectory::slotFor(int toolNumber) const {
    int slot = m_inline ? toolNumber : toolNumber - 1;
    if (slot < 0 || slot >= static_cast<int>(m_entries.size()))
        return nullptr;
    return &m_entries[static_cast<usize>(slot)];
}

std::string ToolDirectory::nameFor(int toolNumber) const {
    const ToolEntry* entry = slotFor(toolNumber);
    if (entry && !entry->name.empty())
        return entry->name;
    return "Tool " + std::to_string(toolNumber);
}

u32 ToolDirectory::colorValueFor(int toolNumber) const {
    const ToolEntry* entry = slotFor(toolNumber);
    if (entry && entry->color)
        return *entry->color;

    int size = static_cast<int>(kPalette.size());
    return kPalette[static_cast<usize>(((toolNumber % size) + size) % size)];
}

std::vector<ToolEntry> ToolDirectory::usedTools(const std::vector<Segment>& segments) const {
    std::set<int> used;
    for (const auto& seg : segments) {
        if (seg.isCut())
            used.insert(seg.tool != 0 ? seg.tool : 1);
    }

    std::vector<ToolEntry> result;
    result.reserve(used.size());
    for (int tool : used) {
        result.push_back({tool, nameFor(tool), colorValueFor(tool)});
    }
    return result;
}

} // namespace gcode
} // namespace gv
