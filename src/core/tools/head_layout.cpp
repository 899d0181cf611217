#include "head_layout.h"

namespace hm {

namespace {

constexpr std::array<ToolPosition, HeadLayout::HEAD_COUNT> kRequiredPositions = {
    ToolPosition::Bottom, // 1
    ToolPosition::Top,    // 2
    ToolPosition::Right,  // 3
    ToolPosition::Left,   // 4
    ToolPosition::Right,  // 5
    ToolPosition::Left,   // 6
    ToolPosition::Top,    // 7
    ToolPosition::Bottom, // 8
    ToolPosition::Top,    // 9
    ToolPosition::Bottom, // 10
};

constexpr std::array<const char*, HeadLayout::HEAD_COUNT> kDefaultNames = {
    "1 Bottom", "1 Top", "1 Right", "1 Left",  "2 Right",
    "2 Left",   "2 Top", "2 Bottom", "3 Top", "3 Bottom",
};

} // namespace

HeadLayout::HeadLayout() {
    for (int i = 0; i < HEAD_COUNT; ++i) {
        m_names[static_cast<std::size_t>(i)] = kDefaultNames[static_cast<std::size_t>(i)];
    }
}

HeadLayout::HeadLayout(const std::vector<std::string>& names) : HeadLayout() {
    for (std::size_t i = 0; i < names.size() && i < m_names.size(); ++i) {
        if (!names[i].empty()) {
            m_names[i] = names[i];
        }
    }
}

std::optional<ToolPosition> HeadLayout::requiredPosition(int head) {
    if (!isValidHead(head)) {
        return std::nullopt;
    }
    return kRequiredPositions[static_cast<std::size_t>(head - 1)];
}

bool HeadLayout::positionMatches(int head, ToolPosition position) {
    auto required = requiredPosition(head);
    return required && *required == position;
}

std::string HeadLayout::headName(int head) const {
    if (!isValidHead(head)) {
        return {};
    }
    return m_names[static_cast<std::size_t>(head - 1)];
}

void HeadLayout::setHeadName(int head, const std::string& name) {
    if (isValidHead(head) && !name.empty()) {
        m_names[static_cast<std::size_t>(head - 1)] = name;
    }
}

std::vector<std::string> HeadLayout::defaultHeadNames() {
    return std::vector<std::string>(kDefaultNames.begin(), kDefaultNames.end());
}

} // namespace hm
