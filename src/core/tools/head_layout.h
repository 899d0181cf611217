#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "tool_code.h"

namespace hm {

// Fixed spindle layout of the moulder: which tool position each head requires,
// plus the operator-facing head labels.
class HeadLayout {
  public:
    static constexpr int HEAD_COUNT = 10;

    HeadLayout();

    // Labels for heads 1..N in order; missing or empty entries keep the default
    explicit HeadLayout(const std::vector<std::string>& names);

    static bool isValidHead(int head) { return head >= 1 && head <= HEAD_COUNT; }

    // nullopt for a head outside 1..10
    static std::optional<ToolPosition> requiredPosition(int head);

    // True when the head is valid and requires the given position
    static bool positionMatches(int head, ToolPosition position);

    // Empty for a head outside 1..10
    std::string headName(int head) const;
    void setHeadName(int head, const std::string& name);

    static std::vector<std::string> defaultHeadNames();

  private:
    std::array<std::string, HEAD_COUNT> m_names;
};

} // namespace hm
