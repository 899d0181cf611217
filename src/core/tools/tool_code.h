#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace hm {

// Mounting side of a tool on the moulder. Values are the code digits.
enum class ToolPosition { Bottom = 1, Top = 2, Right = 3, Left = 4 };

// Cutter geometry. Values are the code digits.
enum class ToolType { Straight = 0, Profile = 1 };

const char* toString(ToolPosition position);
const char* toString(ToolType type);

// Exact, case-sensitive name lookup ("Bottom", "Straight", ...)
std::optional<ToolPosition> parsePosition(std::string_view name);
std::optional<ToolType> parseToolType(std::string_view name);

// Structural content of a 6-digit tool code
struct DecodedToolCode {
    ToolPosition position = ToolPosition::Bottom;
    ToolType toolType = ToolType::Profile;
    int profileId = 0;
    int setNumber = 0;

    bool operator==(const DecodedToolCode& other) const {
        return position == other.position && toolType == other.toolType &&
               profileId == other.profileId && setNumber == other.setNumber;
    }
    bool operator!=(const DecodedToolCode& other) const { return !(*this == other); }
};

// Raised by generate() for an out-of-range or unknown input parameter.
// what() names the offending value.
class ToolCodeError : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

// Tool code layout: P T NNN S
//   P   position digit (1=Bottom 2=Top 3=Right 4=Left)
//   T   type digit (0=Straight 1=Profile)
//   NNN profile id, zero padded
//   S   set number
// The first five characters identify the tool set.
class ToolCodeGenerator {
  public:
    static constexpr int MIN_PROFILE_ID = 1;
    static constexpr int MAX_PROFILE_ID = 999;
    static constexpr int MIN_SET_NUMBER = 1;
    static constexpr int MAX_SET_NUMBER = 9;
    static constexpr std::size_t CODE_LENGTH = 6;
    static constexpr std::size_t SET_PREFIX_LENGTH = 5;

    // Throws ToolCodeError. Checks run in order: profile id, position, type, set number.
    static std::string generate(int profileId, std::string_view position,
                                std::string_view toolType, int setNumber);
    static std::string generate(int profileId, ToolPosition position, ToolType toolType,
                                int setNumber);

    // Never throws. Unknown position/type digits fall back to Bottom/Profile;
    // profile id and set number are not range-checked.
    static std::optional<DecodedToolCode> decode(std::string_view code);
    static std::optional<DecodedToolCode> decode(const char* code);

    static bool validateCode(std::string_view code);
    static bool validateCode(const char* code);

    // First five characters of a decodable code, empty otherwise
    static std::string setPrefix(std::string_view code);
};

} // namespace hm
