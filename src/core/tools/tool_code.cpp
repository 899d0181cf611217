#include "tool_code.h"

#include "../utils/string_utils.h"

namespace hm {

namespace {

char positionDigit(ToolPosition position) {
    return static_cast<char>('0' + static_cast<int>(position));
}

char typeDigit(ToolType type) {
    return static_cast<char>('0' + static_cast<int>(type));
}

bool isKnownPosition(ToolPosition position) {
    switch (position) {
        case ToolPosition::Bottom:
        case ToolPosition::Top:
        case ToolPosition::Right:
        case ToolPosition::Left:
            return true;
    }
    return false;
}

bool isKnownType(ToolType type) {
    return type == ToolType::Straight || type == ToolType::Profile;
}

void checkProfileId(int profileId) {
    if (profileId < ToolCodeGenerator::MIN_PROFILE_ID ||
        profileId > ToolCodeGenerator::MAX_PROFILE_ID) {
        throw ToolCodeError("Profile ID must be 1-999, got " + std::to_string(profileId));
    }
}

void checkSetNumber(int setNumber) {
    if (setNumber < ToolCodeGenerator::MIN_SET_NUMBER ||
        setNumber > ToolCodeGenerator::MAX_SET_NUMBER) {
        throw ToolCodeError("Set number must be 1-9, got " + std::to_string(setNumber));
    }
}

std::string assemble(int profileId, ToolPosition position, ToolType toolType, int setNumber) {
    std::string code(ToolCodeGenerator::CODE_LENGTH, '0');
    code[0] = positionDigit(position);
    code[1] = typeDigit(toolType);
    code[2] = static_cast<char>('0' + profileId / 100);
    code[3] = static_cast<char>('0' + (profileId / 10) % 10);
    code[4] = static_cast<char>('0' + profileId % 10);
    code[5] = static_cast<char>('0' + setNumber);
    return code;
}

} // namespace

const char* toString(ToolPosition position) {
    switch (position) {
        case ToolPosition::Bottom:
            return "Bottom";
        case ToolPosition::Top:
            return "Top";
        case ToolPosition::Right:
            return "Right";
        case ToolPosition::Left:
            return "Left";
    }
    return "Unknown";
}

const char* toString(ToolType type) {
    switch (type) {
        case ToolType::Straight:
            return "Straight";
        case ToolType::Profile:
            return "Profile";
    }
    return "Unknown";
}

std::optional<ToolPosition> parsePosition(std::string_view name) {
    if (name == "Bottom") return ToolPosition::Bottom;
    if (name == "Top") return ToolPosition::Top;
    if (name == "Right") return ToolPosition::Right;
    if (name == "Left") return ToolPosition::Left;
    return std::nullopt;
}

std::optional<ToolType> parseToolType(std::string_view name) {
    if (name == "Straight") return ToolType::Straight;
    if (name == "Profile") return ToolType::Profile;
    return std::nullopt;
}

std::string ToolCodeGenerator::generate(int profileId, std::string_view position,
                                        std::string_view toolType, int setNumber) {
    checkProfileId(profileId);

    auto pos = parsePosition(position);
    if (!pos) {
        throw ToolCodeError("Invalid position: " + std::string(position));
    }

    auto type = parseToolType(toolType);
    if (!type) {
        throw ToolCodeError("Invalid tool type: " + std::string(toolType));
    }

    checkSetNumber(setNumber);
    return assemble(profileId, *pos, *type, setNumber);
}

std::string ToolCodeGenerator::generate(int profileId, ToolPosition position, ToolType toolType,
                                        int setNumber) {
    checkProfileId(profileId);
    if (!isKnownPosition(position)) {
        throw ToolCodeError("Invalid position: " + std::to_string(static_cast<int>(position)));
    }
    if (!isKnownType(toolType)) {
        throw ToolCodeError("Invalid tool type: " + std::to_string(static_cast<int>(toolType)));
    }
    checkSetNumber(setNumber);
    return assemble(profileId, position, toolType, setNumber);
}

std::optional<DecodedToolCode> ToolCodeGenerator::decode(std::string_view code) {
    // Position and type digits are read leniently; the rest must be digits
    if (code.size() != CODE_LENGTH || !str::isDigits(code.substr(2))) {
        return std::nullopt;
    }

    DecodedToolCode decoded;
    decoded.position = ToolPosition::Bottom;
    if (code[0] >= '1' && code[0] <= '4') {
        decoded.position = static_cast<ToolPosition>(code[0] - '0');
    }
    decoded.toolType = code[1] == '0' ? ToolType::Straight : ToolType::Profile;
    decoded.profileId = (code[2] - '0') * 100 + (code[3] - '0') * 10 + (code[4] - '0');
    decoded.setNumber = code[5] - '0';
    return decoded;
}

std::optional<DecodedToolCode> ToolCodeGenerator::decode(const char* code) {
    if (code == nullptr) {
        return std::nullopt;
    }
    return decode(std::string_view(code));
}

bool ToolCodeGenerator::validateCode(std::string_view code) {
    return decode(code).has_value();
}

bool ToolCodeGenerator::validateCode(const char* code) {
    return decode(code).has_value();
}

std::string ToolCodeGenerator::setPrefix(std::string_view code) {
    if (!validateCode(code)) {
        return {};
    }
    return std::string(code.substr(0, SET_PREFIX_LENGTH));
}

} // namespace hm
