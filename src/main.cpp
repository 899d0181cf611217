// Hydromat - Main Entry Point
// Command line front end for the tooling database.

#include <iostream>
#include <string>
#include <vector>

#include "app/application.h"
#include "core/config/config.h"
#include "core/security/access_control.h"
#include "core/services/assignment_service.h"
#include "core/services/profile_service.h"
#include "core/services/tool_service.h"
#include "core/tools/tool_code.h"
#include "core/utils/string_utils.h"

using namespace hm;

namespace {

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--db PATH] [--config PATH] [-v] COMMAND\n"
              << "\n"
              << "Commands:\n"
              << "  code generate <profile> <position> <type> <set>\n"
              << "  code decode <code>\n"
              << "  profiles\n"
              << "  add-profile <name>\n"
              << "  add-tool <profile-id> <position> <type> [set]\n"
              << "  tools <profile-id>\n"
              << "  heads <profile-id>\n"
              << "  joblog <profile-id> [action]\n"
              << "  mode [read_only|full_access]\n";
}

bool parseId(const std::string& text, i64& id) {
    if (!str::parseInt64(text, id) || id <= 0) {
        std::cerr << "Error: invalid id '" << text << "'\n";
        return false;
    }
    return true;
}

int cmdCode(const std::vector<std::string>& args) {
    if (args.size() == 6 && args[1] == "generate") {
        int profileId = 0;
        int setNumber = 0;
        if (!str::parseInt(args[2], profileId) || !str::parseInt(args[5], setNumber)) {
            std::cerr << "Error: profile and set must be integers\n";
            return 1;
        }
        try {
            std::cout << ToolCodeGenerator::generate(profileId, args[3], args[4], setNumber)
                      << "\n";
        } catch (const ToolCodeError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
        return 0;
    }

    if (args.size() == 3 && args[1] == "decode") {
        auto decoded = ToolCodeGenerator::decode(args[2]);
        if (!decoded) {
            std::cerr << "Error: '" << args[2] << "' is not a valid tool code\n";
            return 1;
        }
        std::cout << "Position:   " << toString(decoded->position) << "\n"
                  << "Tool type:  " << toString(decoded->toolType) << "\n"
                  << "Profile ID: " << decoded->profileId << "\n"
                  << "Set number: " << decoded->setNumber << "\n";
        return 0;
    }

    std::cerr << "Usage: code generate <profile> <position> <type> <set> | code decode <code>\n";
    return 2;
}

int cmdProfiles(Application& app) {
    auto profiles = app.profiles().getAllProfiles();
    if (profiles.empty()) {
        std::cout << "No profiles\n";
        return 0;
    }
    for (const auto& p : profiles) {
        std::cout << str::padRight(std::to_string(p.id), 5) << str::padRight(p.name, 30)
                  << str::padRight(str::formatDecimal(p.feedRate) + " m/min", 12)
                  << app.profiles().materialSizeDisplay(p.id) << "\n";
    }
    return 0;
}

int cmdAddProfile(Application& app, const std::string& name) {
    auto result = app.profiles().createProfile(app.permissions(), app.newProfileDraft(name));
    if (!result.success) {
        std::cerr << "Error: " << result.error << "\n";
        return 1;
    }
    std::cout << result.id << "\n";
    return 0;
}

int cmdAddTool(Application& app, i64 profileId, const std::vector<std::string>& args) {
    ToolDraft draft = app.newToolDraft(profileId);
    draft.position = args[2];
    draft.toolType = args[3];
    if (args.size() >= 5 && !str::parseInt(args[4], draft.setNumber)) {
        std::cerr << "Error: set must be an integer\n";
        return 2;
    }

    auto result = app.tools().createTool(app.permissions(), draft);
    if (!result.success) {
        std::cerr << "Error: " << result.error << "\n";
        return 1;
    }
    std::cout << result.code << "\n";
    return 0;
}

int cmdTools(Application& app, i64 profileId) {
    if (!app.profiles().getProfile(profileId)) {
        std::cerr << "Error: profile " << profileId << " not found\n";
        return 1;
    }
    auto tools = app.tools().getToolsForProfile(profileId);
    if (tools.empty()) {
        std::cout << "No tools\n";
        return 0;
    }
    for (const auto& t : tools) {
        std::cout << t.code << "  " << str::padRight(toString(t.position), 7)
                  << str::padRight(toString(t.toolType), 9) << "set " << t.setNumber
                  << "  knives " << str::padRight(std::to_string(t.knivesCount), 3)
                  << str::padRight(t.status, 11) << (t.photo ? "photo" : "") << "\n";
    }
    return 0;
}

int cmdHeads(Application& app, i64 profileId) {
    if (!app.profiles().getProfile(profileId)) {
        std::cerr << "Error: profile " << profileId << " not found\n";
        return 1;
    }
    for (const auto& slot : app.assignments().getHeadSlots(profileId)) {
        std::cout << str::padRight(std::to_string(slot.headNumber), 4)
                  << str::padRight(slot.name, 12) << str::padRight(toString(slot.requiredPosition), 8);
        if (slot.tool) {
            std::cout << slot.tool->code;
            if (slot.assignment->rpm) {
                std::cout << "  " << *slot.assignment->rpm << " rpm";
            }
            if (slot.assignment->passDepth) {
                std::cout << "  " << str::formatDecimal(*slot.assignment->passDepth) << " mm";
            }
            if (slot.positionMismatch) {
                std::cout << "  (position mismatch: tool is " << toString(slot.tool->position)
                          << ")";
            }
        } else {
            std::cout << "-";
        }
        std::cout << "\n";
    }
    return 0;
}

int cmdMode(Application& app, const std::vector<std::string>& args) {
    if (args.size() == 1) {
        std::cout << app.access().modeText() << "\n";
        return 0;
    }
    auto mode = parseAccessMode(args[1]);
    if (!mode) {
        std::cerr << "Error: unknown mode '" << args[1] << "'\n";
        return 2;
    }
    if (!app.access().setMode(*mode)) {
        std::cerr << "Warning: mode changed for this session but could not be saved\n";
        return 1;
    }
    std::cout << app.access().modeText() << "\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    AppOptions options;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--db" || arg == "--config") && i + 1 < argc) {
            (arg == "--db" ? options.databasePath : options.configPath) = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    // Code arithmetic needs no database
    if (args[0] == "code") {
        return cmdCode(args);
    }

    Application app(options);
    if (!app.init()) {
        std::cerr << "Error: initialization failed\n";
        return 1;
    }

    const std::string& cmd = args[0];
    i64 id = 0;

    if (cmd == "profiles") {
        return cmdProfiles(app);
    }
    if (cmd == "mode") {
        return cmdMode(app, args);
    }
    if (cmd == "add-profile" && args.size() == 2) {
        return cmdAddProfile(app, args[1]);
    }
    if (cmd == "add-tool" && (args.size() == 4 || args.size() == 5)) {
        if (!parseId(args[1], id)) {
            return 2;
        }
        return cmdAddTool(app, id, args);
    }
    if ((cmd == "tools" || cmd == "heads" || cmd == "joblog") && args.size() >= 2) {
        if (!parseId(args[1], id)) {
            return 2;
        }
        if (cmd == "tools") {
            return cmdTools(app, id);
        }
        if (cmd == "heads") {
            return cmdHeads(app, id);
        }
        std::string action = args.size() >= 3 ? args[2] : "JOB";
        if (!app.logJob(id, action)) {
            std::cerr << "Error: could not write job log\n";
            return 1;
        }
        return 0;
    }

    printUsage(argv[0]);
    return 2;
}
