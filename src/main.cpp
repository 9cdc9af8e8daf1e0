#include "sheetdrive/SheetDrive.hpp"
#include "sheetdrive/utils/CommonUtils.hpp"
#include "sheetdrive/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <iostream>
#include <string>

using namespace sheetdrive;

namespace {

void printUsage() {
    fmt::print("Usage: sheetdrive [--data DIR] [--log FILE] [--verbose]\n"
               "Commands (one per line on stdin):\n"
               "  set REF TEXT        set a literal, or a formula when TEXT starts with '='\n"
               "  get REF             print display value and edit text\n"
               "  show [ROWS COLS]    print the active sheet grid\n"
               "  sheets              list sheets (* marks the active one)\n"
               "  addsheet            add a sheet\n"
               "  rmsheet ID          remove a sheet\n"
               "  rename ID NAME      rename a sheet\n"
               "  use ID              make a sheet active\n"
               "  save [NAME]         save the document\n"
               "  load ID             load a saved document\n"
               "  list                list saved documents\n"
               "  new                 start a new document\n"
               "  status              print document status\n"
               "  quit                exit\n");
}

// 拆出第一个空白分隔的词，rest 为剩余部分（已去除首尾空白）
std::string nextWord(const std::string& line, std::string& rest) {
    const std::string text(utils::CommonUtils::trim(line));
    const auto pos = text.find_first_of(" \t");
    if (pos == std::string::npos) {
        rest.clear();
        return text;
    }
    rest = std::string(utils::CommonUtils::trim(std::string_view(text).substr(pos + 1)));
    return text.substr(0, pos);
}

void printGrid(const core::GridSnapshot& grid) {
    fmt::print("{:>4}", "");
    for (const auto& header : grid.column_headers) {
        fmt::print(" | {:<10}", header);
    }
    fmt::print("\n");
    for (size_t r = 0; r < grid.rows.size(); ++r) {
        fmt::print("{:>4}", r + 1);
        for (const auto& value : grid.rows[r]) {
            fmt::print(" | {:<10}", value);
        }
        fmt::print("\n");
    }
}

int parseCount(const std::string& text, const char* what) {
    const auto number = utils::CommonUtils::parseDouble(text);
    if (!number || *number < 1 || *number > 10000 || *number != static_cast<int>(*number)) {
        SHEETDRIVE_THROW(core::ParameterException, fmt::format("Invalid {} count: {}", what, text), what);
    }
    return static_cast<int>(*number);
}

/**
 * @brief 执行一条命令
 * @return false 表示退出
 */
bool executeCommand(SpreadsheetSession& session, const std::string& line) {
    std::string rest;
    const std::string command = nextWord(line, rest);
    if (command.empty()) {
        return true;
    }

    const std::string sheet = session.activeSheetId();

    if (command == "quit" || command == "exit") {
        return false;
    } else if (command == "help") {
        printUsage();
    } else if (command == "set") {
        std::string text;
        const std::string ref = nextWord(rest, text);
        if (ref.empty()) {
            SHEETDRIVE_THROW(core::ParameterException, "Usage: set REF TEXT", "ref");
        }
        session.commitInput(sheet, ref, text);
        fmt::print("{} = {}\n", ref, session.displayValue(sheet, ref));
    } else if (command == "get") {
        if (rest.empty()) {
            SHEETDRIVE_THROW(core::ParameterException, "Usage: get REF", "ref");
        }
        fmt::print("{}: {} [{}]\n", rest, session.displayValue(sheet, rest), session.editText(sheet, rest));
    } else if (command == "show") {
        if (rest.empty()) {
            printGrid(session.snapshotGrid(sheet));
        } else {
            std::string cols_text;
            const std::string rows_text = nextWord(rest, cols_text);
            if (cols_text.empty()) {
                SHEETDRIVE_THROW(core::ParameterException, "Usage: show [ROWS COLS]", "cols");
            }
            printGrid(session.snapshotGrid(sheet, parseCount(rows_text, "rows"), parseCount(cols_text, "cols")));
        }
    } else if (command == "sheets") {
        for (const auto& info : session.listSheets()) {
            fmt::print("{} {} ({})\n", info.id == sheet ? '*' : ' ', info.name, info.id);
        }
    } else if (command == "addsheet") {
        fmt::print("Added {}\n", session.addSheet());
    } else if (command == "rmsheet") {
        session.removeSheet(rest);
    } else if (command == "rename") {
        std::string name;
        const std::string id = nextWord(rest, name);
        session.renameSheet(id, name);
    } else if (command == "use") {
        auto error = session.setActiveSheet(rest);
        if (error) {
            fmt::print(stderr, "Error: {}\n", error.fullMessage());
        }
    } else if (command == "save") {
        auto saved = session.save(rest);
        if (!saved) {
            fmt::print(stderr, "Error: {}\n", saved.error().fullMessage());
        } else {
            fmt::print("Saved {} ({})\n", session.currentRecord().name, saved.value());
        }
    } else if (command == "load") {
        auto loaded = session.load(rest);
        if (!loaded) {
            fmt::print(stderr, "Error: {}\n", loaded.error().fullMessage());
        } else {
            fmt::print("Loaded {}\n", session.currentRecord().name);
        }
    } else if (command == "list") {
        for (const auto& record : session.listAvailable()) {
            fmt::print("{}  {}\n", record.id, record.name);
        }
    } else if (command == "new") {
        session.newDocument();
    } else if (command == "status") {
        const auto& record = session.currentRecord();
        fmt::print("{}  {}\n", session.statusText(),
                   record.id.empty() ? std::string("<unsaved>") : fmt::format("{} ({})", record.name, record.id));
    } else {
        fmt::print(stderr, "Error: Unknown command: {}\n", command);
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    core::DriveOptions options;
    std::string log_file;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--data" && i + 1 < argc) {
            options.data_directory = argv[++i];
        } else if (arg == "--log" && i + 1 < argc) {
            log_file = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            fmt::print(stderr, "Unknown argument: {}\n", arg);
            printUsage();
            return 1;
        }
    }

    // 命令行默认只输出告警，--log 时同时写文件
    if (!initialize(log_file, verbose)) {
        return 1;
    }
    Logger::getInstance().setLevel(verbose ? Logger::Level::DEBUG : Logger::Level::WARN);

    SpreadsheetSession session(options);
    CLI_INFO("Session started, data directory: {}", options.data_directory);

    std::string line;
    while (std::getline(std::cin, line)) {
        try {
            if (!executeCommand(session, line)) {
                break;
            }
        } catch (const core::SheetDriveException& e) {
            CLI_DEBUG("Command failed: {}", e.what());
            fmt::print(stderr, "Error: {}\n", e.what());
        }
    }

    cleanup();
    return 0;
}
