#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "ClientSession.h"
#include "ClientSettings.h"
#include "Config.h"
#include "Logger.h"
#include "MetricsCollector.h"

using namespace ChatStorage;

namespace {

std::atomic<bool> g_interrupted{false};

void onSignal(int) {
    g_interrupted = true;
}

void printUsage(const char* program) {
    std::cout << "ChatStorage command line client" << std::endl;
    std::cout << "\nUsage: " << program << " [OPTIONS] <command> [args]" << std::endl;
    std::cout << "\nCommands:" << std::endl;
    std::cout << "  login                            Sign in and print the account" << std::endl;
    std::cout << "  ls [dirId] [page]                Directory tree, or one page of a directory's files" << std::endl;
    std::cout << "  upload <path> <dirId>            Upload a file into a directory" << std::endl;
    std::cout << "  download <fileId> <dest> [size]  Download a file to a local path" << std::endl;
    std::cout << "  tasks                            List unfinished and finished transfers" << std::endl;
    std::cout << "  resume <taskId>                  Resume a paused or failed transfer" << std::endl;
    std::cout << "  cancel <taskId>                  Stop a transfer and forget it" << std::endl;
    std::cout << "\nOptions:" << std::endl;
    std::cout << "  --config <PATH>     Configuration file (default: ~/.config/chatstorage/chatstorage.conf)" << std::endl;
    std::cout << "  --host <HOST>       Server host" << std::endl;
    std::cout << "  --user <NAME>       Account name (or account.user in the config)" << std::endl;
    std::cout << "  --password <PASS>   Account password (or account.password in the config)" << std::endl;
    std::cout << "  --verbose           Debug logging" << std::endl;
    std::cout << "  --help              Show this help message" << std::endl;
}

const char* const kSystemConfigPath = "/etc/chatstorage/chatstorage.conf";

std::string defaultConfigPath() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
        return (std::filesystem::path(xdg) / "chatstorage" / "chatstorage.conf").string();
    }
    if (const char* home = std::getenv("HOME")) {
        return (std::filesystem::path(home) / ".config" / "chatstorage" / "chatstorage.conf").string();
    }
    return "chatstorage.conf";
}

bool parseId(const std::string& text, int64_t& out) {
    try {
        std::size_t used = 0;
        out = std::stoll(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

int fail(const Error& error) {
    std::cerr << "Error: " << error.toString() << std::endl;
    return 1;
}

std::string formatBytes(uint64_t bytes) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1);
    if (bytes < 1024) {
        out << bytes << " B";
    } else if (bytes < 1024 * 1024) {
        out << bytes / 1024.0 << " KB";
    } else {
        out << bytes / 1024.0 / 1024.0 << " MB";
    }
    return out.str();
}

void printTask(const TransferTask& task) {
    std::cout << std::left << std::setw(38) << task.taskId
              << std::setw(10) << transferDirectionName(task.direction)
              << std::setw(11) << transferStatusName(task.status)
              << std::right << std::setw(6) << std::fixed << std::setprecision(1) << task.progress * 100.0 << "%  "
              << task.fileName;
    if (!task.errorMessage.empty()) {
        std::cout << "  (" << task.errorMessage << ")";
    }
    std::cout << std::endl;
}

void printTree(const Json::Value& nodes, int depth) {
    if (!nodes.isArray()) {
        return;
    }
    for (const auto& node : nodes) {
        bool isFile = node.get("isFile", "N").asString() == "Y";
        std::cout << std::string(depth * 2, ' ') << (isFile ? "" : "[") << node.get("fileName", "?").asString()
                  << (isFile ? "" : "]") << "  #" << jsonInt64(node["id"]) << std::endl;
        printTree(node["childFileList"], depth + 1);
    }
}

VoidResult signIn(ClientSession& session, const std::string& user, const std::string& password) {
    if (user.empty()) {
        return Error{ErrorCode::InvalidArgument, "no account; pass --user/--password or set account.user"};
    }
    auto connected = session.connect();
    if (!connected) {
        return connected;
    }
    auto login = session.auth().login(user, password);
    if (!login) {
        return login.error();
    }
    return Ok();
}

// Blocks until every queued transfer stopped; Ctrl-C pauses them
void waitForTransfers(ClientSession& session) {
    auto& scheduler = session.transfers();
    scheduler.setTaskListener([](const TransferTask& task, const std::string& speed) {
        if (!speed.empty()) {
            std::cout << "\r" << task.fileName << "  " << std::fixed << std::setprecision(1)
                      << task.progress * 100.0 << "%  " << formatBytes(task.transferredBytes) << " / "
                      << formatBytes(task.totalSize) << "  " << speed << "        " << std::flush;
        } else if (task.status != TransferStatus::Active && task.status != TransferStatus::Waiting) {
            std::cout << "\n" << task.fileName << ": " << transferStatusName(task.status);
            if (!task.errorMessage.empty()) {
                std::cout << " (" << task.errorMessage << ")";
            }
            std::cout << std::endl;
        }
    });

    while (!scheduler.waitIdle(std::chrono::milliseconds(config::WAIT_SLICE_MS * 5))) {
        if (g_interrupted) {
            std::cout << "\nPausing transfers..." << std::endl;
            for (const auto& task : scheduler.getAllTasks()) {
                if (task.status == TransferStatus::Active || task.status == TransferStatus::Waiting) {
                    auto paused = scheduler.pause(task.taskId);
                    if (!paused) {
                        std::cerr << paused.error().toString() << std::endl;
                    }
                }
            }
            scheduler.waitIdle(std::chrono::milliseconds(session.settings().requestTimeoutMs));
            break;
        }
    }
    scheduler.setTaskListener(nullptr);
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath = defaultConfigPath();
    std::string host;
    std::string user;
    std::string password;
    bool verbose = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--host" && i + 1 < argc) {
            host = argv[++i];
        } else if (arg == "--user" && i + 1 < argc) {
            user = argv[++i];
        } else if (arg == "--password" && i + 1 < argc) {
            password = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    auto& cfg = Config::instance();
    if (!cfg.loadLayered({kSystemConfigPath, configPath})) {
        std::cerr << "Note: no configuration at " << configPath << ", using defaults" << std::endl;
    }
    auto rejected = cfg.validate(ClientSettings::schema());
    if (!rejected.empty()) {
        for (const auto& key : rejected) {
            std::cerr << "Error: invalid value for " << key << ": " << cfg.get(key) << std::endl;
        }
        return 1;
    }

    ClientSettings settings = ClientSettings::fromConfig(cfg);
    if (!host.empty()) {
        settings.host = host;
    }
    if (user.empty()) {
        user = cfg.get("account.user");
        password = cfg.get("account.password");
    }

    auto& logger = Logger::instance();
    logger.setComponent("CLI");
    logger.setLevel(verbose ? LogLevel::DEBUG : Logger::parseLevel(settings.logLevel));
    if (!settings.logFile.empty()) {
        logger.setLogFile(settings.logFile);
        logger.setMaxFileSize(config::MAX_LOG_FILE_SIZE_MB);
        logger.setConsoleOutput(verbose);
    } else if (!verbose && !cfg.hasKey("log.level")) {
        // Keep the console for progress output
        logger.setLevel(LogLevel::WARN);
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    ClientSession session(settings);
    const std::string& command = positional[0];

    if (command == "login") {
        auto signedIn = signIn(session, user, password);
        if (!signedIn) return fail(signedIn.error());
        auto current = session.auth().currentUser();
        std::cout << "Signed in as " << current->userName << " (id " << current->userId << ")" << std::endl;
        return 0;
    }

    if (command == "ls") {
        auto signedIn = signIn(session, user, password);
        if (!signedIn) return fail(signedIn.error());

        if (positional.size() < 2) {
            auto tree = session.directories().listTree();
            if (!tree) return fail(tree.error());
            printTree(tree.value(), 0);
            return 0;
        }

        int64_t dirId = 0;
        int64_t pageNum = 1;
        if (!parseId(positional[1], dirId) || (positional.size() > 2 && !parseId(positional[2], pageNum))) {
            std::cerr << "Error: ls expects numeric dirId and page" << std::endl;
            return 1;
        }
        auto page = session.files().listFiles(dirId, static_cast<int>(pageNum), 20);
        if (!page) return fail(page.error());
        for (const auto& record : page->records) {
            std::cout << std::left << std::setw(22) << jsonInt64(record["id"])
                      << std::setw(12) << formatBytes(static_cast<uint64_t>(jsonInt64(record["fileSize"])))
                      << record.get("fileName", "?").asString() << std::endl;
        }
        std::cout << "page " << pageNum << " of " << page->totalPages << ", " << page->totalCount << " file(s)"
                  << std::endl;
        return 0;
    }

    auto opened = session.openStore();
    if (!opened) return fail(opened.error());

    if (command == "tasks") {
        for (const auto& task : session.transfers().getAllTasks()) {
            printTask(task);
        }
        return 0;
    }

    if (command == "cancel") {
        if (positional.size() < 2) {
            printUsage(argv[0]);
            return 1;
        }
        auto cancelled = session.transfers().cancel(positional[1]);
        if (!cancelled) return fail(cancelled.error());
        std::cout << "Cancelled " << positional[1] << std::endl;
        return 0;
    }

    if (command == "upload" || command == "download" || command == "resume") {
        auto signedIn = signIn(session, user, password);
        if (!signedIn) return fail(signedIn.error());

        if (command == "upload") {
            int64_t dirId = 0;
            if (positional.size() < 3 || !parseId(positional[2], dirId)) {
                std::cerr << "Error: upload expects <path> <dirId>" << std::endl;
                return 1;
            }
            auto taskId = session.upload(positional[1], dirId);
            if (!taskId) return fail(taskId.error());
            std::cout << "Upload task " << taskId.value() << std::endl;
        } else if (command == "download") {
            int64_t fileId = 0;
            int64_t size = 0;
            if (positional.size() < 3 || !parseId(positional[1], fileId) ||
                (positional.size() > 3 && !parseId(positional[3], size))) {
                std::cerr << "Error: download expects <fileId> <dest> [size]" << std::endl;
                return 1;
            }
            std::string name = std::filesystem::path(positional[2]).filename().string();
            auto taskId = session.download(fileId, name, positional[2], static_cast<uint64_t>(size));
            if (!taskId) return fail(taskId.error());
            std::cout << "Download task " << taskId.value() << std::endl;
        } else {
            if (positional.size() < 2) {
                printUsage(argv[0]);
                return 1;
            }
            auto resumed = session.transfers().resume(positional[1]);
            if (!resumed) return fail(resumed.error());
        }

        waitForTransfers(session);
        if (verbose) {
            std::cout << MetricsCollector::instance().getMetricsSummary() << std::endl;
        }
        return 0;
    }

    std::cerr << "Unknown command: " << command << std::endl;
    printUsage(argv[0]);
    return 1;
}
