// CLI argument parser for the ardl subcommands
#include "utils/cli.h"
#include "utils/version.h"
#include <cstring>
#include <sstream>

namespace ardl {

std::string getListHelpMessage();
std::string getStatusHelpMessage();
std::string getPullHelpMessage();
std::string getRmHelpMessage();
std::string getVerifyHelpMessage();

std::string getHelpMessage() {
    std::ostringstream oss;
    oss << "ardl " << ARDL_VERSION << " - artifact downloader\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    ardl <COMMAND>\n";
    oss << "\n";
    oss << "COMMANDS:\n";
    oss << "    list       List catalog artifacts\n";
    oss << "    status     Show download status of an artifact\n";
    oss << "    pull       Download an artifact\n";
    oss << "    rm         Delete a downloaded artifact\n";
    oss << "    verify     Check size and checksum of a downloaded artifact\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -h, --help       Print help information\n";
    oss << "    -V, --version    Print version information\n";
    oss << "\n";
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    ARDL_CONFIG                Config file path (default: ~/.ardl/config.json)\n";
    oss << "    ARDL_STORE_DIR             Artifact store directory (default: ~/.ardl/artifacts)\n";
    oss << "    ARDL_CATALOG               JSON catalog file (default: built-in catalog)\n";
    oss << "    ARDL_AUDIT_LOG             Audit trail (default: ~/.ardl/audit.jsonl)\n";
    oss << "    ARDL_TIMEOUT_SEC           Transfer timeout in seconds (default: 600)\n";
    oss << "    ARDL_LOG_LEVEL             Log level (trace|debug|info|warn|error)\n";
    oss << "    ARDL_LOG_DIR               Log directory (default: ~/.ardl/logs)\n";
    oss << "    HF_TOKEN                   HuggingFace token (for gated repositories)\n";
    oss << "\n";
    oss << "Run 'ardl <COMMAND> --help' for more info.\n";
    return oss.str();
}

std::string getListHelpMessage() {
    std::ostringstream oss;
    oss << "ardl list - List catalog artifacts\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    ardl list [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --downloaded     Only show artifacts present in the store\n";
    oss << "    --json           Print JSON instead of a table\n";
    oss << "    -h, --help       Print help\n";
    return oss.str();
}

std::string getStatusHelpMessage() {
    std::ostringstream oss;
    oss << "ardl status - Show download status of an artifact\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    ardl status <ID> [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --json           Print JSON\n";
    oss << "    -h, --help       Print help\n";
    return oss.str();
}

std::string getPullHelpMessage() {
    std::ostringstream oss;
    oss << "ardl pull - Download an artifact\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    ardl pull <ID> [OPTIONS]\n";
    oss << "\n";
    oss << "ARGUMENTS:\n";
    oss << "    <ID>             Catalog id (see 'ardl list')\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --actor <NAME>   Actor recorded in the audit trail\n";
    oss << "    -h, --help       Print help\n";
    oss << "\n";
    oss << "EXIT CODES:\n";
    oss << "    0 downloaded (or already present), 1 failed or unknown id,\n";
    oss << "    3 a download of this artifact is already in progress\n";
    return oss.str();
}

std::string getRmHelpMessage() {
    std::ostringstream oss;
    oss << "ardl rm - Delete a downloaded artifact\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    ardl rm <ID> [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --actor <NAME>   Actor recorded in the audit trail\n";
    oss << "    -h, --help       Print help\n";
    return oss.str();
}

std::string getVerifyHelpMessage() {
    std::ostringstream oss;
    oss << "ardl verify - Check size and checksum of a downloaded artifact\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    ardl verify <ID> [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --json           Print the integrity report as JSON\n";
    oss << "    -h, --help       Print help\n";
    return oss.str();
}

std::string getVersionMessage() {
    std::ostringstream oss;
    oss << "ardl " << ARDL_VERSION << "\n";
    return oss.str();
}

namespace {

bool hasHelpFlag(int argc, char* argv[], int start) {
    for (int i = start; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            return true;
        }
    }
    return false;
}

// Shared parsing for commands taking a single <ID>.
void parseArtifactCommand(int argc, char* argv[], const char* name, CliResult& result) {
    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], "--json") == 0) {
            result.artifact_options.json = true;
        } else if (std::strcmp(argv[i], "--actor") == 0 && i + 1 < argc) {
            result.artifact_options.actor = argv[++i];
        } else if (argv[i][0] != '-' && result.artifact_options.artifact_id.empty()) {
            result.artifact_options.artifact_id = argv[i];
        }
    }

    if (result.artifact_options.artifact_id.empty()) {
        result.should_exit = true;
        result.exit_code = 1;
        result.output = std::string("Error: artifact id required\n\nUsage: ardl ") + name + " <ID>\n";
    }
}

}  // namespace

CliResult parseCliArgs(int argc, char* argv[]) {
    CliResult result;

    if (argc < 2) {
        result.should_exit = true;
        result.exit_code = 1;
        result.output = getHelpMessage();
        return result;
    }

    const char* command = argv[1];

    if (std::strcmp(command, "-h") == 0 || std::strcmp(command, "--help") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getHelpMessage();
        return result;
    }

    if (std::strcmp(command, "-V") == 0 || std::strcmp(command, "--version") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getVersionMessage();
        return result;
    }

    struct CommandSpec {
        const char* name;
        Subcommand subcommand;
        std::string (*help)();
    };
    static const CommandSpec kCommands[] = {
        {"list", Subcommand::List, &getListHelpMessage},
        {"status", Subcommand::Status, &getStatusHelpMessage},
        {"pull", Subcommand::Pull, &getPullHelpMessage},
        {"rm", Subcommand::Rm, &getRmHelpMessage},
        {"verify", Subcommand::Verify, &getVerifyHelpMessage},
    };

    for (const auto& spec : kCommands) {
        if (std::strcmp(command, spec.name) != 0) continue;
        result.subcommand = spec.subcommand;

        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = spec.help();
            return result;
        }

        if (spec.subcommand == Subcommand::List) {
            for (int i = 2; i < argc; ++i) {
                if (std::strcmp(argv[i], "--downloaded") == 0) {
                    result.list_options.downloaded_only = true;
                } else if (std::strcmp(argv[i], "--json") == 0) {
                    result.list_options.json = true;
                }
            }
            return result;
        }

        parseArtifactCommand(argc, argv, spec.name, result);
        return result;
    }

    // Unknown command
    result.should_exit = true;
    result.exit_code = 1;
    std::ostringstream oss;
    oss << "Unknown command: " << command << "\n\n";
    oss << getHelpMessage();
    result.output = oss.str();
    return result;
}

std::string subcommandToString(Subcommand subcommand) {
    switch (subcommand) {
        case Subcommand::None: return "none";
        case Subcommand::List: return "list";
        case Subcommand::Status: return "status";
        case Subcommand::Pull: return "pull";
        case Subcommand::Rm: return "rm";
        case Subcommand::Verify: return "verify";
    }
    return "unknown";
}

}  // namespace ardl
