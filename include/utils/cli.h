#pragma once

#include <string>

namespace ardl {

/// Subcommand types for ardl CLI
enum class Subcommand {
    None,     // No subcommand
    List,     // list [--downloaded]
    Status,   // status <id>
    Pull,     // pull <id>
    Rm,       // rm <id>
    Verify,   // verify <id>
};

/// Options for list command
struct ListOptions {
    bool downloaded_only{false};
    bool json{false};
};

/// Options for artifact commands (status, pull, rm, verify)
struct ArtifactOptions {
    std::string artifact_id;
    std::string actor;  // recorded in the audit trail (--actor)
    bool json{false};
};

/// Result of CLI argument parsing
struct CliResult {
    /// Whether the program should exit immediately (e.g., after --help or --version)
    bool should_exit{false};

    /// Exit code to use if should_exit is true
    int exit_code{0};

    /// Output message to display (help text, version info, or error message)
    std::string output;

    Subcommand subcommand{Subcommand::None};

    ListOptions list_options;
    ArtifactOptions artifact_options;
};

/// Parse command line arguments
///
/// @param argc Number of arguments
/// @param argv Argument values
/// @return CliResult indicating whether to continue or exit
CliResult parseCliArgs(int argc, char* argv[]);

/// Get the help message for the CLI
std::string getHelpMessage();

/// Get the version message for the CLI
std::string getVersionMessage();

/// Convert subcommand enum to string
std::string subcommandToString(Subcommand cmd);

}  // namespace ardl
