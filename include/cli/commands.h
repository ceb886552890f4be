// CLI command function declarations
#pragma once

#include <iostream>

#include "utils/cli.h"

namespace ardl {

class TransferCoordinator;

namespace cli {
namespace commands {

/// Exit code for 'pull' when the artifact is already being downloaded
constexpr int kExitInProgress = 3;

/// Execute the 'list' command
/// @return Exit code (0=success)
int list(const TransferCoordinator& coordinator, const ListOptions& options,
         std::ostream& out = std::cout);

/// Execute the 'status' command
/// @return Exit code (0=success, 1=unknown artifact)
int status(const TransferCoordinator& coordinator, const ArtifactOptions& options,
           std::ostream& out = std::cout, std::ostream& err = std::cerr);

/// Execute the 'pull' command
/// @return Exit code (0=success, 1=error, 3=already in progress)
int pull(TransferCoordinator& coordinator, const ArtifactOptions& options,
         std::ostream& out = std::cout, std::ostream& err = std::cerr);

/// Execute the 'rm' command
/// @return Exit code (0=deleted, 1=unknown or not downloaded)
int rm(TransferCoordinator& coordinator, const ArtifactOptions& options,
       std::ostream& out = std::cout, std::ostream& err = std::cerr);

/// Execute the 'verify' command
/// @return Exit code (0=valid, 1=invalid or absent)
int verify(const TransferCoordinator& coordinator, const ArtifactOptions& options,
           std::ostream& out = std::cout, std::ostream& err = std::cerr);

}  // namespace commands
}  // namespace cli
}  // namespace ardl
