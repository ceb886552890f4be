#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "artifacts/artifact_catalog.h"
#include "artifacts/artifact_downloader.h"
#include "artifacts/audit_sink.h"
#include "artifacts/transfer_coordinator.h"
#include "cli/commands.h"
#include "net/http_transport.h"
#include "utils/cli.h"
#include "utils/config.h"
#include "utils/logger.h"

namespace {

ardl::ArtifactCatalog makeCatalog(const ardl::StoreConfig& cfg) {
    if (!cfg.catalog_path.empty()) {
        spdlog::info("Loading catalog from {}", cfg.catalog_path);
        return ardl::ArtifactCatalog::fromJsonFile(cfg.store_dir, cfg.catalog_path);
    }
    return ardl::ArtifactCatalog(cfg.store_dir, ardl::ArtifactCatalog::builtinDescriptors());
}

int run(const ardl::CliResult& cli_result) {
    auto [cfg, config_log] = ardl::loadStoreConfigWithLog();
    spdlog::info("Config: {}", config_log);

    const auto catalog = makeCatalog(cfg);

    auto transport = std::make_shared<ardl::HttplibTransport>(
        std::chrono::duration_cast<std::chrono::milliseconds>(cfg.transfer_timeout), cfg.hf_token);

    ardl::DownloadOptions download_options;
    download_options.chunk_size = cfg.chunk_size;
    download_options.progress_interval = cfg.progress_interval;

    ardl::TransferCoordinator coordinator(
        catalog,
        ardl::ArtifactDownloader(transport, download_options),
        std::make_shared<ardl::JsonlAuditSink>(cfg.audit_log_path),
        ardl::IntegrityVerifier(cfg.chunk_size));

    switch (cli_result.subcommand) {
        case ardl::Subcommand::List:
            return ardl::cli::commands::list(coordinator, cli_result.list_options);
        case ardl::Subcommand::Status:
            return ardl::cli::commands::status(coordinator, cli_result.artifact_options);
        case ardl::Subcommand::Pull:
            return ardl::cli::commands::pull(coordinator, cli_result.artifact_options);
        case ardl::Subcommand::Rm:
            return ardl::cli::commands::rm(coordinator, cli_result.artifact_options);
        case ardl::Subcommand::Verify:
            return ardl::cli::commands::verify(coordinator, cli_result.artifact_options);
        case ardl::Subcommand::None:
            break;
    }
    std::cout << ardl::getHelpMessage();
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse CLI arguments first
    auto cli_result = ardl::parseCliArgs(argc, argv);
    if (cli_result.should_exit) {
        std::cout << cli_result.output;
        return cli_result.exit_code;
    }

    try {
        ardl::logger::init_from_env();
        return run(cli_result);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: invalid configuration: " << e.what() << std::endl;
        spdlog::error("Invalid configuration: {}", e.what());
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        spdlog::error("Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        spdlog::error("Fatal: {}", e.what());
        return 1;
    }
}
