#include "commands/attach_command.hpp"
#include "commands/db_export_command.hpp"
#include "commands/db_import_command.hpp"
#include "commands/detach_command.hpp"
#include "commands/info_command.hpp"
#include "commands/new_command.hpp"
#include "commands/pack_command.hpp"
#include "commands/query_command.hpp"
#include "commands/unpack_command.hpp"
#include "commands/validate_command.hpp"

#include <tmd/util/logger.hpp>

#include <cstdlib>
#include <memory>
#include <utility>
#include <vector>

namespace {

using tmd::cli::Command;

// -v wins over TMD_LOG_LEVEL; unset or unknown levels fall back to warnings only
tmd::LogLevel select_log_level(bool verbose) {
    if (verbose) {
        return tmd::LogLevel::DEBUG;
    }
    const char* env = std::getenv("TMD_LOG_LEVEL");
    if (env && env[0] != '\0') {
        auto level = tmd::parse_log_level(env);
        if (level) {
            return *level;
        }
        std::cerr << "Warning: ignoring unknown TMD_LOG_LEVEL '" << env << "'\n";
    }
    return tmd::LogLevel::WARNING;
}

std::vector<std::unique_ptr<Command>> make_commands() {
    std::vector<std::unique_ptr<Command>> commands;
    commands.push_back(std::make_unique<tmd::cli::NewCommand>());
    commands.push_back(std::make_unique<tmd::cli::InfoCommand>());
    commands.push_back(std::make_unique<tmd::cli::ValidateCommand>());
    commands.push_back(std::make_unique<tmd::cli::PackCommand>());
    commands.push_back(std::make_unique<tmd::cli::UnpackCommand>());
    commands.push_back(std::make_unique<tmd::cli::AttachCommand>());
    commands.push_back(std::make_unique<tmd::cli::DetachCommand>());
    commands.push_back(std::make_unique<tmd::cli::QueryCommand>());
    commands.push_back(std::make_unique<tmd::cli::DbExportCommand>());
    commands.push_back(std::make_unique<tmd::cli::DbImportCommand>());
    return commands;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"tmd - Markdown documents with attachments and an embedded database"};
    app.require_subcommand(1);

    tmd::cli::CommandContext ctx;
    app.add_flag("-v,--verbose", ctx.verbose, "Enable debug logging");

    auto commands = make_commands();
    std::vector<std::pair<CLI::App*, Command*>> registered;
    for (auto& command : commands) {
        CLI::App* sub = app.add_subcommand(command->name(), command->description());
        command->setup(*sub);
        registered.emplace_back(sub, command.get());
    }

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        return code == 0 ? tmd::cli::TMD_EXIT_SUCCESS : tmd::cli::TMD_EXIT_USER_ERROR;
    }

    auto console = std::make_shared<tmd::ConsoleLogger>();
    console->set_min_level(select_log_level(ctx.verbose));
    tmd::set_logger(console);

    try {
        for (auto& [sub, command] : registered) {
            if (sub->parsed()) {
                return command->execute(ctx);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return tmd::cli::TMD_EXIT_INTERNAL;
    }

    return tmd::cli::TMD_EXIT_USER_ERROR;
}
