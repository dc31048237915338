#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace tmd::cli {

/**
 * Replace the embedded database with a SQLite file.
 */
class DbImportCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "db-import"; }
    std::string description() const override {
        return "Import a SQLite file as the embedded database";
    }

private:
    std::string file_;
    std::string input_;
};

}  // namespace tmd::cli
