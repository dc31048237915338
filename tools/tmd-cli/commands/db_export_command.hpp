#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace tmd::cli {

/**
 * Copy the embedded database out to a SQLite file.
 */
class DbExportCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "db-export"; }
    std::string description() const override {
        return "Export the embedded database";
    }

private:
    std::string file_;
    std::string output_;
};

}  // namespace tmd::cli
