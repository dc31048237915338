#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace tmd::cli {

/**
 * Run read-only SQL against the embedded database.
 */
class QueryCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "query"; }
    std::string description() const override {
        return "Query the embedded database";
    }

private:
    std::string file_;
    std::string sql_;
};

}  // namespace tmd::cli
