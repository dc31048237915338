#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace tmd::cli {

/**
 * Create an empty document.
 */
class NewCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "new"; }
    std::string description() const override {
        return "Create a new empty document";
    }

private:
    std::string output_;
    std::string title_;
    std::string markdown_file_;
};

}  // namespace tmd::cli
