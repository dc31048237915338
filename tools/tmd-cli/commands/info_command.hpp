#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace tmd::cli {

/**
 * Print the manifest and the attachment table of a document.
 */
class InfoCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "info"; }
    std::string description() const override {
        return "Show document metadata and attachments";
    }

private:
    std::string file_;
};

}  // namespace tmd::cli
