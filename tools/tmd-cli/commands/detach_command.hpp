#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace tmd::cli {

/**
 * Remove an attachment by logical path.
 */
class DetachCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "detach"; }
    std::string description() const override {
        return "Remove an attachment";
    }

private:
    std::string file_;
    std::string logical_path_;
};

}  // namespace tmd::cli
