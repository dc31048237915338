#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace tmd::cli {

/**
 * Decode a document and check every integrity invariant.
 */
class ValidateCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "validate"; }
    std::string description() const override {
        return "Validate a document";
    }

private:
    std::string file_;
    bool no_verify_ = false;
};

}  // namespace tmd::cli
