#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace tmd::cli {

/**
 * Unpack a document into a directory, or convert it to the other container format.
 */
class UnpackCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "unpack"; }
    std::string description() const override {
        return "Unpack a document or convert between formats";
    }

private:
    std::string input_;
    std::string output_;
};

}  // namespace tmd::cli
