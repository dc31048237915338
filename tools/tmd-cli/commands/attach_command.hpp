#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace tmd::cli {

/**
 * Add a file as an attachment.
 */
class AttachCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "attach"; }
    std::string description() const override {
        return "Add an attachment";
    }

private:
    std::string file_;
    std::string source_;
    std::string logical_path_;
    std::string mime_ = "application/octet-stream";
    std::string title_;
    std::string alt_;
};

}  // namespace tmd::cli
