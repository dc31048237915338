#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace tmd::cli {

/**
 * Build a container from an unpacked workspace directory.
 */
class PackCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "pack"; }
    std::string description() const override {
        return "Pack a workspace directory into .tmd/.tmdz";
    }

private:
    std::string directory_;
    std::string output_;
};

}  // namespace tmd::cli
