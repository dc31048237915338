#include "pack_command.hpp"
#include "../workspace.hpp"

namespace tmd::cli {

void PackCommand::setup(CLI::App& app) {
    app.add_option("directory", directory_, "Unpacked workspace directory")
        ->required()
        ->type_name("<dir>");

    app.add_option("output", output_, "Output file (.tmd or .tmdz)")
        ->required()
        ->type_name("<file>");
}

int PackCommand::execute(CommandContext& /* ctx */) {
    if (!format_from_extension(output_)) {
        std::cerr << "Error: output must end in .tmd or .tmdz\n";
        return TMD_EXIT_USER_ERROR;
    }

    auto doc = read_workspace(directory_);
    if (!doc.ok()) {
        return report(doc.error());
    }

    auto written = write_to_path(doc.value(), output_);
    if (!written.ok()) {
        return report(written.error());
    }

    std::cout << "Packed " << directory_ << " -> " << output_ << "\n";
    return TMD_EXIT_SUCCESS;
}

}  // namespace tmd::cli
