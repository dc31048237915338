#include "unpack_command.hpp"
#include "../workspace.hpp"

namespace tmd::cli {

void UnpackCommand::setup(CLI::App& app) {
    app.add_option("input", input_, "Document (.tmd or .tmdz)")
        ->required()
        ->type_name("<file>");

    app.add_option("output", output_, "Directory, or a .tmd/.tmdz file to convert to")
        ->required()
        ->type_name("<dir|file>");
}

int UnpackCommand::execute(CommandContext& /* ctx */) {
    auto loaded = load_document(input_);
    if (!loaded.ok()) {
        return report(loaded.error());
    }

    auto target = format_from_extension(output_);
    if (target) {
        auto written = write_to_path(loaded.value().doc, output_, target);
        if (!written.ok()) {
            return report(written.error());
        }
        std::cout << "Converted " << input_ << " -> " << output_ << "\n";
        return TMD_EXIT_SUCCESS;
    }

    auto unpacked = write_workspace(loaded.value().doc, output_);
    if (!unpacked.ok()) {
        return report(unpacked.error());
    }
    std::cout << "Unpacked " << input_ << " -> " << output_ << "/\n";
    return TMD_EXIT_SUCCESS;
}

}  // namespace tmd::cli
