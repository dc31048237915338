#include "validate_command.hpp"

namespace tmd::cli {

void ValidateCommand::setup(CLI::App& app) {
    app.add_option("file", file_, "Document (.tmd or .tmdz)")
        ->required()
        ->type_name("<file>");

    app.add_flag("--no-verify", no_verify_, "Skip SHA-256 verification of attachments");
}

int ValidateCommand::execute(CommandContext& ctx) {
    auto loaded = load_document(file_, !no_verify_);
    if (!loaded.ok()) {
        return report(loaded.error());
    }

    auto valid = loaded.value().doc.validate();
    if (!valid.ok()) {
        return report(valid.error());
    }

    if (ctx.verbose) {
        std::cout << loaded.value().doc.list_attachments().size() << " attachment(s) verified\n";
    }
    std::cout << "OK: " << file_ << "\n";
    return TMD_EXIT_SUCCESS;
}

}  // namespace tmd::cli
