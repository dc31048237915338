#include "db_export_command.hpp"

namespace tmd::cli {

void DbExportCommand::setup(CLI::App& app) {
    app.add_option("file", file_, "Document (.tmd or .tmdz)")
        ->required()
        ->type_name("<file>");

    app.add_option("output", output_, "Destination SQLite file")
        ->required()
        ->type_name("<file>");
}

int DbExportCommand::execute(CommandContext& /* ctx */) {
    auto loaded = load_document(file_);
    if (!loaded.ok()) {
        return report(loaded.error());
    }

    auto exported = loaded.value().doc.db_export(output_);
    if (!exported.ok()) {
        return report(exported.error());
    }

    std::cout << "Exported database to " << output_ << "\n";
    return TMD_EXIT_SUCCESS;
}

}  // namespace tmd::cli
