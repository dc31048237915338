#include "db_import_command.hpp"

namespace tmd::cli {

void DbImportCommand::setup(CLI::App& app) {
    app.add_option("file", file_, "Document (.tmd or .tmdz)")
        ->required()
        ->type_name("<file>");

    app.add_option("input", input_, "SQLite file to import")
        ->required()
        ->check(CLI::ExistingFile)
        ->type_name("<file>");
}

int DbImportCommand::execute(CommandContext& /* ctx */) {
    auto loaded = load_document(file_);
    if (!loaded.ok()) {
        return report(loaded.error());
    }
    Document& doc = loaded.value().doc;

    auto imported = doc.db_import(input_);
    if (!imported.ok()) {
        return report(imported.error());
    }

    auto saved = save_document(loaded.value(), file_);
    if (!saved.ok()) {
        return report(saved.error());
    }

    std::cout << "Imported " << input_ << " (user_version "
              << doc.manifest().db_schema_version.value_or(0) << ")\n";
    return TMD_EXIT_SUCCESS;
}

}  // namespace tmd::cli
