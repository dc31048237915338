#include "attach_command.hpp"

#include <tmd/util/file_io.hpp>

namespace tmd::cli {

void AttachCommand::setup(CLI::App& app) {
    app.add_option("file", file_, "Document (.tmd or .tmdz)")
        ->required()
        ->type_name("<file>");

    app.add_option("source", source_, "File to attach")
        ->required()
        ->check(CLI::ExistingFile)
        ->type_name("<file>");

    app.add_option("--as", logical_path_, "Logical path (default: source file name)")
        ->type_name("<path>");
    app.add_option("--mime", mime_, "Media type")
        ->type_name("<type>");
    app.add_option("--title", title_, "Display title");
    app.add_option("--alt", alt_, "Alternative text");
}

int AttachCommand::execute(CommandContext& /* ctx */) {
    auto loaded = load_document(file_);
    if (!loaded.ok()) {
        return report(loaded.error());
    }
    Document& doc = loaded.value().doc;

    auto data = read_file(source_);
    if (!data.ok()) {
        return report(data.error());
    }

    std::string path = logical_path_.empty()
        ? std::filesystem::path(source_).filename().string()
        : logical_path_;

    auto id = doc.add_attachment(path, mime_, std::move(data.value()));
    if (!id.ok()) {
        return report(id.error());
    }
    if (!title_.empty()) {
        auto titled = doc.set_attachment_title(id.value(), title_);
        if (!titled.ok()) {
            return report(titled.error());
        }
    }
    if (!alt_.empty()) {
        auto alted = doc.set_attachment_alt(id.value(), alt_);
        if (!alted.ok()) {
            return report(alted.error());
        }
    }

    auto saved = save_document(loaded.value(), file_);
    if (!saved.ok()) {
        return report(saved.error());
    }

    const AttachmentMeta* meta = doc.attachment(id.value());
    std::cout << "Attached " << meta->logical_path << " (" << meta->length << " bytes, "
              << id.value().to_string() << ")\n";
    return TMD_EXIT_SUCCESS;
}

}  // namespace tmd::cli
