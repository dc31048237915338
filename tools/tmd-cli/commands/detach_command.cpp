#include "detach_command.hpp"

namespace tmd::cli {

void DetachCommand::setup(CLI::App& app) {
    app.add_option("file", file_, "Document (.tmd or .tmdz)")
        ->required()
        ->type_name("<file>");

    app.add_option("path", logical_path_, "Logical path of the attachment")
        ->required()
        ->type_name("<path>");
}

int DetachCommand::execute(CommandContext& /* ctx */) {
    auto loaded = load_document(file_);
    if (!loaded.ok()) {
        return report(loaded.error());
    }
    Document& doc = loaded.value().doc;

    const AttachmentMeta* meta = doc.attachment_by_path(logical_path_);
    if (!meta) {
        std::cerr << "Error: Attachment not found: " << logical_path_ << "\n";
        return TMD_EXIT_NOT_FOUND;
    }
    std::string removed_path = meta->logical_path;
    AttachmentId id = meta->id;

    auto removed = doc.remove_attachment(id);
    if (!removed.ok()) {
        return report(removed.error());
    }

    auto saved = save_document(loaded.value(), file_);
    if (!saved.ok()) {
        return report(saved.error());
    }

    std::cout << "Removed " << removed_path << "\n";
    return TMD_EXIT_SUCCESS;
}

}  // namespace tmd::cli
