#include "info_command.hpp"

#include <tmd/util/encoding.hpp>
#include <iomanip>

namespace tmd::cli {

namespace {

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    return out;
}

}  // namespace

void InfoCommand::setup(CLI::App& app) {
    app.add_option("file", file_, "Document (.tmd or .tmdz)")
        ->required()
        ->type_name("<file>");
}

int InfoCommand::execute(CommandContext& /* ctx */) {
    auto loaded = load_document(file_);
    if (!loaded.ok()) {
        return report(loaded.error());
    }
    const Document& doc = loaded.value().doc;
    const Manifest& m = doc.manifest();

    auto user_version = doc.db_schema_version();
    if (!user_version.ok()) {
        return report(user_version.error());
    }

    std::cout << "Format:        " << format_name(loaded.value().format) << "\n";
    std::cout << "Version:       " << m.tmd_version.to_string() << "\n";
    std::cout << "Document ID:   " << m.doc_id.to_string() << "\n";
    std::cout << "Title:         " << m.title.value_or("(untitled)") << "\n";
    if (!m.authors.empty()) {
        std::cout << "Authors:       " << join(m.authors) << "\n";
    }
    if (!m.tags.empty()) {
        std::cout << "Tags:          " << join(m.tags) << "\n";
    }
    std::cout << "Created:       " << format_rfc3339(m.created_utc) << "\n";
    std::cout << "Modified:      " << format_rfc3339(m.modified_utc) << "\n";
    std::cout << "Markdown:      " << doc.markdown().size() << " bytes\n";
    std::cout << "DB version:    " << user_version.value() << "\n";
    for (const auto& link : m.links) {
        std::cout << "Link:          " << link.rel << " -> " << link.href << "\n";
    }

    auto attachments = doc.list_attachments();
    if (attachments.empty()) {
        std::cout << "\nNo attachments.\n";
        return TMD_EXIT_SUCCESS;
    }

    // Print header
    std::cout << "\n" << std::left
              << std::setw(36) << "PATH"
              << std::setw(26) << "MIME"
              << std::setw(12) << "SIZE"
              << "SHA256\n";
    std::cout << std::string(90, '-') << "\n";

    for (const auto& a : attachments) {
        std::string path = a.logical_path;
        if (m.cover_image == a.id) path += " *";
        std::cout << std::left
                  << std::setw(36) << path
                  << std::setw(26) << a.mime
                  << std::setw(12) << a.length
                  << hex_encode(a.sha256).substr(0, 16) << "\n";
    }

    std::cout << "\n" << attachments.size() << " attachment(s)\n";
    return TMD_EXIT_SUCCESS;
}

}  // namespace tmd::cli
