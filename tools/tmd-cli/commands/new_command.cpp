#include "new_command.hpp"

#include <tmd/util/file_io.hpp>

namespace tmd::cli {

void NewCommand::setup(CLI::App& app) {
    app.add_option("output", output_, "Output file (.tmd or .tmdz)")
        ->required()
        ->type_name("<file>");

    app.add_option("-t,--title", title_, "Document title");
    app.add_option("-m,--markdown", markdown_file_, "Initial Markdown body")
        ->check(CLI::ExistingFile)
        ->type_name("<file>");
}

int NewCommand::execute(CommandContext& /* ctx */) {
    if (!format_from_extension(output_)) {
        std::cerr << "Error: output must end in .tmd or .tmdz\n";
        return TMD_EXIT_USER_ERROR;
    }

    std::string markdown;
    if (!markdown_file_.empty()) {
        auto bytes = read_file(markdown_file_);
        if (!bytes.ok()) {
            return report(bytes.error());
        }
        markdown.assign(bytes.value().begin(), bytes.value().end());
    }

    auto doc = Document::create(std::move(markdown));
    if (!doc.ok()) {
        return report(doc.error());
    }
    if (!title_.empty()) {
        auto titled = doc.value().set_title(title_);
        if (!titled.ok()) {
            return report(titled.error());
        }
    }

    auto written = write_to_path(doc.value(), output_);
    if (!written.ok()) {
        return report(written.error());
    }

    std::cout << "Created " << output_ << " (" << doc.value().manifest().doc_id.to_string() << ")\n";
    return TMD_EXIT_SUCCESS;
}

}  // namespace tmd::cli
