#include "query_command.hpp"

namespace tmd::cli {

void QueryCommand::setup(CLI::App& app) {
    app.add_option("file", file_, "Document (.tmd or .tmdz)")
        ->required()
        ->type_name("<file>");

    app.add_option("-s,--sql", sql_, "SQL statement")
        ->required()
        ->type_name("<sql>");
}

int QueryCommand::execute(CommandContext& /* ctx */) {
    auto loaded = load_document(file_);
    if (!loaded.ok()) {
        return report(loaded.error());
    }

    size_t rows = 0;
    auto queried = loaded.value().doc.db_with_read([&](Connection& conn) {
        return conn.query(sql_, [&rows](const Row& row) {
            // Column names once, before the first row
            if (rows == 0 && row.columns) {
                for (size_t i = 0; i < row.columns->size(); ++i) {
                    std::cout << (i > 0 ? "\t" : "") << (*row.columns)[i];
                }
                std::cout << "\n";
            }
            for (size_t i = 0; i < row.values.size(); ++i) {
                std::cout << (i > 0 ? "\t" : "") << row.values[i].value_or("NULL");
            }
            std::cout << "\n";
            ++rows;
        });
    });
    if (!queried.ok()) {
        return report(queried.error());
    }

    std::cerr << rows << " row(s)\n";
    return TMD_EXIT_SUCCESS;
}

}  // namespace tmd::cli
