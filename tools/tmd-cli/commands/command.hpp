#pragma once

#include "exit_codes.hpp"

#include <tmd/tmd.hpp>
#include <tmd/util/file_io.hpp>
#include <CLI/CLI.hpp>

#include <filesystem>
#include <iostream>
#include <string>

namespace tmd::cli {

/**
 * Context passed to command execution.
 */
struct CommandContext {
    bool verbose = false;
};

/**
 * Base class for CLI commands.
 *
 * Each command implements:
 * - setup(): Configure CLI11 options and flags
 * - execute(): Perform the command action
 */
class Command {
public:
    virtual ~Command() = default;

    /**
     * Configure command options with CLI11.
     * Called during CLI initialization.
     *
     * @param app The CLI11 subcommand to configure
     */
    virtual void setup(CLI::App& app) = 0;

    /**
     * Execute the command.
     * Called after argument parsing succeeds.
     *
     * @param ctx Execution context
     * @return Exit code (0 = success)
     */
    virtual int execute(CommandContext& ctx) = 0;

    /**
     * Get the command name (e.g., "new", "pack").
     */
    virtual std::string name() const = 0;

    /**
     * Get a brief description for help text.
     */
    virtual std::string description() const = 0;
};

// Helper functions used by multiple commands

/**
 * Print an error to stderr and map it to an exit code.
 */
inline int report(const Error& error) {
    std::cerr << "Error: " << error.to_string() << "\n";
    return exit_code_for(error);
}

/**
 * A document together with the format it was read in, so commands that
 * modify a file can write it back the same way.
 */
struct LoadedDocument {
    Document doc;
    Format format;
};

/**
 * Read a container file. The extension decides the format when it is
 * .tmd or .tmdz; otherwise the content is sniffed.
 */
inline Result<LoadedDocument> load_document(const std::filesystem::path& path, bool verify = true) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error(ErrorCode::NOT_FOUND, "no such file: " + path.string());
    }

    auto bytes = read_file(path);
    if (!bytes.ok()) {
        return bytes.error();
    }

    auto format = format_from_extension(path);
    if (!format) {
        format = sniff_format(bytes.value());
    }
    if (!format) {
        return Error(ErrorCode::INVALID_FORMAT, path.string() + " is empty");
    }

    ReadMode mode;
    mode.verify_hashes = verify;
    auto doc = read_document(bytes.value(), format, mode);
    if (!doc.ok()) {
        return doc.error().with_context(path.string());
    }
    return LoadedDocument{std::move(doc.value()), *format};
}

/**
 * Write a document back in its original format.
 */
inline Result<void> save_document(const LoadedDocument& loaded, const std::filesystem::path& path) {
    return write_to_path(loaded.doc, path, loaded.format);
}

}  // namespace tmd::cli
