#ifndef COMMENT_REMOVER_TRAVERSAL_HPP
#define COMMENT_REMOVER_TRAVERSAL_HPP

#include <filesystem>
#include <string>

#include "logger.hpp"
#include "run_report.hpp"

namespace comment_remover {

// Per-run settings shared by every processed file.
struct ProcessOptions {
    std::string filter;    // Only remove comments containing this; empty removes all
    std::string encoding;  // Forced encoding; empty means detect per file
};

// True if the filename ends with one of the HTML-like extensions
// (.html .htm .php .asp .aspx .jsp .tpl). Case-sensitive.
bool is_recognized_extension(const std::string& filename);

// Strips comments from one file. Writes next to itself (in place) when output_dir
// is empty, otherwise to output_dir/<filename>. Never throws: failures are logged,
// recorded in stats and reported through the returned outcome.
FileOutcome process_file(const std::filesystem::path& file_path,
                         const ProcessOptions& options,
                         Logger& logger,
                         RunStats& stats,
                         const std::filesystem::path& output_dir = {});

// Walks a directory top-down, processing files with a recognized extension.
// With an output_dir, each visited level is mirrored below it before its files
// are written. Without recursive only the top level is processed.
// Directory read errors are logged and the walk carries on with siblings.
void process_directory(const std::filesystem::path& dir_path,
                       bool recursive,
                       const ProcessOptions& options,
                       Logger& logger,
                       RunStats& stats,
                       const std::filesystem::path& output_dir = {});

} // namespace comment_remover

#endif // COMMENT_REMOVER_TRAVERSAL_HPP
