#ifndef COMMENT_REMOVER_RUN_REPORT_HPP
#define COMMENT_REMOVER_RUN_REPORT_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "logger.hpp"

namespace comment_remover {

struct RemoverArgs;

enum class FileOutcome { Processed, NotFound, Failed };

const char* file_outcome_name(FileOutcome outcome);

// What happened to one input file.
struct FileRecord {
    std::string source;
    std::string destination;  // Empty if the file never got that far
    std::string encoding;     // Encoding used to decode/encode, empty if unresolved
    long long comments_removed = 0;
    FileOutcome outcome = FileOutcome::Failed;
    std::string message;      // Error detail for NotFound/Failed
};

// Statistics for a whole run, filled in by the traversal functions.
struct RunStats {
    long long files_processed = 0;
    long long files_not_found = 0;
    long long files_failed = 0;
    long long comments_removed = 0;
    long long directory_errors = 0;
    std::vector<FileRecord> files;

    void record(const FileRecord& file_record);
};

nlohmann::json run_report_json(const RunStats& stats, const RemoverArgs& args, double elapsed_seconds);

// Writes the report indented by 4 spaces. Returns false with error_message set on I/O failure.
bool write_run_report(const std::string& report_path, const nlohmann::json& report, std::string& error_message);

void log_run_summary(const RunStats& stats, double elapsed_seconds, Logger& logger);

} // namespace comment_remover

#endif // COMMENT_REMOVER_RUN_REPORT_HPP
