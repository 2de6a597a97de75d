#include "run_report.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>      // For std::fixed, std::setprecision
#include <sstream>

#include "cli_args.hpp"

namespace comment_remover {

const char* file_outcome_name(FileOutcome outcome) {
    switch (outcome) {
        case FileOutcome::Processed: return "processed";
        case FileOutcome::NotFound: return "not_found";
        case FileOutcome::Failed: return "failed";
    }
    return "unknown";
}

void RunStats::record(const FileRecord& file_record) {
    switch (file_record.outcome) {
        case FileOutcome::Processed:
            files_processed++;
            comments_removed += file_record.comments_removed;
            break;
        case FileOutcome::NotFound:
            files_not_found++;
            break;
        case FileOutcome::Failed:
            files_failed++;
            break;
    }
    files.push_back(file_record);
}

nlohmann::json run_report_json(const RunStats& stats, const RemoverArgs& args, double elapsed_seconds) {
    nlohmann::json report;

    report["input_path"] = args.input_path;
    report["recursive"] = args.recursive;
    report["filter"] = args.specific_string.empty() ? nlohmann::json(nullptr) : nlohmann::json(args.specific_string);
    report["output_dir"] = args.output_dir.empty() ? nlohmann::json(nullptr) : nlohmann::json(args.output_dir);
    report["forced_encoding"] = args.encoding.empty() ? nlohmann::json(nullptr) : nlohmann::json(args.encoding);

    report["files_processed"] = stats.files_processed;
    report["files_not_found"] = stats.files_not_found;
    report["files_failed"] = stats.files_failed;
    report["directory_errors"] = stats.directory_errors;
    report["comments_removed"] = stats.comments_removed;
    report["elapsed_seconds"] = elapsed_seconds;

    nlohmann::json files_json = nlohmann::json::array();
    for (const FileRecord& file_record : stats.files) {
        nlohmann::json file_info;
        file_info["source"] = file_record.source;
        file_info["destination"] = file_record.destination;
        file_info["encoding"] = file_record.encoding;
        file_info["comments_removed"] = file_record.comments_removed;
        file_info["status"] = file_outcome_name(file_record.outcome);
        if (!file_record.message.empty()) {
            file_info["error"] = file_record.message;
        }
        files_json.push_back(file_info);
    }
    report["files"] = files_json;
    return report;
}

bool write_run_report(const std::string& report_path, const nlohmann::json& report, std::string& error_message) {
    std::filesystem::path report_fs_path(report_path);
    if (report_fs_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(report_fs_path.parent_path(), ec);
        if (ec) {
            error_message = "Could not create directory for report '" + report_path + "': " + ec.message();
            return false;
        }
    }

    std::ofstream report_file(report_fs_path);
    if (!report_file.is_open()) {
        error_message = "Could not open report file '" + report_path + "' for writing.";
        return false;
    }
    report_file << report.dump(4) << std::endl;
    if (!report_file) {
        error_message = "Failed while writing report file '" + report_path + "'.";
        return false;
    }
    return true;
}

void log_run_summary(const RunStats& stats, double elapsed_seconds, Logger& logger) {
    std::ostringstream elapsed_ss;
    elapsed_ss << std::fixed << std::setprecision(3) << elapsed_seconds;

    if (stats.files.empty()) {
        logger.info("No files were processed.");
    } else {
        logger.info("Files processed: " + std::to_string(stats.files_processed) +
                    ", not found: " + std::to_string(stats.files_not_found) +
                    ", failed: " + std::to_string(stats.files_failed));
        logger.info("Total comments removed: " + std::to_string(stats.comments_removed));
    }
    if (stats.directory_errors > 0) {
        logger.warning("Directories that could not be read: " + std::to_string(stats.directory_errors));
    }
    logger.info("Processing finished in " + elapsed_ss.str() + " seconds.");
}

} // namespace comment_remover
