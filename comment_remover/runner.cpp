#include "runner.hpp"

#include <chrono>       // For timing execution
#include <filesystem>
#include <string>
#include <system_error>

#include "run_report.hpp"
#include "traversal.hpp"

namespace comment_remover {

namespace fs = std::filesystem;

int run_remover(const RemoverArgs& args, Logger& logger) {
    auto start_time = std::chrono::steady_clock::now();

    fs::path input_fs_path(args.input_path);
    fs::path output_fs_path(args.output_dir);

    // Validate input before touching anything on disk
    std::error_code ec;
    if (!fs::exists(input_fs_path, ec)) {
        logger.error("Error: Path '" + args.input_path + "' does not exist.");
        return kExitFatal;
    }
    bool input_is_file = fs::is_regular_file(input_fs_path, ec);
    bool input_is_directory = !input_is_file && fs::is_directory(input_fs_path, ec);
    if (!input_is_file && !input_is_directory) {
        logger.error("Error: Invalid path type: " + args.input_path);
        return kExitFatal;
    }

    if (!args.output_dir.empty()) {
        if (fs::exists(output_fs_path, ec)) {
            if (!fs::is_directory(output_fs_path, ec)) {
                logger.error("Error: Output path '" + args.output_dir + "' exists and is not a directory.");
                return kExitFatal;
            }
        } else {
            fs::create_directories(output_fs_path, ec);
            if (ec) {
                logger.error("Error creating output directory " + args.output_dir + ": " + ec.message());
                return kExitFatal;
            }
            logger.info("Created output directory: " + args.output_dir);
        }
    }

    ProcessOptions options;
    options.filter = args.specific_string;
    options.encoding = args.encoding;

    RunStats stats;
    if (input_is_file) {
        process_file(input_fs_path, options, logger, stats, output_fs_path);
    } else {
        process_directory(input_fs_path, args.recursive, options, logger, stats, output_fs_path);
    }

    std::chrono::duration<double> elapsed_seconds = std::chrono::steady_clock::now() - start_time;
    log_run_summary(stats, elapsed_seconds.count(), logger);

    if (!args.report_path.empty()) {
        std::string report_error;
        if (write_run_report(args.report_path, run_report_json(stats, args, elapsed_seconds.count()), report_error)) {
            logger.info("Run report written to: " + args.report_path);
        } else {
            logger.error(report_error);
        }
    }

    return kExitOk; // Per-file failures are logged, they do not change the exit status
}

} // namespace comment_remover
