#include "traversal.hpp"

#include <algorithm>    // For std::sort
#include <array>
#include <cstdint>      // For std::uintmax_t
#include <exception>
#include <fstream>
#include <limits>       // For std::numeric_limits
#include <system_error>
#include <vector>

#include "comment_stripper.hpp"
#include "encoding.hpp"

namespace comment_remover {

namespace fs = std::filesystem;

namespace {

// Common HTML-like file extensions considered when walking a directory
const std::array<const char*, 7> kRecognizedExtensions = {
    ".html", ".htm", ".php", ".asp", ".aspx", ".jsp", ".tpl"
};

// Reads the whole file into a byte buffer.
bool read_file_bytes(const fs::path& input_file_path, std::string& file_content, std::string& error_message) {
    std::ifstream infile(input_file_path, std::ios::binary);
    if (!infile.is_open()) {
        error_message = "Could not open input file for reading";
        return false;
    }

    infile.seekg(0, std::ios::end);
    std::streampos end_pos = infile.tellg();
    infile.seekg(0, std::ios::beg);
    std::streampos beg_pos = infile.tellg();

    if (end_pos == static_cast<std::streampos>(-1) || beg_pos == static_cast<std::streampos>(-1)) {
        error_message = "Could not determine the size of the input file";
        return false;
    }
    if (end_pos <= beg_pos) {
        file_content.clear(); // Empty file
        return true;
    }

    std::uintmax_t file_size_uint = static_cast<std::uintmax_t>(end_pos - beg_pos);
    if (file_size_uint > std::numeric_limits<size_t>::max()) {
        error_message = "File is too large for an in-memory buffer (" + std::to_string(file_size_uint) + " bytes)";
        return false;
    }
    size_t file_size_for_buffer = static_cast<size_t>(file_size_uint);

    std::string buffer;
    buffer.resize(file_size_for_buffer);
    infile.read(&buffer[0], static_cast<std::streamsize>(file_size_for_buffer));
    if (static_cast<size_t>(infile.gcount()) != file_size_for_buffer) {
        error_message = "Read " + std::to_string(infile.gcount()) + " bytes, but expected " + std::to_string(file_size_for_buffer);
        return false;
    }
    file_content.swap(buffer);
    return true;
}

bool write_file_bytes(const fs::path& output_file_path, const std::string& file_content, std::string& error_message) {
    // Ensure output directory exists before opening the output file
    if (output_file_path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(output_file_path.parent_path(), ec);
        if (ec) {
            error_message = "Could not create output directory '" + output_file_path.parent_path().string() + "': " + ec.message();
            return false;
        }
    }

    std::ofstream outfile(output_file_path, std::ios::binary | std::ios::trunc);
    if (!outfile.is_open()) {
        error_message = "Could not open output file '" + output_file_path.string() + "' for writing";
        return false;
    }
    outfile.write(file_content.data(), static_cast<std::streamsize>(file_content.size()));
    outfile.close();
    if (!outfile) {
        error_message = "Failed while writing output file '" + output_file_path.string() + "'";
        return false;
    }
    return true;
}

FileOutcome process_file_unguarded(const fs::path& file_path, const ProcessOptions& options,
                                   Logger& logger, const fs::path& output_dir, FileRecord& file_record) {
    std::error_code ec;
    if (!fs::exists(file_path, ec)) {
        file_record.message = "File not found";
        logger.error("File not found: " + file_record.source);
        return FileOutcome::NotFound;
    }

    std::string raw_bytes;
    if (!read_file_bytes(file_path, raw_bytes, file_record.message)) {
        return FileOutcome::Failed;
    }

    // Determine encoding if not provided
    std::string encoding = options.encoding;
    if (encoding.empty()) {
        encoding = detect_encoding(raw_bytes);
        if (encoding.empty()) {
            logger.warning("Could not detect encoding for " + file_record.source + ". Defaulting to " + kDefaultEncoding + ".");
            encoding = kDefaultEncoding;
        } else {
            logger.info("Detected encoding: " + encoding + " for file " + file_record.source);
        }
    }
    file_record.encoding = encoding;

    std::string text;
    if (!decode_to_utf8(raw_bytes, encoding, text, file_record.message)) {
        return FileOutcome::Failed;
    }

    std::string sanitized_text = strip_html_comments(text, options.filter, logger, file_record.comments_removed);

    fs::path output_file_path = output_dir.empty() ? file_path : output_dir / file_path.filename();
    file_record.destination = output_file_path.string();

    std::string encoded_bytes;
    if (!encode_from_utf8(sanitized_text, encoding, encoded_bytes, file_record.message)) {
        return FileOutcome::Failed;
    }
    if (!write_file_bytes(output_file_path, encoded_bytes, file_record.message)) {
        return FileOutcome::Failed;
    }

    logger.info("Processed file: " + file_record.source);
    return FileOutcome::Processed;
}

void process_directory_level(const fs::path& current_dir, const fs::path& root_dir, bool recursive,
                             const ProcessOptions& options, Logger& logger, RunStats& stats,
                             const fs::path& output_dir) {
    // List the level first so a mirror created below it is not picked up by this walk
    std::vector<fs::path> files_in_level;
    std::vector<fs::path> subdirs_in_level;

    std::error_code ec;
    fs::directory_iterator dir_it(current_dir, ec);
    if (ec) {
        logger.error("Error processing directory " + current_dir.string() + ": " + ec.message());
        stats.directory_errors++;
        return;
    }
    while (dir_it != fs::directory_iterator()) {
        const fs::directory_entry& dir_entry = *dir_it;
        std::error_code type_ec;
        if (dir_entry.is_directory(type_ec)) {
            // Symbolic links to directories are listed but never descended into
            if (!dir_entry.is_symlink(type_ec)) subdirs_in_level.push_back(dir_entry.path());
        } else {
            files_in_level.push_back(dir_entry.path());
        }

        dir_it.increment(ec);
        if (ec) {
            logger.error("Error reading directory " + current_dir.string() + ": " + ec.message());
            stats.directory_errors++;
            break;
        }
    }
    std::sort(files_in_level.begin(), files_in_level.end());
    std::sort(subdirs_in_level.begin(), subdirs_in_level.end());

    fs::path output_subdir;
    if (!output_dir.empty()) {
        fs::path relative_path = current_dir.lexically_relative(root_dir);
        output_subdir = (relative_path.empty() || relative_path == ".") ? output_dir : output_dir / relative_path;
        fs::create_directories(output_subdir, ec);
        if (ec) {
            logger.error("Error creating output directory " + output_subdir.string() + ": " + ec.message());
            stats.directory_errors++;
            return;
        }
    }

    for (const fs::path& file_path : files_in_level) {
        if (is_recognized_extension(file_path.filename().string())) {
            process_file(file_path, options, logger, stats, output_subdir);
        }
    }

    if (!recursive) return; // Only process the top-level directory

    for (const fs::path& subdir_path : subdirs_in_level) {
        process_directory_level(subdir_path, root_dir, recursive, options, logger, stats, output_dir);
    }
}

} // namespace

bool is_recognized_extension(const std::string& filename) {
    for (const char* extension : kRecognizedExtensions) {
        std::string suffix(extension);
        if (filename.size() >= suffix.size() &&
            filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return true;
        }
    }
    return false;
}

FileOutcome process_file(const fs::path& file_path,
                         const ProcessOptions& options,
                         Logger& logger,
                         RunStats& stats,
                         const fs::path& output_dir) {
    FileRecord file_record;
    file_record.source = file_path.string();

    try {
        file_record.outcome = process_file_unguarded(file_path, options, logger, output_dir, file_record);
    } catch (const std::exception& e) {
        file_record.outcome = FileOutcome::Failed;
        file_record.message = e.what();
    }

    if (file_record.outcome == FileOutcome::Failed) {
        logger.error("Error processing file " + file_record.source + ": " + file_record.message);
    }
    stats.record(file_record);
    return file_record.outcome;
}

void process_directory(const fs::path& dir_path,
                       bool recursive,
                       const ProcessOptions& options,
                       Logger& logger,
                       RunStats& stats,
                       const fs::path& output_dir) {
    try {
        process_directory_level(dir_path, dir_path, recursive, options, logger, stats, output_dir);
    } catch (const std::exception& e) {
        logger.error("Error processing directory " + dir_path.string() + ": " + e.what());
        stats.directory_errors++;
    }
}

} // namespace comment_remover
