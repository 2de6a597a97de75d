#ifndef COMMENT_REMOVER_CLI_ARGS_HPP
#define COMMENT_REMOVER_CLI_ARGS_HPP

#include <ostream>
#include <string>

namespace comment_remover {

// Structure to hold parsed command-line arguments
struct RemoverArgs {
    std::string input_path;          // File or directory to process
    bool recursive = false;
    std::string specific_string;     // Empty: remove every comment
    bool remove_all = false;         // Accepted for explicitness, same as the default
    std::string output_dir;          // Empty: overwrite files in place
    std::string encoding;            // Empty: auto-detect per file
    std::string report_path;         // Empty: no JSON report
    bool quiet = false;              // Only WARNING and ERROR lines
};

enum class ParseResult { Ok, HelpShown, Error };

void print_usage(std::ostream& out, const std::string& app_name);

// Parses argv into args. Help goes to out, diagnostics go to err.
ParseResult parse_remover_arguments(int argc, const char* const argv[], RemoverArgs& args,
                                    std::ostream& out, std::ostream& err);

} // namespace comment_remover

#endif // COMMENT_REMOVER_CLI_ARGS_HPP
