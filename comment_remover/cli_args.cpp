#include "cli_args.hpp"

namespace comment_remover {

void print_usage(std::ostream& out, const std::string& app_name) {
    out << "HTML Comment Remover Usage:" << std::endl;
    out << "  " << app_name << " <path> [options]" << std::endl;
    out << "  <path>                   (Required) File or directory to process." << std::endl;
    out << "  -r, --recursive          (Optional) Process directories recursively." << std::endl;
    out << "  -s, --specific <str>     (Optional) Remove only comments containing this string (case-sensitive)." << std::endl;
    out << "  -a, --all                (Optional) Remove all HTML comments (default)." << std::endl;
    out << "  -o, --output <dir>       (Optional) Output directory. If not specified, files are overwritten in place." << std::endl;
    out << "  -e, --encoding <name>    (Optional) Encoding of the input files (e.g. utf-8, latin-1). Default: auto-detect." << std::endl;
    out << "  --report <file>          (Optional) Write a JSON summary of the run to this file." << std::endl;
    out << "  -q, --quiet              (Optional) Only log warnings and errors." << std::endl;
    out << "  -h, --help               Show this help message." << std::endl;
    out << "Directories are scanned for: .html .htm .php .asp .aspx .jsp .tpl" << std::endl;
}

ParseResult parse_remover_arguments(int argc, const char* const argv[], RemoverArgs& args,
                                    std::ostream& out, std::ostream& err) {
    const std::string app_name = (argc > 0 && argv[0] != nullptr) ? argv[0] : "html_comment_remover";
    bool have_path = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string inline_value;
        bool has_inline_value = false;

        // Accept "--option=value" as well as "--option value"
        if (arg.rfind("--", 0) == 0) {
            std::string::size_type eq_pos = arg.find('=');
            if (eq_pos != std::string::npos) {
                inline_value = arg.substr(eq_pos + 1);
                arg = arg.substr(0, eq_pos);
                has_inline_value = true;
            }
        }

        auto take_value = [&](std::string& target) -> bool {
            if (has_inline_value) {
                target = inline_value;
                return true;
            }
            if (i + 1 < argc) {
                target = argv[++i];
                return true;
            }
            err << "Error: Missing value for argument: " << arg << std::endl;
            return false;
        };

        if (arg == "--help" || arg == "-h") {
            print_usage(out, app_name);
            return ParseResult::HelpShown;
        } else if (arg == "--recursive" || arg == "-r") {
            args.recursive = true;
        } else if (arg == "--all" || arg == "-a") {
            args.remove_all = true;
        } else if (arg == "--quiet" || arg == "-q") {
            args.quiet = true;
        } else if (arg == "--specific" || arg == "-s") {
            if (!take_value(args.specific_string)) return ParseResult::Error;
        } else if (arg == "--output" || arg == "-o") {
            if (!take_value(args.output_dir)) return ParseResult::Error;
        } else if (arg == "--encoding" || arg == "-e") {
            if (!take_value(args.encoding)) return ParseResult::Error;
        } else if (arg == "--report") {
            if (!take_value(args.report_path)) return ParseResult::Error;
        } else if (arg.size() > 1 && arg[0] == '-') {
            err << "Error: Unknown argument: " << arg << std::endl;
            err << "Use -h or --help for usage information." << std::endl;
            return ParseResult::Error;
        } else if (!have_path) {
            args.input_path = arg;
            have_path = true;
        } else {
            err << "Error: Unexpected extra path argument: " << arg << std::endl;
            return ParseResult::Error;
        }

        if (has_inline_value && (arg == "--recursive" || arg == "--all" || arg == "--quiet")) {
            err << "Error: Argument " << arg << " does not take a value." << std::endl;
            return ParseResult::Error;
        }
    }

    // Validate required arguments
    if (!have_path || args.input_path.empty()) {
        err << "Error: the <path> argument is required." << std::endl;
        err << "Use -h or --help for usage information." << std::endl;
        return ParseResult::Error;
    }
    if (!args.encoding.empty() && args.encoding.find_first_not_of(" \t") == std::string::npos) {
        err << "Error: --encoding needs a non-blank encoding name." << std::endl;
        return ParseResult::Error;
    }
    return ParseResult::Ok;
}

} // namespace comment_remover
