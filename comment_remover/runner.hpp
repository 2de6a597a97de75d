#ifndef COMMENT_REMOVER_RUNNER_HPP
#define COMMENT_REMOVER_RUNNER_HPP

#include "cli_args.hpp"
#include "logger.hpp"

namespace comment_remover {

// Exit status of a run
constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;

// Validates the input and output paths, processes the file or directory and
// writes the optional report. Returns kExitFatal when the input path is missing,
// is neither a regular file nor a directory, or the output directory cannot be
// created; nothing is written in those cases. Per-file failures are logged only.
int run_remover(const RemoverArgs& args, Logger& logger);

} // namespace comment_remover

#endif // COMMENT_REMOVER_RUNNER_HPP
