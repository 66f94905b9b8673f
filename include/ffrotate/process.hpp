/**
 * @file process.hpp
 * @brief Child process execution with diagnostic capture
 *
 * @details Runs an external program from an argv vector (no shell, so paths
 *          with spaces or quotes need no escaping), blocks until it exits and
 *          returns its exit status together with everything it wrote to
 *          stderr. stdin and stdout are attached to /dev/null.
 */

#ifndef FFROTATE_PROCESS_HPP
#define FFROTATE_PROCESS_HPP

#include <string>
#include <vector>

namespace ffrotate {

/**
 * @struct ProcessResult
 * @brief Exit status and diagnostic stream of one child process.
 */
struct ProcessResult {
  bool spawned = false;    //< fork() succeeded
  int exit_status = -1;    //< Exit code; 128 + signal when killed
  std::string diagnostics; //< Captured stderr

  bool succeeded() const { return spawned && exit_status == 0; }
};

/**
 * @brief Run a program to completion.
 *
 * @param argv Program path followed by its arguments
 * @return Exit status and captured stderr
 * @note Never throws for a failing child; a program that cannot be executed
 *       reports exit status 127 with the exec error in diagnostics.
 */
ProcessResult run_process(const std::vector<std::string> &argv);

/// Render argv as a single line for logging
std::string format_command(const std::vector<std::string> &argv);

} // namespace ffrotate

#endif // FFROTATE_PROCESS_HPP
