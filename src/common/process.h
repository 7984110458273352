#pragma once

#include <string>
#include <vector>

namespace Benchkit {

/**
 * Resolves a command name against $PATH. Names containing '/' are returned
 * unchanged when executable.
 * @return Absolute path, or empty string when nothing executable is found
 */
std::string FindExecutable(const std::string& command);

/**
 * Spawns argv[0] (resolved through FindExecutable) and waits for it.
 * @param argv Program and arguments
 * @param stderr_path When non-empty, child stderr is redirected into this file
 * @return Exit status of the child, 128+signo when it was killed by a signal,
 *         or -1 when it could not be started
 */
int SpawnAndWait(const std::vector<std::string>& argv, const std::string& stderr_path = "");

} // namespace Benchkit
