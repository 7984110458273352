#pragma once

#include <optional>
#include <string>
#include <vector>

namespace Benchkit {

/**
 * Arguments of one session as given on the command line.
 */
struct RunRequest {
    std::vector<std::string> testplans;
    std::string environment;
    // Empty selects a randomized directory under the configured output root.
    std::string output_dir;
    std::optional<std::string> filter;
    int verbosity = 0;
};

/**
 * A request whose paths have all been checked.
 */
struct RunConfig {
    std::vector<std::string> testplans;
    std::string environment;
    std::string output_dir;
    std::optional<std::string> filter;
    int verbosity = 0;
};

/**
 * Picks <output_root>/benchkit-<random> that does not exist yet.
 */
std::string RandomOutputDir(const std::string& output_root);

/**
 * Validates a request before any lock is taken: every testplan exists, the
 * environment definition exists, and the output directory exists or can be
 * created (parents included). The output directory is the only thing this
 * may create.
 *
 * @throws ConfigError naming the first invalid path
 */
RunConfig ResolveRunConfig(const RunRequest& request, const std::string& output_root);

} // namespace Benchkit
