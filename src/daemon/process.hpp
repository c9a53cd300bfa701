#pragma once

#include <cstddef>
#include <expected>
#include <functional>
#include <string>
#include <vector>

struct ProcessResult {
    int exit_code = -1;
    std::string out;
    std::string err;
};

namespace process {

// Runs argv[0] (looked up in PATH) with the given arguments and collects
// stdout and stderr. Fails only if the process could not be started or was
// killed by a signal; a non-zero exit code is reported in the result.
std::expected<ProcessResult, std::string> run(const std::vector<std::string>& argv);

using OutputSink = std::function<void(const char* data, size_t size)>;

// Same as run(argv), but stdout is handed to on_stdout as it arrives and
// ProcessResult::out stays empty.
std::expected<ProcessResult, std::string> run(const std::vector<std::string>& argv,
                                              const OutputSink& on_stdout);

} // namespace process
