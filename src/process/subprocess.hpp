#pragma once

#include <vidstash/vidstash_export.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include <vidstash/result.hpp>
#include <vidstash/types.hpp>

namespace vidstash::process {

struct VIDSTASH_EXPORT ProcessResult {
	int exit_code = -1;
	std::string output;		 // stdout, when captured
	std::string error_tail;	 // last bytes written to stderr
};

struct VIDSTASH_EXPORT RunOptions {
	bool capture_stdout = false;
	// Polled while the child runs; a cancelled token kills the child.
	const CancellationToken *cancel = nullptr;
	std::size_t stderr_tail_bytes = 4096;
};

/// Resolve a tool given as a bare name (searched on PATH) or as a path.
/// Returns an empty path when it is missing or not executable.
VIDSTASH_EXPORT std::filesystem::path find_executable(const std::string &tool);

/// Run exe with args and wait for it. Fails with tool_missing when the
/// process cannot be started and with cancelled when the token fired. A
/// non-zero exit status is not a failure here; callers inspect exit_code.
VIDSTASH_EXPORT Result<ProcessResult> run(
	const std::filesystem::path &exe, const std::vector<std::string> &args,
	const RunOptions &options = {});

}  // namespace vidstash::process
