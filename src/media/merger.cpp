#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <utility>
#include <vidstash/merger.hpp>
#include <vidstash/temp_file.hpp>

#include "process/subprocess.hpp"

namespace fs = std::filesystem;

namespace vidstash {

namespace {

bool wants_faststart(const fs::path &output_path) {
	auto ext = output_path.extension().string();
	std::transform(ext.begin(), ext.end(), ext.begin(),
				   [](unsigned char c) { return std::tolower(c); });
	return ext == ".mp4" || ext == ".mov" || ext == ".m4a";
}

}  // namespace

FfmpegMerger::FfmpegMerger(std::string tool) : tool_(std::move(tool)) {
	tool_path_ = process::find_executable(tool_);
	if (tool_path_.empty()) {
		spdlog::warn("Multiplexing tool '{}' not found", tool_);
		return;
	}

	auto probe = process::run(tool_path_, {"-hide_banner", "-version"});
	if (probe.has_error()) {
		spdlog::warn("Multiplexing tool '{}' could not be started",
					 tool_path_.string());
		return;
	}
	if (probe.value().exit_code != 0) {
		spdlog::warn("Multiplexing tool '{}' failed its probe (status {})",
					 tool_path_.string(), probe.value().exit_code);
		return;
	}

	spdlog::debug("Using multiplexing tool {}", tool_path_.string());
	available_ = true;
}

Result<void> FfmpegMerger::merge(const fs::path &video_path,
								 const fs::path &audio_path,
								 const fs::path &output_path,
								 const CancellationToken &cancel) {
	if (!available_) return outcome::failure(errc::tool_missing);

	std::vector<std::string> args = {
		"-y",	   "-nostdin", "-hide_banner",		 "-loglevel",
		"error",   "-i",	   video_path.string(), "-i",
		audio_path.string(),   "-map",				 "0:v:0",
		"-map",	   "1:a:0",	   "-c",				 "copy"};
	if (wants_faststart(output_path)) {
		args.emplace_back("-movflags");
		args.emplace_back("+faststart");
	}
	args.push_back(output_path.string());

	spdlog::debug("ffmpeg command line: {} {}", tool_path_.string(),
				  fmt::join(args, " "));

	// Removes a partial output on every failure path.
	TempFile output_guard(output_path);

	process::RunOptions options;
	options.cancel = &cancel;
	auto res = process::run(tool_path_, args, options);
	if (res.has_error()) return outcome::failure(res.error());

	const auto &proc = res.value();
	if (proc.exit_code != 0) {
		spdlog::error("ffmpeg exited with status {}: {}", proc.exit_code,
					  proc.error_tail.empty() ? "(no output)" : proc.error_tail);
		return outcome::failure(errc::encode_error);
	}

	std::error_code ec;
	if (!fs::exists(output_path, ec)) {
		spdlog::error("ffmpeg reported success but wrote no output to {}",
					  output_path.string());
		return outcome::failure(errc::encode_error);
	}

	output_guard.release();
	spdlog::info("Muxing complete: {}", output_path.string());
	return outcome::success();
}

}  // namespace vidstash
