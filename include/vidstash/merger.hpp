#pragma once

#include <vidstash/vidstash_export.h>

#include <filesystem>
#include <string>
#include <vidstash/result.hpp>
#include <vidstash/types.hpp>

namespace vidstash {

// Combines a video-only file and an audio-only file into one container.
class VIDSTASH_EXPORT Merger {
   public:
	virtual ~Merger() = default;

	/// Whether the underlying tool can be used. Implementations answer from
	/// a probe made once, not per call.
	[[nodiscard]] virtual bool available() const = 0;

	/// Fails with tool_missing, encode_error or cancelled. The output file
	/// does not exist after a failure.
	virtual Result<void> merge(const std::filesystem::path &video_path,
							   const std::filesystem::path &audio_path,
							   const std::filesystem::path &output_path,
							   const CancellationToken &cancel) = 0;
};

// Runs ffmpeg as a child process and stream-copies the first video and
// first audio track into the output container.
class VIDSTASH_EXPORT FfmpegMerger : public Merger {
   public:
	/// tool is either a bare name looked up on PATH or a path to the
	/// executable. Availability is probed here.
	explicit FfmpegMerger(std::string tool = "ffmpeg");

	[[nodiscard]] bool available() const override { return available_; }
	[[nodiscard]] const std::filesystem::path &tool_path() const {
		return tool_path_;
	}

	Result<void> merge(const std::filesystem::path &video_path,
					   const std::filesystem::path &audio_path,
					   const std::filesystem::path &output_path,
					   const CancellationToken &cancel) override;

   private:
	std::string tool_;
	std::filesystem::path tool_path_;
	bool available_ = false;
};

}  // namespace vidstash
