#pragma once

#include <vidstash/vidstash_export.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace vidstash {

using JobId = std::uint64_t;

enum class StreamKind { combined, video_only, audio_only };

// Normalized stream descriptor. Resolvers convert whatever their source
// returns into this shape before handing it to the pipeline.
struct VIDSTASH_EXPORT StreamDescriptor {
	StreamKind kind = StreamKind::combined;
	std::string format_id;
	std::string locator;  // URL the fetcher downloads
	std::string container;	// file extension, e.g. "mp4", "webm", "m4a"
	std::string vcodec;
	std::string acodec;
	int width = 0;
	int height = 0;
	double bitrate_kbps = 0.0;
	long long size_estimate = 0;  // bytes, 0 if unknown
	std::map<std::string, std::string> http_headers;
};

struct VIDSTASH_EXPORT MediaInfo {
	std::string id;
	std::string title;
	std::string publisher;
	std::string webpage_url;
	std::vector<StreamDescriptor> streams;
};

enum class JobState {
	queued,
	resolving,
	fetching,
	merging,
	organizing,
	done,
	failed
};

inline const char *to_string(JobState state) {
	switch (state) {
		case JobState::queued: return "queued";
		case JobState::resolving: return "resolving";
		case JobState::fetching: return "fetching";
		case JobState::merging: return "merging";
		case JobState::organizing: return "organizing";
		case JobState::done: return "done";
		case JobState::failed: return "failed";
	}
	return "unknown";
}

inline bool is_terminal(JobState state) {
	return state == JobState::done || state == JobState::failed;
}

struct VIDSTASH_EXPORT DownloadProgress {
	long long total_downloaded_bytes = 0;
	long long total_size_bytes = 0;
	double percentage = 0.0;
	double speed_bytes_per_sec = 0.0;
	double eta_seconds = 0.0;
};

// Called by fetchers with bytes written so far and the expected total
// (0 when the size is unknown).
using ProgressCallback = std::function<void(long long dl_now, long long dl_total)>;

// Sanitized placement target of a finished job.
struct VIDSTASH_EXPORT Destination {
	std::string publisher;
	std::string title;
	std::string ext;
};

struct VIDSTASH_EXPORT JobStatus {
	JobId id = 0;
	std::string source_url;
	JobState state = JobState::queued;
	std::string title;
	std::string publisher;
	std::optional<std::filesystem::path> final_path;
	std::error_code error;
	std::string detail;
	DownloadProgress progress;
};

using StatusCallback = std::function<void(const JobStatus &)>;

struct VIDSTASH_EXPORT PipelineStats {
	std::size_t submitted = 0;
	std::size_t succeeded = 0;
	std::size_t failed = 0;
	std::size_t active = 0;
};

struct VIDSTASH_EXPORT PipelineOptions {
	std::filesystem::path output_root = ".";
	// Parent of the per-job scratch directories. Empty selects
	// <system temp>/vidstash.
	std::filesystem::path temp_root;
	unsigned max_concurrent_jobs = 3;
	// Container for merged output; unset picks mp4 or mkv from the inputs.
	std::optional<std::string> merge_format;
	// Applies to the fetch pair and to the merge. Unset means no timeout.
	std::optional<std::chrono::milliseconds> stage_timeout;
	std::size_t max_component_length = 120;
	// Replace every non-ASCII byte in names with '_'.
	bool restrict_filenames = false;
	std::size_t history_limit = 256;
};

// Shared cancellation flag. Copies observe the same state.
class VIDSTASH_EXPORT CancellationToken {
   public:
	CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

	void request_cancel() const noexcept {
		flag_->store(true, std::memory_order_release);
	}

	[[nodiscard]] bool is_cancelled() const noexcept {
		return flag_->load(std::memory_order_acquire);
	}

   private:
	std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace vidstash
