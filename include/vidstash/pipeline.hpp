#pragma once

#include <vidstash/vidstash_export.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <vidstash/fetcher.hpp>
#include <vidstash/merger.hpp>
#include <vidstash/resolver.hpp>
#include <vidstash/result.hpp>
#include <vidstash/types.hpp>

namespace vidstash {

// Accepts URLs at any time and runs each one through
// resolve -> fetch -> merge -> organize on a bounded worker pool.
class VIDSTASH_EXPORT Pipeline {
   public:
	Pipeline(const Pipeline &) = delete;
	Pipeline &operator=(const Pipeline &) = delete;
	~Pipeline();

	/// The collaborators must be safe to call from several workers at
	/// once. on_status is invoked from worker threads on every transition.
	Pipeline(std::shared_ptr<StreamResolver> resolver,
			 std::shared_ptr<Fetcher> fetcher,
			 std::shared_ptr<Merger> merger, PipelineOptions options,
			 StatusCallback on_status = {});

	struct StreamSelection {
		const StreamDescriptor *combined{};
		const StreamDescriptor *video{};
		const StreamDescriptor *audio{};

		[[nodiscard]] bool needs_merge() const { return video && audio; }
	};

	/// Best combined stream, else best video-only plus best audio-only.
	/// Fails with no_suitable_stream when neither is possible.
	[[nodiscard]] static Result<StreamSelection> select_streams(
		const MediaInfo &info);

	/// Cheap local check run by submit(): http(s) scheme, a host, no
	/// whitespace.
	static Result<void> validate_url(std::string_view url);

	/// Container for a merged job.
	[[nodiscard]] static std::string merge_container(
		const StreamDescriptor &video, const StreamDescriptor &audio,
		const std::optional<std::string> &configured);

	/// Never blocks. Invalid input is recorded as failed right away.
	JobId submit(std::string_view url);

	/// Active jobs in submission order, then retained finished ones.
	[[nodiscard]] std::vector<JobStatus> jobs() const;
	[[nodiscard]] std::optional<JobStatus> status(JobId id) const;

	/// False when the job is unknown or already finished.
	bool cancel(JobId id);
	void cancel_all();

	/// Block until every submitted job has finished and reported.
	void wait_idle();

	[[nodiscard]] PipelineStats stats() const;
	[[nodiscard]] bool merge_tool_available() const;
	[[nodiscard]] const PipelineOptions &options() const;

   private:
	struct Impl;
	std::unique_ptr<Impl> m_impl;
};

}  // namespace vidstash
