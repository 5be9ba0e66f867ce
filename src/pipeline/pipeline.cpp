#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <boost/algorithm/string/trim.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/regex.hpp>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <map>
#include <mutex>
#include <utility>
#include <vidstash/filename.hpp>
#include <vidstash/organizer.hpp>
#include <vidstash/pipeline.hpp>
#include <vidstash/temp_file.hpp>

namespace fs = std::filesystem;

namespace vidstash {

namespace asio = boost::asio;

namespace {

// Resolution by pixel count when both widths are known, by height otherwise.
bool higher_resolution(const StreamDescriptor &a, const StreamDescriptor &b,
					   bool &tied) {
	long long ra = a.height;
	long long rb = b.height;
	if (a.width > 0 && b.width > 0) {
		ra = static_cast<long long>(a.width) * a.height;
		rb = static_cast<long long>(b.width) * b.height;
	}
	tied = ra == rb;
	return ra > rb;
}

bool better_visual(const StreamDescriptor &candidate,
				   const StreamDescriptor *best) {
	if (!best) return true;
	bool tied = false;
	bool higher = higher_resolution(candidate, *best, tied);
	if (!tied) return higher;
	return candidate.bitrate_kbps > best->bitrate_kbps;
}

bool is_soft_failure(const std::error_code &ec) {
	return ec == errc::interrupted || ec == errc::cancelled;
}

fs::path default_temp_root() {
	std::error_code ec;
	auto base = fs::temp_directory_path(ec);
	if (ec) base = fs::current_path(ec);
	return base / "vidstash";
}

}  // namespace

struct Job {
	JobId id = 0;
	CancellationToken cancel;
	std::atomic<bool> user_cancelled{false};
	std::atomic<bool> timed_out{false};

	// Guarded by Pipeline::Impl::mutex.
	JobStatus status;
	bool split = false;  // separate video and audio fetches
	long long video_now = 0;
	long long video_total = 0;
	long long audio_now = 0;
	long long audio_total = 0;
	std::chrono::steady_clock::time_point start_time;

	// Worker-private.
	std::string detail;
};

struct Pipeline::Impl {
	std::shared_ptr<StreamResolver> resolver;
	std::shared_ptr<Fetcher> fetcher;
	std::shared_ptr<Merger> merger;
	PipelineOptions options;
	StatusCallback on_status;
	Organizer organizer;
	fs::path temp_root;
	bool merge_available = false;

	mutable std::mutex mutex;
	std::condition_variable idle_cv;
	std::map<JobId, std::shared_ptr<Job>> active;
	std::deque<JobStatus> history;
	std::atomic<JobId> next_id{1};
	std::size_t submitted = 0;
	std::size_t succeeded = 0;
	std::size_t failed = 0;
	std::size_t in_flight = 0;

	// Declared last so they are torn down before the state they use.
	asio::thread_pool workers;
	asio::thread_pool aux;

	Impl(std::shared_ptr<StreamResolver> r, std::shared_ptr<Fetcher> f,
		 std::shared_ptr<Merger> m, PipelineOptions opts, StatusCallback cb)
		: resolver(std::move(r)),
		  fetcher(std::move(f)),
		  merger(std::move(m)),
		  options(std::move(opts)),
		  on_status(std::move(cb)),
		  organizer(options.output_root, options.max_component_length,
					options.restrict_filenames),
		  temp_root(options.temp_root.empty() ? default_temp_root()
											  : options.temp_root),
		  workers(std::max(1U, options.max_concurrent_jobs)),
		  aux(2 * std::max(1U, options.max_concurrent_jobs)) {
		merge_available = merger && merger->available();
		if (!merge_available) {
			spdlog::warn(
				"Multiplexing tool unavailable: only items offering a "
				"combined stream can be downloaded");
		}
	}

	void notify(const JobStatus &snapshot) {
		if (!on_status) return;
		try {
			on_status(snapshot);
		} catch (const std::exception &e) {
			spdlog::error("[job {}] status callback threw: {}", snapshot.id,
						  e.what());
		} catch (...) {
			spdlog::error("[job {}] status callback threw a non-standard "
						  "exception",
						  snapshot.id);
		}
	}

	void set_state(Job &job, JobState state) {
		JobStatus snapshot;
		{
			std::lock_guard<std::mutex> lk(mutex);
			job.status.state = state;
			snapshot = job.status;
		}
		spdlog::debug("[job {}] {}", job.id, to_string(state));
		notify(snapshot);
	}

	void record_progress(Job &job) {
		long long total_current = job.video_now + job.audio_now;
		// A stream of unknown size leaves the whole total unknown.
		bool sizes_known =
			job.video_total > 0 && (!job.split || job.audio_total > 0);
		long long total_size =
			sizes_known ? job.video_total + job.audio_total : 0;

		if (job.start_time.time_since_epoch().count() == 0 &&
			total_current > 0) {
			job.start_time = std::chrono::steady_clock::now();
		}

		DownloadProgress prog{};
		prog.total_downloaded_bytes = total_current;
		prog.total_size_bytes = total_size;

		if (total_size > 0) {
			prog.percentage = (double)total_current / total_size * 100.0;
		}

		if (job.start_time.time_since_epoch().count() > 0) {
			auto now = std::chrono::steady_clock::now();
			auto duration =
				std::chrono::duration_cast<std::chrono::milliseconds>(
					now - job.start_time)
					.count();

			if (duration > 0) {
				prog.speed_bytes_per_sec =
					(double)total_current * 1000.0 / duration;

				if (prog.speed_bytes_per_sec > 0 && total_size > 0) {
					long long remaining = total_size - total_current;
					prog.eta_seconds =
						(double)remaining / prog.speed_bytes_per_sec;
				}
			}
		}

		job.status.progress = prog;
	}

	ProgressCallback progress_for(const std::shared_ptr<Job> &job,
								  bool audio) {
		return [this, job, audio](long long now, long long total) {
			std::lock_guard<std::mutex> lk(mutex);
			if (audio) {
				job->audio_now = now;
				if (total > 0) job->audio_total = total;
			} else {
				job->video_now = now;
				if (total > 0) job->video_total = total;
			}
			record_progress(*job);
		};
	}

	// Error for a job whose token fired, or success if it did not.
	static Result<void> check_interrupt(const Job &job) {
		if (job.timed_out) return outcome::failure(errc::timed_out);
		if (job.cancel.is_cancelled()) return outcome::failure(errc::cancelled);
		return outcome::success();
	}

	// Waits for every pending task, cancelling the job when the stage
	// deadline passes or a task fails. Nothing is left running on return.
	Result<void> await_stage(Job &job,
							 std::vector<std::future<Result<void>>> &pending,
							 const char *stage) {
		if (options.stage_timeout) {
			auto deadline =
				std::chrono::steady_clock::now() + *options.stage_timeout;
			for (auto &f : pending) {
				if (f.wait_until(deadline) == std::future_status::timeout) {
					spdlog::warn("[job {}] {} exceeded {} ms, cancelling",
								 job.id, stage,
								 options.stage_timeout->count());
					job.timed_out = true;
					job.cancel.request_cancel();
					break;
				}
			}
		}

		std::error_code first_error;
		for (auto &f : pending) {
			auto res = f.get();
			if (res.has_error()) {
				auto ec = res.error();
				if (!first_error ||
					(is_soft_failure(first_error) && !is_soft_failure(ec))) {
					first_error = ec;
				}
			}
		}

		if (!first_error) return outcome::success();
		if (!is_soft_failure(first_error)) return first_error;
		if (job.timed_out) return make_error_code(errc::timed_out);
		if (job.user_cancelled) return make_error_code(errc::cancelled);
		return first_error;
	}

	std::future<Result<void>> start_fetch(const std::shared_ptr<Job> &job,
										  const StreamDescriptor &stream,
										  const fs::path &target, bool audio) {
		auto progress_cb = progress_for(job, audio);
		return asio::post(
			aux, asio::use_future(
					 [this, job, &stream, target,
					  progress_cb = std::move(progress_cb)]() -> Result<void> {
						 Result<void> res = outcome::success();
						 try {
							 res = fetcher->fetch(stream, target, job->cancel,
												  progress_cb);
						 } catch (const std::exception &e) {
							 spdlog::error("[job {}] fetch of {} threw: {}",
										   job->id, stream.format_id,
										   e.what());
							 res = make_error_code(errc::unknown);
						 }
						 if (res.has_error()) {
							 if (!is_soft_failure(res.error())) {
								 spdlog::error(
									 "[job {}] fetch of format {} failed: {}",
									 job->id, stream.format_id,
									 res.error().message());
							 }
							 // The sibling fetch has no reason to continue.
							 job->cancel.request_cancel();
						 }
						 return res;
					 }));
	}

	Result<fs::path> execute(const std::shared_ptr<Job> &job_ptr) {
		Job &job = *job_ptr;

		if (auto r = check_interrupt(job); r.has_error()) return r.error();

		set_state(job, JobState::resolving);
		auto resolved = resolver->resolve(
			boost::algorithm::trim_copy(job.status.source_url), job.cancel);
		if (resolved.has_error()) {
			if (!is_soft_failure(resolved.error())) {
				spdlog::error("[job {}] could not resolve {}: {}", job.id,
							  job.status.source_url,
							  resolved.error().message());
			}
			return resolved.error();
		}
		const MediaInfo &info = resolved.value();
		{
			std::lock_guard<std::mutex> lk(mutex);
			job.status.title = info.title;
			job.status.publisher = info.publisher;
		}

		auto selected = select_streams(info);
		if (selected.has_error()) {
			job.detail = fmt::format("no usable stream among {} offered",
									 info.streams.size());
			return selected.error();
		}
		const auto &sel = selected.value();

		if (sel.needs_merge() && !merge_available) {
			job.detail = "video and audio are separate and no multiplexing "
						 "tool is available";
			return make_error_code(errc::tool_missing);
		}

		std::string ext = sel.needs_merge()
							  ? merge_container(*sel.video, *sel.audio,
												options.merge_format)
							  : sel.combined->container;
		auto dest = organizer.destination_for(info, ext);

		auto scratch = ScopedTempDir::create(temp_root,
											 fmt::format("job-{}", job.id));
		if (scratch.has_error()) return scratch.error();
		const auto &dir = scratch.value().path();

		if (auto r = check_interrupt(job); r.has_error()) return r.error();

		{
			std::lock_guard<std::mutex> lk(mutex);
			job.split = sel.needs_merge();
		}
		set_state(job, JobState::fetching);
		TempFile video_file;
		TempFile audio_file;
		std::vector<std::future<Result<void>>> pending;
		if (sel.needs_merge()) {
			video_file = TempFile(
				dir / fmt::format("video.{}",
								  sanitize_extension(sel.video->container)));
			audio_file = TempFile(
				dir / fmt::format("audio.{}",
								  sanitize_extension(sel.audio->container)));
			spdlog::info("[job {}] fetching video {} and audio {}", job.id,
						 sel.video->format_id, sel.audio->format_id);
			pending.push_back(
				start_fetch(job_ptr, *sel.video, video_file.path(), false));
			pending.push_back(
				start_fetch(job_ptr, *sel.audio, audio_file.path(), true));
		} else {
			video_file = TempFile(dir / fmt::format("media.{}", dest.ext));
			spdlog::info("[job {}] fetching combined stream {}", job.id,
						 sel.combined->format_id);
			pending.push_back(
				start_fetch(job_ptr, *sel.combined, video_file.path(), false));
		}
		if (auto r = await_stage(job, pending, "fetch"); r.has_error()) {
			return r.error();
		}

		set_state(job, JobState::merging);
		TempFile output_file;
		if (sel.needs_merge()) {
			output_file = TempFile(dir / fmt::format("merged.{}", dest.ext));
			spdlog::info("[job {}] merging into {}", job.id, dest.ext);
			std::vector<std::future<Result<void>>> merge_task;
			merge_task.push_back(asio::post(
				aux, asio::use_future([this, job_ptr, &video_file, &audio_file,
									   &output_file]() -> Result<void> {
					try {
						return merger->merge(video_file.path(),
											 audio_file.path(),
											 output_file.path(),
											 job_ptr->cancel);
					} catch (const std::exception &e) {
						spdlog::error("[job {}] merge threw: {}", job_ptr->id,
									  e.what());
						return make_error_code(errc::unknown);
					}
				})));
			if (auto r = await_stage(job, merge_task, "merge"); r.has_error()) {
				return r.error();
			}
			video_file.reset();
			audio_file.reset();
		} else {
			output_file = std::move(video_file);
		}

		if (auto r = check_interrupt(job); r.has_error()) return r.error();

		set_state(job, JobState::organizing);
		auto placed = organizer.place(output_file.path(), dest);
		if (placed.has_error()) return placed.error();
		output_file.release();
		return placed.value();
	}

	void finish(const std::shared_ptr<Job> &job, const Result<fs::path> &res) {
		JobStatus snapshot;
		{
			std::lock_guard<std::mutex> lk(mutex);
			if (res.has_value()) {
				job->status.state = JobState::done;
				job->status.final_path = res.value();
				++succeeded;
			} else {
				job->status.state = JobState::failed;
				job->status.error = res.error();
				job->status.detail = job->detail.empty()
										 ? res.error().message()
										 : job->detail;
				++failed;
			}
			snapshot = job->status;
			active.erase(job->id);
			remember(snapshot);
		}

		if (res.has_value()) {
			spdlog::info("[job {}] saved to {}", job->id,
						 res.value().string());
		} else {
			spdlog::info("[job {}] failed: {}", job->id, snapshot.detail);
		}
		notify(snapshot);

		{
			std::lock_guard<std::mutex> lk(mutex);
			--in_flight;
		}
		idle_cv.notify_all();
	}

	// Caller holds mutex.
	void remember(const JobStatus &snapshot) {
		history.push_back(snapshot);
		while (history.size() > options.history_limit) history.pop_front();
	}

	void run_job(const std::shared_ptr<Job> &job) {
		Result<fs::path> res = make_error_code(errc::unknown);
		try {
			res = execute(job);
		} catch (const std::exception &e) {
			spdlog::error("[job {}] unexpected error: {}", job->id, e.what());
			job->detail = e.what();
			res = make_error_code(errc::unknown);
		}
		finish(job, res);
	}

	JobId submit(std::string_view url) {
		JobId id = next_id.fetch_add(1);

		if (auto valid = validate_url(url); valid.has_error()) {
			JobStatus snapshot;
			snapshot.id = id;
			snapshot.source_url = std::string(url);
			snapshot.state = JobState::failed;
			snapshot.error = valid.error();
			snapshot.detail = "not an http(s) URL";
			{
				std::lock_guard<std::mutex> lk(mutex);
				++submitted;
				++failed;
				remember(snapshot);
			}
			spdlog::warn("[job {}] rejected input '{}'", id, url);
			notify(snapshot);
			return id;
		}

		auto job = std::make_shared<Job>();
		job->id = id;
		job->status.id = id;
		job->status.source_url = std::string(url);
		job->status.state = JobState::queued;
		JobStatus snapshot;
		{
			std::lock_guard<std::mutex> lk(mutex);
			active.emplace(id, job);
			++submitted;
			++in_flight;
			snapshot = job->status;
		}
		spdlog::debug("[job {}] queued {}", id, url);
		notify(snapshot);

		asio::post(workers, [this, job] { run_job(job); });
		return id;
	}

	static void request_cancel(Job &job) {
		job.user_cancelled = true;
		job.cancel.request_cancel();
	}
};

Pipeline::Pipeline(std::shared_ptr<StreamResolver> resolver,
				   std::shared_ptr<Fetcher> fetcher,
				   std::shared_ptr<Merger> merger, PipelineOptions options,
				   StatusCallback on_status)
	: m_impl(std::make_unique<Impl>(std::move(resolver), std::move(fetcher),
									std::move(merger), std::move(options),
									std::move(on_status))) {}

Pipeline::~Pipeline() {
	cancel_all();
	m_impl->workers.join();
	m_impl->aux.join();
}

Result<Pipeline::StreamSelection> Pipeline::select_streams(
	const MediaInfo &info) {
	StreamSelection result;

	for (const auto &s : info.streams) {
		if (s.kind == StreamKind::combined && better_visual(s, result.combined))
			result.combined = &s;
	}
	if (result.combined) {
		spdlog::debug("Selected combined format {} ({}x{}, {:.0f} kbps)",
					  result.combined->format_id, result.combined->width,
					  result.combined->height, result.combined->bitrate_kbps);
		return result;
	}

	for (const auto &s : info.streams) {
		if (s.kind == StreamKind::video_only && better_visual(s, result.video))
			result.video = &s;
		if (s.kind == StreamKind::audio_only &&
			(!result.audio || s.bitrate_kbps > result.audio->bitrate_kbps))
			result.audio = &s;
	}

	if (!result.video || !result.audio) {
		spdlog::debug("No usable stream combination ({} video, {} audio)",
					  result.video ? 1 : 0, result.audio ? 1 : 0);
		return make_error_code(errc::no_suitable_stream);
	}

	spdlog::debug(
		"Selected video format {} ({}x{}) and audio format {} ({:.0f} kbps)",
		result.video->format_id, result.video->width, result.video->height,
		result.audio->format_id, result.audio->bitrate_kbps);
	return result;
}

Result<void> Pipeline::validate_url(std::string_view url) {
	static const boost::regex pattern(
		R"(^(https?)://([^\s/?#@]+@)?([^\s/?#:@]+)(:\d{1,5})?([/?#]\S*)?$)",
		boost::regex::icase);

	std::string trimmed(url);
	boost::algorithm::trim(trimmed);
	if (trimmed.empty() || !boost::regex_match(trimmed, pattern)) {
		return outcome::failure(errc::invalid_input);
	}
	return outcome::success();
}

std::string Pipeline::merge_container(
	const StreamDescriptor &video, const StreamDescriptor &audio,
	const std::optional<std::string> &configured) {
	if (configured && !configured->empty()) {
		return sanitize_extension(*configured);
	}
	if (video.container == "mp4" &&
		(audio.container == "m4a" || audio.container == "mp4")) {
		return "mp4";
	}
	return "mkv";
}

JobId Pipeline::submit(std::string_view url) { return m_impl->submit(url); }

std::vector<JobStatus> Pipeline::jobs() const {
	std::lock_guard<std::mutex> lk(m_impl->mutex);
	std::vector<JobStatus> out;
	out.reserve(m_impl->active.size() + m_impl->history.size());
	for (const auto &[id, job] : m_impl->active) out.push_back(job->status);
	out.insert(out.end(), m_impl->history.begin(), m_impl->history.end());
	return out;
}

std::optional<JobStatus> Pipeline::status(JobId id) const {
	std::lock_guard<std::mutex> lk(m_impl->mutex);
	if (auto it = m_impl->active.find(id); it != m_impl->active.end()) {
		return it->second->status;
	}
	auto it = std::find_if(
		m_impl->history.rbegin(), m_impl->history.rend(),
		[id](const JobStatus &s) { return s.id == id; });
	if (it != m_impl->history.rend()) return *it;
	return std::nullopt;
}

bool Pipeline::cancel(JobId id) {
	std::lock_guard<std::mutex> lk(m_impl->mutex);
	auto it = m_impl->active.find(id);
	if (it == m_impl->active.end()) return false;
	spdlog::info("[job {}] cancellation requested", id);
	Impl::request_cancel(*it->second);
	return true;
}

void Pipeline::cancel_all() {
	std::lock_guard<std::mutex> lk(m_impl->mutex);
	for (auto &[id, job] : m_impl->active) Impl::request_cancel(*job);
}

void Pipeline::wait_idle() {
	std::unique_lock<std::mutex> lk(m_impl->mutex);
	m_impl->idle_cv.wait(lk, [this] { return m_impl->in_flight == 0; });
}

PipelineStats Pipeline::stats() const {
	std::lock_guard<std::mutex> lk(m_impl->mutex);
	PipelineStats s;
	s.submitted = m_impl->submitted;
	s.succeeded = m_impl->succeeded;
	s.failed = m_impl->failed;
	s.active = m_impl->active.size();
	return s;
}

bool Pipeline::merge_tool_available() const { return m_impl->merge_available; }

const PipelineOptions &Pipeline::options() const { return m_impl->options; }

}  // namespace vidstash
