#include <gtest/gtest.h>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>
#include <vidstash/pipeline.hpp>

#include "test_support.hpp"

using namespace vidstash;
using namespace vidstash::testing;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

constexpr const char *kCombinedUrl = "https://example.com/watch?v=combined";
constexpr const char *kSplitUrl = "https://example.com/watch?v=split";

// Records every status transition per job.
class StatusLog {
   public:
	StatusCallback callback() {
		return [this](const JobStatus &s) {
			std::lock_guard<std::mutex> lk(mutex_);
			states_[s.id].push_back(s.state);
		};
	}

	std::vector<JobState> states(JobId id) {
		std::lock_guard<std::mutex> lk(mutex_);
		return states_[id];
	}

   private:
	std::mutex mutex_;
	std::map<JobId, std::vector<JobState>> states_;
};

}  // namespace

class PipelineTest : public ::testing::Test {
   protected:
	void SetUp() override {
		resolver = std::make_shared<FakeResolver>();
		fetcher = std::make_shared<FakeFetcher>();
		merger = std::make_shared<FakeMerger>();

		resolver->add(kCombinedUrl,
					  media("Title", "Publisher",
							{combined(640, 360, 800), combined(1920, 1080, 3000)}));
		resolver->add(kSplitUrl,
					  media("Split", "Publisher",
							{video_only(2560, 1440), audio_only(128),
							 audio_only(160)}));

		options.output_root = out.path() / "library";
		options.temp_root = scratch.path() / "tmp";
		options.max_concurrent_jobs = 3;
	}

	std::unique_ptr<Pipeline> make_pipeline() {
		return std::make_unique<Pipeline>(resolver, fetcher, merger, options,
										  log.callback());
	}

	fs::path library(const std::string &publisher, const std::string &name) {
		return options.output_root / publisher / name;
	}

	TempDir out;
	TempDir scratch;
	PipelineOptions options;
	std::shared_ptr<FakeResolver> resolver;
	std::shared_ptr<FakeFetcher> fetcher;
	std::shared_ptr<FakeMerger> merger;
	StatusLog log;
};

TEST_F(PipelineTest, CombinedStreamIsPlacedWithoutMerging) {
	auto pipeline = make_pipeline();
	auto id = pipeline->submit(kCombinedUrl);
	pipeline->wait_idle();

	auto s = pipeline->status(id);
	ASSERT_TRUE(s);
	EXPECT_EQ(s->state, JobState::done);
	EXPECT_EQ(s->title, "Title");
	EXPECT_EQ(s->publisher, "Publisher");
	ASSERT_TRUE(s->final_path);
	EXPECT_EQ(*s->final_path, library("Publisher", "Title.mp4"));
	EXPECT_EQ(read_file(*s->final_path), "c1080p3000");
	EXPECT_FALSE(s->error);

	EXPECT_EQ(fetcher->calls.load(), 1);
	EXPECT_EQ(merger->calls.load(), 0);
	EXPECT_EQ(count_entries(options.temp_root), 0u);
}

TEST_F(PipelineTest, StatusTransitionsInOrder) {
	auto pipeline = make_pipeline();
	auto id = pipeline->submit(kSplitUrl);
	pipeline->wait_idle();

	std::vector<JobState> expected = {
		JobState::queued,	JobState::resolving,  JobState::fetching,
		JobState::merging,	JobState::organizing, JobState::done};
	EXPECT_EQ(log.states(id), expected);
}

TEST_F(PipelineTest, SeparateStreamsAreFetchedTogetherAndMergedOnce) {
	fetcher->delay = 150ms;
	auto pipeline = make_pipeline();
	auto id = pipeline->submit(kSplitUrl);
	pipeline->wait_idle();

	auto s = pipeline->status(id);
	ASSERT_TRUE(s);
	ASSERT_EQ(s->state, JobState::done) << s->detail;
	EXPECT_EQ(*s->final_path, library("Publisher", "Split.mp4"));
	EXPECT_EQ(read_file(*s->final_path), "v1440p4000+a160");

	EXPECT_EQ(fetcher->calls.load(), 2);
	EXPECT_EQ(fetcher->max_in_flight.load(), 2);
	EXPECT_EQ(merger->calls.load(), 1);
	EXPECT_EQ(count_entries(options.output_root / "Publisher"), 1u);
	EXPECT_EQ(count_entries(options.temp_root), 0u);
}

TEST_F(PipelineTest, ConfiguredMergeFormatIsUsed) {
	options.merge_format = "mkv";
	auto pipeline = make_pipeline();
	auto id = pipeline->submit(kSplitUrl);
	pipeline->wait_idle();

	auto s = pipeline->status(id);
	ASSERT_TRUE(s && s->final_path);
	EXPECT_EQ(s->final_path->filename(), "Split.mkv");
}

TEST_F(PipelineTest, InvalidInputFailsWithoutResolving) {
	auto pipeline = make_pipeline();
	auto id = pipeline->submit("not a url");

	auto s = pipeline->status(id);
	ASSERT_TRUE(s);
	EXPECT_EQ(s->state, JobState::failed);
	EXPECT_EQ(s->error, errc::invalid_input);
	EXPECT_EQ(kind_of(s->error), failure_kind::invalid_input);

	pipeline->wait_idle();
	EXPECT_EQ(resolver->calls.load(), 0);
	EXPECT_EQ(pipeline->stats().failed, 1u);
	EXPECT_EQ(pipeline->stats().submitted, 1u);
}

TEST_F(PipelineTest, ResolutionFailureIsReported) {
	resolver->fail("https://example.com/private", errc::content_unavailable);
	auto pipeline = make_pipeline();
	auto id = pipeline->submit("https://example.com/private");
	pipeline->wait_idle();

	auto s = pipeline->status(id);
	ASSERT_TRUE(s);
	EXPECT_EQ(s->state, JobState::failed);
	EXPECT_EQ(kind_of(s->error), failure_kind::resolution_failed);
	EXPECT_FALSE(fs::exists(options.output_root / "Publisher"));
}

TEST_F(PipelineTest, NoUsableStreamIsReported) {
	resolver->add("https://example.com/audio",
				  media("Podcast", "Host", {audio_only(64)}));
	auto pipeline = make_pipeline();
	auto id = pipeline->submit("https://example.com/audio");
	pipeline->wait_idle();

	auto s = pipeline->status(id);
	ASSERT_TRUE(s);
	EXPECT_EQ(s->error, errc::no_suitable_stream);
	EXPECT_EQ(fetcher->calls.load(), 0);
}

TEST_F(PipelineTest, MissingMergeToolOnlyFailsMergingJobs) {
	merger = std::make_shared<FakeMerger>(false);
	auto pipeline = make_pipeline();
	EXPECT_FALSE(pipeline->merge_tool_available());

	auto split = pipeline->submit(kSplitUrl);
	auto whole = pipeline->submit(kCombinedUrl);
	pipeline->wait_idle();

	auto s = pipeline->status(split);
	ASSERT_TRUE(s);
	EXPECT_EQ(s->state, JobState::failed);
	EXPECT_EQ(s->error, errc::tool_missing);

	auto w = pipeline->status(whole);
	ASSERT_TRUE(w);
	EXPECT_EQ(w->state, JobState::done);

	EXPECT_EQ(fetcher->calls.load(), 1);
	EXPECT_EQ(merger->calls.load(), 0);
}

TEST_F(PipelineTest, FetchFailureCancelsSiblingAndCleansUp) {
	fetcher->fail_format = "a160";
	fetcher->delay = 50ms;
	auto pipeline = make_pipeline();
	auto id = pipeline->submit(kSplitUrl);
	pipeline->wait_idle();

	auto s = pipeline->status(id);
	ASSERT_TRUE(s);
	EXPECT_EQ(s->state, JobState::failed);
	EXPECT_EQ(s->error, errc::network_error);
	EXPECT_EQ(merger->calls.load(), 0);
	EXPECT_EQ(count_entries(options.temp_root), 0u);
	EXPECT_FALSE(fs::exists(options.output_root / "Publisher"));
}

TEST_F(PipelineTest, MergeFailureLeavesNothingBehind) {
	merger->fail = true;
	auto pipeline = make_pipeline();
	auto id = pipeline->submit(kSplitUrl);
	pipeline->wait_idle();

	auto s = pipeline->status(id);
	ASSERT_TRUE(s);
	EXPECT_EQ(s->error, errc::encode_error);
	EXPECT_EQ(kind_of(s->error), failure_kind::encode_error);
	EXPECT_EQ(count_entries(options.temp_root), 0u);
	EXPECT_EQ(count_entries(options.output_root / "Publisher"), 0u);
}

TEST_F(PipelineTest, EveryJobReachesATerminalState) {
	fetcher->delay = 20ms;
	resolver->fail("https://example.com/gone", errc::content_unavailable);
	auto pipeline = make_pipeline();

	std::vector<JobId> ids;
	for (int i = 0; i < 4; ++i) {
		ids.push_back(pipeline->submit(kCombinedUrl));
		ids.push_back(pipeline->submit(kSplitUrl));
		ids.push_back(pipeline->submit("https://example.com/gone"));
		ids.push_back(pipeline->submit("nonsense"));
	}
	pipeline->wait_idle();

	std::set<JobId> unique(ids.begin(), ids.end());
	EXPECT_EQ(unique.size(), ids.size());
	for (auto id : ids) {
		auto s = pipeline->status(id);
		ASSERT_TRUE(s);
		EXPECT_TRUE(is_terminal(s->state)) << id;
		auto states = log.states(id);
		ASSERT_FALSE(states.empty());
		EXPECT_TRUE(is_terminal(states.back()));
	}

	auto st = pipeline->stats();
	EXPECT_EQ(st.submitted, 16u);
	EXPECT_EQ(st.succeeded, 8u);
	EXPECT_EQ(st.failed, 8u);
	EXPECT_EQ(st.active, 0u);
	EXPECT_EQ(pipeline->jobs().size(), 16u);
}

TEST_F(PipelineTest, SubmitDoesNotWaitAndCapacityIsBounded) {
	fetcher->delay = 150ms;
	auto pipeline = make_pipeline();

	auto start = std::chrono::steady_clock::now();
	for (int i = 0; i < 5; ++i) pipeline->submit(kCombinedUrl);
	EXPECT_LT(std::chrono::steady_clock::now() - start, 100ms);
	EXPECT_EQ(pipeline->stats().succeeded, 0u);
	EXPECT_EQ(pipeline->stats().active, 5u);

	pipeline->wait_idle();
	EXPECT_EQ(pipeline->stats().succeeded, 5u);
	EXPECT_LE(fetcher->max_in_flight.load(), 3);
	EXPECT_EQ(count_entries(options.output_root / "Publisher"), 5u);
}

TEST_F(PipelineTest, SameTitleConcurrentJobsGetDistinctFiles) {
	fetcher->delay = 50ms;
	auto pipeline = make_pipeline();
	auto a = pipeline->submit(kCombinedUrl);
	auto b = pipeline->submit(kCombinedUrl);
	pipeline->wait_idle();

	auto sa = pipeline->status(a);
	auto sb = pipeline->status(b);
	ASSERT_TRUE(sa && sa->final_path);
	ASSERT_TRUE(sb && sb->final_path);
	EXPECT_NE(*sa->final_path, *sb->final_path);
	EXPECT_TRUE(fs::exists(*sa->final_path));
	EXPECT_TRUE(fs::exists(*sb->final_path));
}

TEST_F(PipelineTest, ResubmittingGetsNumberedCopy) {
	auto pipeline = make_pipeline();
	auto first = pipeline->submit(kCombinedUrl);
	pipeline->wait_idle();
	auto second = pipeline->submit(kCombinedUrl);
	pipeline->wait_idle();

	EXPECT_NE(first, second);
	auto s1 = pipeline->status(first);
	auto s2 = pipeline->status(second);
	ASSERT_TRUE(s1 && s1->final_path);
	ASSERT_TRUE(s2 && s2->final_path);
	EXPECT_EQ(s1->final_path->filename(), "Title.mp4");
	EXPECT_EQ(s2->final_path->filename(), "Title (2).mp4");
}

TEST_F(PipelineTest, CancelStopsRunningJob) {
	fetcher->block_until_cancelled = true;
	auto pipeline = make_pipeline();
	auto id = pipeline->submit(kSplitUrl);
	ASSERT_TRUE(wait_for_state(*pipeline, id, JobState::fetching));

	EXPECT_TRUE(pipeline->cancel(id));
	pipeline->wait_idle();

	auto s = pipeline->status(id);
	ASSERT_TRUE(s);
	EXPECT_EQ(s->state, JobState::failed);
	EXPECT_EQ(s->error, errc::cancelled);
	EXPECT_EQ(kind_of(s->error), failure_kind::cancelled);
	EXPECT_EQ(count_entries(options.temp_root), 0u);
	EXPECT_FALSE(pipeline->cancel(id));
	EXPECT_FALSE(pipeline->cancel(9999));
}

TEST_F(PipelineTest, StageTimeoutFailsJob) {
	fetcher->block_until_cancelled = true;
	options.stage_timeout = 100ms;
	auto pipeline = make_pipeline();
	auto id = pipeline->submit(kCombinedUrl);
	pipeline->wait_idle();

	auto s = pipeline->status(id);
	ASSERT_TRUE(s);
	EXPECT_EQ(s->state, JobState::failed);
	EXPECT_EQ(s->error, errc::timed_out);
	EXPECT_EQ(count_entries(options.temp_root), 0u);
}

TEST_F(PipelineTest, MergeTimeoutFailsJob) {
	merger->block_until_cancelled = true;
	options.stage_timeout = 100ms;
	auto pipeline = make_pipeline();
	auto id = pipeline->submit(kSplitUrl);
	pipeline->wait_idle();

	auto s = pipeline->status(id);
	ASSERT_TRUE(s);
	EXPECT_EQ(s->error, errc::timed_out);
	EXPECT_EQ(count_entries(options.temp_root), 0u);
}

TEST_F(PipelineTest, DestructionCancelsOutstandingJobs) {
	fetcher->block_until_cancelled = true;
	JobId id = 0;
	{
		auto pipeline = make_pipeline();
		id = pipeline->submit(kCombinedUrl);
		ASSERT_TRUE(wait_for_state(*pipeline, id, JobState::fetching));
	}
	auto states = log.states(id);
	ASSERT_FALSE(states.empty());
	EXPECT_EQ(states.back(), JobState::failed);
	EXPECT_EQ(count_entries(options.temp_root), 0u);
}

TEST_F(PipelineTest, ThrowingCallbackDoesNotStopPipeline) {
	Pipeline pipeline(resolver, fetcher, merger, options,
					  [](const JobStatus &) { throw std::runtime_error("boom"); });
	auto id = pipeline.submit(kCombinedUrl);
	pipeline.wait_idle();

	auto s = pipeline.status(id);
	ASSERT_TRUE(s);
	EXPECT_EQ(s->state, JobState::done);
}

TEST_F(PipelineTest, NonStandardThrowFromCallbackIsContained) {
	Pipeline pipeline(resolver, fetcher, merger, options,
					  [](const JobStatus &) { throw 42; });
	auto id = pipeline.submit(kSplitUrl);
	pipeline.wait_idle();

	auto s = pipeline.status(id);
	ASSERT_TRUE(s);
	EXPECT_EQ(s->state, JobState::done);
	EXPECT_EQ(pipeline.stats().succeeded, 1u);
}

TEST_F(PipelineTest, UnknownStreamSizeLeavesPercentageUnset) {
	fetcher->unsized_format = "a160";
	auto pipeline = make_pipeline();
	auto id = pipeline->submit(kSplitUrl);
	pipeline->wait_idle();

	auto s = pipeline->status(id);
	ASSERT_TRUE(s);
	ASSERT_EQ(s->state, JobState::done);
	EXPECT_EQ(s->progress.total_downloaded_bytes,
			  static_cast<long long>(std::string("v1440p4000").size() +
									 std::string("a160").size()));
	EXPECT_EQ(s->progress.total_size_bytes, 0);
	EXPECT_DOUBLE_EQ(s->progress.percentage, 0.0);
}

TEST_F(PipelineTest, KnownSizesGiveFullPercentage) {
	auto pipeline = make_pipeline();
	auto id = pipeline->submit(kSplitUrl);
	pipeline->wait_idle();

	auto s = pipeline->status(id);
	ASSERT_TRUE(s);
	ASSERT_EQ(s->state, JobState::done);
	EXPECT_DOUBLE_EQ(s->progress.percentage, 100.0);
}

TEST_F(PipelineTest, CancelReachesResolver) {
	const std::string slow = "https://example.com/watch?v=slow";
	resolver->hold(slow);
	auto pipeline = make_pipeline();
	auto id = pipeline->submit(slow);
	ASSERT_TRUE(wait_for_state(*pipeline, id, JobState::resolving));

	EXPECT_TRUE(pipeline->cancel(id));
	pipeline->wait_idle();

	auto s = pipeline->status(id);
	ASSERT_TRUE(s);
	EXPECT_EQ(s->state, JobState::failed);
	EXPECT_EQ(s->error, errc::cancelled);
	EXPECT_EQ(fetcher->calls.load(), 0);
}

TEST_F(PipelineTest, RestrictedFilenamesAreAscii) {
	resolver->add("https://example.com/watch?v=cafe",
				  media("Caf\xc3\xa9", "Cr\xc3\xa8me", {combined(640, 360)}));
	options.restrict_filenames = true;
	auto pipeline = make_pipeline();
	auto id = pipeline->submit("https://example.com/watch?v=cafe");
	pipeline->wait_idle();

	auto s = pipeline->status(id);
	ASSERT_TRUE(s);
	ASSERT_EQ(s->state, JobState::done);
	EXPECT_EQ(*s->final_path, library("Cr__me", "Caf__.mp4"));
	EXPECT_TRUE(fs::exists(*s->final_path));
}
