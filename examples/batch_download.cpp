#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <vidstash/http_fetcher.hpp>
#include <vidstash/merger.hpp>
#include <vidstash/pipeline.hpp>
#include <vidstash/ytdlp_resolver.hpp>

using namespace vidstash;

int main(int argc, char *argv[]) {
	// Initialize logger
	auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
	auto logger = std::make_shared<spdlog::logger>("vidstash", console_sink);
	spdlog::set_default_logger(logger);
	spdlog::set_level(spdlog::level::debug);

	std::vector<std::string> urls;
	for (int i = 1; i < argc; ++i) urls.emplace_back(argv[i]);
	if (urls.empty()) {
		urls.emplace_back("https://www.youtube.com/watch?v=F0tYP4OQ0-k");
	}

	PipelineOptions options;
	options.output_root = "downloads";
	options.max_concurrent_jobs = 2;
	options.merge_format = "mp4";

	Pipeline pipeline(std::make_shared<YtDlpResolver>(),
					  std::make_shared<HttpFetcher>(),
					  std::make_shared<FfmpegMerger>(), options,
					  [](const JobStatus &s) {
						  if (s.state == JobState::done) {
							  std::cout << "\nDownloaded to: "
										<< s.final_path->string() << "\n";
						  } else if (s.state == JobState::failed) {
							  std::cerr << "\nJob " << s.id << " failed: "
										<< s.error.message() << "\n";
						  }
					  });

	for (const auto &url : urls) {
		std::cout << "Queued job " << pipeline.submit(url) << " for " << url
				  << "\n";
	}

	// Poll the snapshot while downloads run.
	while (pipeline.stats().active > 0) {
		for (const auto &s : pipeline.jobs()) {
			if (s.state != JobState::fetching) continue;
			const auto &prog = s.progress;
			std::cout << "\r[job " << s.id << "] " << std::fixed
					  << std::setprecision(1) << prog.percentage << "% ("
					  << prog.total_downloaded_bytes / 1024 / 1024 << "MB / "
					  << prog.total_size_bytes / 1024 / 1024 << "MB) "
					  << "Speed: " << prog.speed_bytes_per_sec / 1024 / 1024
					  << " MB/s ETA: " << (int)prog.eta_seconds << "s   "
					  << std::flush;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(500));
	}
	pipeline.wait_idle();

	auto st = pipeline.stats();
	std::cout << "\n" << st.succeeded << " of " << st.submitted
			  << " downloads succeeded.\n";
	return st.failed == 0 ? 0 : 1;
}
