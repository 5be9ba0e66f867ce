#include <fmt/color.h>
#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <boost/algorithm/string/trim.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <vidstash/http_fetcher.hpp>
#include <vidstash/merger.hpp>
#include <vidstash/pipeline.hpp>
#include <vidstash/ytdlp_resolver.hpp>

#ifdef _WIN32
#include <windows.h>
#endif

namespace po = boost::program_options;
namespace asio = boost::asio;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;

std::string failure_summary(const vidstash::JobStatus &s) {
	auto kind = vidstash::make_error_condition(vidstash::kind_of(s.error));
	if (s.detail.empty()) return kind.message();
	return fmt::format("{}: {}", kind.message(), s.detail);
}

std::string display_name(const vidstash::JobStatus &s) {
	return s.title.empty() ? s.source_url : s.title;
}

void print_status(const vidstash::JobStatus &s, bool quiet) {
	switch (s.state) {
		case vidstash::JobState::done:
			fmt::print(fg(fmt::color::green),
					   "[job {}] Downloaded '{}' successfully to {}\n", s.id,
					   display_name(s),
					   s.final_path ? s.final_path->string() : "?");
			break;
		case vidstash::JobState::failed:
			fmt::print(fg(fmt::color::red), "[job {}] '{}' failed ({})\n",
					   s.id, display_name(s), failure_summary(s));
			break;
		default:
			if (!quiet) {
				fmt::print("[job {}] {} ...\n", s.id, vidstash::to_string(s.state));
			}
			break;
	}
	std::fflush(stdout);
}

void print_jobs_table(const vidstash::Pipeline &pipeline) {
	auto jobs = pipeline.jobs();
	if (jobs.empty()) {
		fmt::print("No jobs yet.\n");
		return;
	}

	fmt::print("{:>5} {:<10} {:>7} {}\n", "ID", "STATE", "DONE", "TITLE / URL");
	for (const auto &s : jobs) {
		std::string done;
		if (s.state == vidstash::JobState::done) {
			done = "100%";
		} else if (s.progress.total_size_bytes > 0) {
			done = fmt::format("{:.1f}%", s.progress.percentage);
		}
		auto line = fmt::format("{:>5} {:<10} {:>7} {}\n", s.id,
								vidstash::to_string(s.state), done,
								display_name(s));
		if (s.state == vidstash::JobState::failed) {
			fmt::print(fg(fmt::color::dim_gray), "{}", line);
		} else {
			fmt::print("{}", line);
		}
	}

	auto st = pipeline.stats();
	fmt::print("{} submitted, {} active, {} succeeded, {} failed\n",
			   st.submitted, st.active, st.succeeded, st.failed);
}

void print_summary(const vidstash::Pipeline &pipeline) {
	auto st = pipeline.stats();
	fmt::print(stderr, "Finished: {} succeeded, {} failed\n", st.succeeded,
			   st.failed);
}

// Reads commands until quit or end of input.
void run_input_loop(vidstash::Pipeline &pipeline) {
	fmt::print(stderr,
			   "Enter URLs to download, 'jobs' to list, 'cancel <id>', or "
			   "'quit'.\n");

	std::string line;
	while (std::getline(std::cin, line)) {
		boost::algorithm::trim(line);
		if (line.empty()) continue;

		if (line == "quit" || line == "exit") break;

		if (line == "jobs") {
			print_jobs_table(pipeline);
			continue;
		}

		if (line.rfind("cancel", 0) == 0 &&
			(line.size() == 6 ||
			 std::isspace(static_cast<unsigned char>(line[6])))) {
			auto arg = boost::algorithm::trim_copy(line.substr(6));
			try {
				auto id = std::stoull(arg);
				if (!pipeline.cancel(id)) {
					fmt::print(stderr, "No active job {}\n", id);
				}
			} catch (const std::logic_error &) {
				fmt::print(stderr, "Usage: cancel <job id>\n");
			}
			continue;
		}

		auto id = pipeline.submit(line);
		spdlog::debug("Submitted job {} for {}", id, line);
	}
}

}  // namespace

int main(int argc, char *argv[]) {
#ifdef _WIN32
	SetConsoleOutputCP(CP_UTF8);
#endif

	try {
		auto stderr_logger = spdlog::stderr_color_mt("stderr");
		spdlog::set_default_logger(stderr_logger);
		spdlog::set_pattern("[%^%l%$] %v");

		po::options_description desc("Options");
		// clang-format off
		desc.add_options()
			("help,h", "Print help message")
			("config", po::value<std::string>(),
			 "Read options from an INI-style file (command line wins)");

		po::options_description settings("Settings");
		settings.add_options()
			("output,o", po::value<std::string>()->default_value("."),
			 "Root directory for downloads")
			("temp-dir", po::value<std::string>(),
			 "Directory for partial downloads (default: system temp)")
			("jobs,j", po::value<unsigned>()->default_value(3),
			 "Number of downloads running at once")
			("ffmpeg", po::value<std::string>()->default_value("ffmpeg"),
			 "ffmpeg executable used for merging")
			("yt-dlp", po::value<std::string>()->default_value("yt-dlp"),
			 "yt-dlp executable used to resolve URLs")
			("merge-format", po::value<std::string>(),
			 "Container for merged output (mp4, mkv, webm)")
			("stage-timeout", po::value<unsigned>()->default_value(0),
			 "Seconds allowed for a download or merge, 0 for no limit")
			("max-name-length",
			 po::value<std::size_t>()->default_value(120),
			 "Maximum bytes in a directory or file name")
			("restrict-filenames", po::bool_switch(),
			 "Replace non-ASCII characters in file names with '_'")
			("verbose,v", po::bool_switch(), "Enable verbose logging")
			("quiet,q", po::bool_switch(), "Only print results and warnings");

		po::options_description hidden;
		hidden.add_options()
			("url", po::value<std::vector<std::string>>(), "URLs to download");
		// clang-format on

		po::options_description cmdline;
		cmdline.add(desc).add(settings).add(hidden);

		po::positional_options_description p;
		p.add("url", -1);

		po::variables_map vm;
		po::store(po::command_line_parser(argc, argv)
					  .options(cmdline)
					  .positional(p)
					  .run(),
				  vm);
		if (vm.count("config")) {
			auto config_path = vm["config"].as<std::string>();
			po::store(po::parse_config_file<char>(config_path.c_str(), settings),
					  vm);
		}
		po::notify(vm);

		if (vm.count("help")) {
			std::cout << "Usage: vidstash [options] [url...]\n"
					  << desc << settings << "\n";
			return kExitOk;
		}

		bool quiet = vm["quiet"].as<bool>();
		if (vm["verbose"].as<bool>()) {
			spdlog::set_level(spdlog::level::debug);
		} else if (quiet) {
			spdlog::set_level(spdlog::level::warn);
		} else {
			spdlog::set_level(spdlog::level::info);
		}

		vidstash::PipelineOptions options;
		options.output_root = vm["output"].as<std::string>();
		if (vm.count("temp-dir")) {
			options.temp_root = vm["temp-dir"].as<std::string>();
		}
		options.max_concurrent_jobs = vm["jobs"].as<unsigned>();
		if (options.max_concurrent_jobs == 0) {
			fmt::print(stderr, "ERROR: --jobs must be at least 1\n");
			return kExitFailure;
		}
		if (vm.count("merge-format")) {
			options.merge_format = vm["merge-format"].as<std::string>();
		}
		if (auto secs = vm["stage-timeout"].as<unsigned>(); secs > 0) {
			options.stage_timeout = std::chrono::seconds(secs);
		}
		options.max_component_length = vm["max-name-length"].as<std::size_t>();
		options.restrict_filenames = vm["restrict-filenames"].as<bool>();

		auto resolver = std::make_shared<vidstash::YtDlpResolver>(
			vm["yt-dlp"].as<std::string>());
		if (!resolver->available()) {
			spdlog::warn("yt-dlp was not found; every URL will fail to resolve");
		}
		auto fetcher = std::make_shared<vidstash::HttpFetcher>();
		auto merger = std::make_shared<vidstash::FfmpegMerger>(
			vm["ffmpeg"].as<std::string>());

		vidstash::Pipeline pipeline(
			resolver, fetcher, merger, options,
			[quiet](const vidstash::JobStatus &s) { print_status(s, quiet); });

		// Signals cancel everything; the handler exits once cleanup is done
		// because the input loop may be blocked reading stdin.
		asio::io_context ioc;
		auto work = asio::make_work_guard(ioc);
		asio::signal_set signals(ioc, SIGINT, SIGTERM);
		signals.async_wait([&](const boost::system::error_code &ec, int sig) {
			if (ec) return;
			fmt::print(stderr, "\nReceived signal {}, cancelling downloads.\n",
					   sig);
			pipeline.cancel_all();
			pipeline.wait_idle();
			print_summary(pipeline);
			spdlog::shutdown();
			std::fflush(stdout);
			std::_Exit(kExitFailure);
		});
		std::thread signal_thread([&ioc] { ioc.run(); });

		if (vm.count("url")) {
			for (const auto &url : vm["url"].as<std::vector<std::string>>()) {
				pipeline.submit(url);
			}
		}

		run_input_loop(pipeline);
		pipeline.wait_idle();

		signals.cancel();
		work.reset();
		signal_thread.join();

		print_summary(pipeline);
		return pipeline.stats().failed == 0 ? kExitOk : kExitFailure;

	} catch (const std::exception &e) {
		fmt::print(stderr, "ERROR: {}\n", e.what());
		return kExitFailure;
	}
}
