#include "subprocess.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <boost/filesystem/path.hpp>
#include <boost/process.hpp>
#include <boost/scope_exit.hpp>
#include <chrono>
#include <fstream>
#include <random>
#include <thread>
#include <vidstash/temp_file.hpp>

namespace bp = boost::process;
namespace fs = std::filesystem;

namespace vidstash::process {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(50);

fs::path stderr_capture_path() {
	static thread_local std::mt19937_64 rng{std::random_device{}()};
	std::error_code ec;
	auto dir = fs::temp_directory_path(ec);
	if (ec) dir = ".";
	return dir / fmt::format("vidstash-{:016x}.stderr", rng());
}

std::string read_tail(const fs::path &path, std::size_t max_bytes) {
	std::ifstream in(path, std::ios::binary | std::ios::ate);
	if (!in) return {};
	auto size = static_cast<std::size_t>(in.tellg());
	auto start = size > max_bytes ? size - max_bytes : 0;
	in.seekg(static_cast<std::streamoff>(start));
	std::string tail(size - start, '\0');
	in.read(tail.data(), static_cast<std::streamsize>(tail.size()));
	tail.resize(static_cast<std::size_t>(in.gcount()));
	while (!tail.empty() && (tail.back() == '\n' || tail.back() == '\r')) {
		tail.pop_back();
	}
	return tail;
}

}  // namespace

fs::path find_executable(const std::string &tool) {
	if (tool.empty()) return {};

	if (tool.find('/') != std::string::npos) {
		std::error_code ec;
		fs::path candidate(tool);
		auto st = fs::status(candidate, ec);
		if (ec || !fs::is_regular_file(st)) return {};
		constexpr auto kAnyExec = fs::perms::owner_exec |
								  fs::perms::group_exec |
								  fs::perms::others_exec;
		if ((st.permissions() & kAnyExec) == fs::perms::none) return {};
		return candidate;
	}

	auto found = bp::search_path(tool);
	if (found.empty()) return {};
	return fs::path(found.string());
}

Result<ProcessResult> run(const fs::path &exe,
						  const std::vector<std::string> &args,
						  const RunOptions &options) {
	TempFile stderr_file(stderr_capture_path());
	boost::filesystem::path stderr_target(stderr_file.path().string());

	ProcessResult result;
	bp::ipstream out;
	std::error_code launch_ec;
	bp::child child;

	if (options.capture_stdout) {
		child = bp::child(bp::exe = exe.string(), bp::args = args,
						  bp::std_in < bp::null, bp::std_out > out,
						  bp::std_err > stderr_target, launch_ec);
	} else {
		child = bp::child(bp::exe = exe.string(), bp::args = args,
						  bp::std_in < bp::null, bp::std_out > bp::null,
						  bp::std_err > stderr_target, launch_ec);
	}

	if (launch_ec) {
		spdlog::error("Could not start {}: {}", exe.string(),
					  launch_ec.message());
		return outcome::failure(errc::tool_missing);
	}

	std::thread reader;
	BOOST_SCOPE_EXIT_ALL(&reader) {
		if (reader.joinable()) reader.join();
	};
	if (options.capture_stdout) {
		reader = std::thread([&out, &result] {
			std::string line;
			while (std::getline(out, line)) {
				result.output += line;
				result.output += '\n';
			}
		});
	}

	bool cancelled = false;
	std::error_code ec;
	while (child.running(ec)) {
		if (options.cancel && options.cancel->is_cancelled()) {
			spdlog::debug("Terminating {} (pid {})", exe.filename().string(),
						  child.id());
			child.terminate(ec);
			cancelled = true;
			break;
		}
		std::this_thread::sleep_for(kPollInterval);
	}
	if (!cancelled) child.wait(ec);
	if (reader.joinable()) reader.join();

	if (cancelled) return outcome::failure(errc::cancelled);

	result.exit_code = child.exit_code();
	result.error_tail = read_tail(stderr_file.path(), options.stderr_tail_bytes);
	return result;
}

}  // namespace vidstash::process
