#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <random>
#include <utility>
#include <vidstash/temp_file.hpp>

#include "fs_utils.hpp"

namespace fs = std::filesystem;

namespace vidstash {

TempFile::TempFile(fs::path path) : path_(std::move(path)), owned_(true) {}

TempFile::~TempFile() { reset(); }

TempFile::TempFile(TempFile &&other) noexcept
	: path_(std::move(other.path_)), owned_(std::exchange(other.owned_, false)) {}

TempFile &TempFile::operator=(TempFile &&other) noexcept {
	if (this != &other) {
		reset();
		path_ = std::move(other.path_);
		owned_ = std::exchange(other.owned_, false);
	}
	return *this;
}

fs::path TempFile::release() {
	owned_ = false;
	return path_;
}

void TempFile::reset() noexcept {
	if (!owned_) return;
	owned_ = false;
	std::error_code ec;
	fs::remove(path_, ec);
	if (ec) {
		spdlog::warn("Could not remove temporary file {}: {}", path_.string(),
					 ec.message());
	}
}

Result<ScopedTempDir> ScopedTempDir::create(const fs::path &parent,
											std::string_view prefix) {
	std::error_code ec;
	fs::create_directories(parent, ec);
	if (ec) {
		spdlog::error("Could not create temporary root {}: {}",
					  parent.string(), ec.message());
		return outcome::failure(utils::storage_error(ec));
	}

	static thread_local std::mt19937_64 rng{std::random_device{}()};
	constexpr int kAttempts = 16;
	for (int i = 0; i < kAttempts; ++i) {
		auto candidate = parent / fmt::format("{}-{:012x}", prefix,
											  rng() & 0xffffffffffffULL);
		if (fs::create_directory(candidate, ec)) {
			return ScopedTempDir(std::move(candidate));
		}
		if (ec) {
			spdlog::error("Could not create temporary directory {}: {}",
						  candidate.string(), ec.message());
			return outcome::failure(utils::storage_error(ec));
		}
	}
	return outcome::failure(errc::path_conflict);
}

ScopedTempDir::ScopedTempDir(fs::path path) : path_(std::move(path)) {}

ScopedTempDir::~ScopedTempDir() { reset(); }

ScopedTempDir::ScopedTempDir(ScopedTempDir &&other) noexcept
	: path_(std::exchange(other.path_, fs::path{})) {}

ScopedTempDir &ScopedTempDir::operator=(ScopedTempDir &&other) noexcept {
	if (this != &other) {
		reset();
		path_ = std::exchange(other.path_, fs::path{});
	}
	return *this;
}

void ScopedTempDir::reset() noexcept {
	if (path_.empty()) return;
	std::error_code ec;
	fs::remove_all(path_, ec);
	if (ec) {
		spdlog::warn("Could not remove temporary directory {}: {}",
					 path_.string(), ec.message());
	}
	path_.clear();
}

}  // namespace vidstash
