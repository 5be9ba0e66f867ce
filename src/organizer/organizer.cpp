#include <spdlog/spdlog.h>

#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vidstash/filename.hpp>
#include <vidstash/organizer.hpp>

#include "fs_utils.hpp"

namespace fs = std::filesystem;

namespace vidstash {

namespace {

constexpr unsigned kMaxDisambiguation = 10000;
constexpr std::string_view kUnknownPublisher = "Unknown Publisher";
constexpr std::string_view kUntitled = "video";

bool links_unsupported(const std::error_code &ec) {
	return ec == std::errc::cross_device_link ||
		   ec == std::errc::operation_not_permitted ||
		   ec == std::errc::operation_not_supported;
}

// Create `to` from `from` without replacing anything already there, then
// drop `from`. A hard link claims the name atomically; where links are not
// possible an exclusive copy does. False means the name is taken.
Result<bool> claim_name(const fs::path &from, const fs::path &to) {
	std::error_code ec;
	fs::create_hard_link(from, to, ec);
	if (ec == std::errc::file_exists) return false;

	if (ec) {
		if (!links_unsupported(ec)) {
			spdlog::error("Failed to move {} to {}: {}", from.string(),
						  to.string(), ec.message());
			return utils::storage_error(ec);
		}
		spdlog::debug("Cannot link {} into place ({}), copying",
					  from.string(), ec.message());
		ec.clear();
		fs::copy_file(from, to, fs::copy_options::none, ec);
		if (ec == std::errc::file_exists) return false;
		if (ec) {
			spdlog::error("Failed to copy {} to {}: {}", from.string(),
						  to.string(), ec.message());
			std::error_code cleanup_ec;
			fs::remove(to, cleanup_ec);
			return utils::storage_error(ec);
		}
	}

	fs::remove(from, ec);
	if (ec) {
		spdlog::warn("Placed {} but could not remove the source: {}",
					 to.string(), ec.message());
	}
	return true;
}

}  // namespace

struct Organizer::Impl {
	fs::path root;
	std::size_t max_len;
	bool ascii_only;

	std::mutex locks_mutex;
	std::map<std::string, std::shared_ptr<std::mutex>> publisher_locks;

	Impl(fs::path r, std::size_t m, bool ascii)
		: root(std::move(r)), max_len(m), ascii_only(ascii) {}

	Destination sanitize(std::string_view publisher, std::string_view title,
						 std::string_view ext) const {
		Destination dest;
		dest.publisher = fit_component(
			sanitize_filename(publisher, kUnknownPublisher, ascii_only),
			max_len);
		dest.title = sanitize_filename(title, kUntitled, ascii_only);
		dest.ext = sanitize_extension(ext);
		return dest;
	}

	std::shared_ptr<std::mutex> lock_for(const std::string &publisher) {
		std::lock_guard<std::mutex> lk(locks_mutex);
		auto &slot = publisher_locks[publisher];
		if (!slot) slot = std::make_shared<std::mutex>();
		return slot;
	}

	Result<fs::path> place(const fs::path &artifact, const Destination &dest) {
		// Destinations built elsewhere still go through the sanitizer.
		auto clean = sanitize(dest.publisher, dest.title, dest.ext);

		auto dir_lock = lock_for(clean.publisher);
		std::lock_guard<std::mutex> lk(*dir_lock);

		auto dir = root / clean.publisher;
		std::error_code ec;
		fs::create_directories(dir, ec);
		if (ec) {
			spdlog::error("Cannot create {}: {}", dir.string(), ec.message());
			return utils::storage_error(ec);
		}

		for (unsigned n = 1; n <= kMaxDisambiguation; ++n) {
			auto candidate =
				dir / numbered_filename(clean.title, n, clean.ext, max_len);
			auto claimed = claim_name(artifact, candidate);
			if (claimed.has_error()) return claimed.error();
			if (!claimed.value()) continue;
			spdlog::debug("Placed {} at {}", artifact.filename().string(),
						  candidate.string());
			return candidate;
		}

		spdlog::error("No free name for '{}' in {}", clean.title,
					  dir.string());
		return make_error_code(errc::path_conflict);
	}
};

Organizer::Organizer(fs::path output_root, std::size_t max_component_length,
					 bool restrict_to_ascii)
	: m_impl(std::make_unique<Impl>(std::move(output_root),
									max_component_length, restrict_to_ascii)) {}

Organizer::~Organizer() = default;
Organizer::Organizer(Organizer &&) noexcept = default;
Organizer &Organizer::operator=(Organizer &&) noexcept = default;

Destination Organizer::destination_for(const MediaInfo &info,
									   std::string_view ext) const {
	return m_impl->sanitize(info.publisher, info.title, ext);
}

Result<fs::path> Organizer::place(const fs::path &artifact,
								  const Destination &dest) {
	return m_impl->place(artifact, dest);
}

const fs::path &Organizer::output_root() const { return m_impl->root; }

}  // namespace vidstash
