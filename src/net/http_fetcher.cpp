#include <spdlog/spdlog.h>

#include <vidstash/http_fetcher.hpp>
#include <vidstash/temp_file.hpp>

#include "net/http_client.hpp"

namespace vidstash {

HttpFetcher::HttpFetcher() : http_(std::make_unique<net::HttpClient>()) {}

HttpFetcher::~HttpFetcher() = default;

Result<void> HttpFetcher::fetch(const StreamDescriptor &stream,
								const std::filesystem::path &target,
								const CancellationToken &cancel,
								ProgressCallback progress_cb) {
	TempFile guard(target);

	spdlog::debug("Downloading format {} to {}", stream.format_id,
				  target.filename().string());
	auto res = http_->download_file(stream.locator, target,
									stream.http_headers, cancel,
									std::move(progress_cb));
	if (res.has_error()) {
		if (res.error() != errc::interrupted) {
			spdlog::warn("Download of format {} failed: {}", stream.format_id,
						 res.error().message());
		}
		return res;
	}

	guard.release();
	return outcome::success();
}

}  // namespace vidstash
