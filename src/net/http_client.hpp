#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vidstash/result.hpp>
#include <vidstash/types.hpp>

namespace vidstash::net {

// Blocking HTTP/1.1 downloader. Each call runs its own I/O context on the
// calling thread, so one client can serve several workers at once.
class HttpClient {
   public:
	HttpClient(const HttpClient &) = delete;
	HttpClient &operator=(const HttpClient &) = delete;
	HttpClient(HttpClient &&) noexcept;
	HttpClient &operator=(HttpClient &&) noexcept;
	~HttpClient();

	HttpClient();

	/// Download url into output_path with a HEAD probe followed by ranged
	/// GETs. Fails with invalid_url, network_error, interrupted (token
	/// fired), disk_full or io_error. A partial file is left for the caller
	/// to clean up.
	Result<void> download_file(
		const std::string &url, const std::filesystem::path &output_path,
		const std::map<std::string, std::string> &headers,
		const CancellationToken &cancel, ProgressCallback progress_cb = nullptr);

   private:
	struct Impl;
	std::unique_ptr<Impl> m_impl;
};

}  // namespace vidstash::net
