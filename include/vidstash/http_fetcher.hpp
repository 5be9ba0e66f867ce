#pragma once

#include <vidstash/vidstash_net_export.h>

#include <memory>
#include <vidstash/fetcher.hpp>

namespace vidstash {

namespace net {
class HttpClient;
}

// Fetcher for http(s) locators. Sends the descriptor's request headers
// and removes the target file when the transfer does not complete.
class VIDSTASH_NET_EXPORT HttpFetcher : public Fetcher {
   public:
	HttpFetcher();
	~HttpFetcher() override;

	HttpFetcher(const HttpFetcher &) = delete;
	HttpFetcher &operator=(const HttpFetcher &) = delete;

	Result<void> fetch(const StreamDescriptor &stream,
					   const std::filesystem::path &target,
					   const CancellationToken &cancel,
					   ProgressCallback progress_cb) override;

   private:
	std::unique_ptr<net::HttpClient> http_;
};

}  // namespace vidstash
