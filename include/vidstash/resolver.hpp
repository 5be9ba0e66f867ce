#pragma once

#include <vidstash/vidstash_export.h>

#include <string>
#include <vidstash/result.hpp>
#include <vidstash/types.hpp>

namespace vidstash {

// Looks up a source URL and returns its metadata and available streams.
// Fails with invalid_url, content_unavailable or network_error, and with
// cancelled once the token fires. Implementations must be safe to call
// from several threads at once.
class VIDSTASH_EXPORT StreamResolver {
   public:
	virtual ~StreamResolver() = default;

	virtual Result<MediaInfo> resolve(const std::string &url,
									  const CancellationToken &cancel) = 0;
};

}  // namespace vidstash
