#pragma once

#include <vidstash/vidstash_export.h>

#include <filesystem>
#include <vidstash/result.hpp>
#include <vidstash/types.hpp>

namespace vidstash {

// Downloads one stream to a local file.
//
// On failure (network_error, interrupted, disk_full, io_error) no partial
// file may remain at target. The token is checked between reads; a
// cancelled fetch fails with interrupted. Concurrent calls for different
// streams must be supported.
class VIDSTASH_EXPORT Fetcher {
   public:
	virtual ~Fetcher() = default;

	virtual Result<void> fetch(const StreamDescriptor &stream,
							   const std::filesystem::path &target,
							   const CancellationToken &cancel,
							   ProgressCallback progress_cb) = 0;
};

}  // namespace vidstash
