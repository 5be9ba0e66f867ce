#pragma once

#include <vidstash/vidstash_net_export.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vidstash/resolver.hpp>

namespace vidstash {

// Resolves URLs by running yt-dlp and reading its JSON dump. Any site
// yt-dlp supports works; only http(s) formats are offered downstream.
class VIDSTASH_NET_EXPORT YtDlpResolver : public StreamResolver {
   public:
	/// tool is a bare name looked up on PATH or a path to the executable.
	explicit YtDlpResolver(std::string tool = "yt-dlp");

	/// Fails with tool_missing when the executable was not found. A fired
	/// token kills yt-dlp and fails with cancelled.
	Result<MediaInfo> resolve(const std::string &url,
							  const CancellationToken &cancel) override;

	[[nodiscard]] bool available() const { return !tool_path_.empty(); }

   private:
	std::string tool_;
	std::filesystem::path tool_path_;
};

/// Normalize the output of `yt-dlp --dump-single-json`. Malformed input
/// fails with content_unavailable.
VIDSTASH_NET_EXPORT Result<MediaInfo> parse_ytdlp_json(std::string_view text);

/// Map yt-dlp's stderr of a failed run onto an error code.
VIDSTASH_NET_EXPORT std::error_code classify_ytdlp_failure(
	std::string_view stderr_text);

}  // namespace vidstash
