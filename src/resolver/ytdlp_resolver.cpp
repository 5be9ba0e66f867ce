#include <spdlog/spdlog.h>

#include <initializer_list>
#include <nlohmann/json.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vidstash/ytdlp_resolver.hpp>

#include "process/subprocess.hpp"
#include "utils.hpp"

namespace vidstash {

namespace {

using nlohmann::json;

bool contains_any(std::string_view text,
				  std::initializer_list<std::string_view> needles) {
	for (auto needle : needles) {
		if (text.find(needle) != std::string_view::npos) return true;
	}
	return false;
}

// Last non-empty line, which is where yt-dlp puts its ERROR: message.
std::string_view last_line(std::string_view text) {
	while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
		text.remove_suffix(1);
	}
	auto pos = text.find_last_of('\n');
	return pos == std::string_view::npos ? text : text.substr(pos + 1);
}

std::optional<StreamDescriptor> descriptor_from(const json &f) {
	auto url = utils::json_value<std::string>(f, {"url"});
	if (!url || url->empty()) return std::nullopt;

	auto protocol = utils::json_value<std::string>(f, {"protocol"});
	if (protocol) {
		if (*protocol != "http" && *protocol != "https") return std::nullopt;
	} else if (url->rfind("http://", 0) != 0 &&
			   url->rfind("https://", 0) != 0) {
		return std::nullopt;
	}

	// A missing codec key means unknown, which counts as present.
	auto vcodec = utils::json_value<std::string>(f, {"vcodec"});
	auto acodec = utils::json_value<std::string>(f, {"acodec"});
	bool has_video = !vcodec || *vcodec != "none";
	bool has_audio = !acodec || *acodec != "none";
	if (!has_video && !has_audio) return std::nullopt;

	StreamDescriptor d;
	d.kind = has_video && has_audio ? StreamKind::combined
			 : has_video			? StreamKind::video_only
									: StreamKind::audio_only;
	d.format_id = utils::json_value_or<std::string>(f, {"format_id"}, "");
	d.locator = std::move(*url);
	d.container = utils::json_value_or<std::string>(f, {"ext"}, "");
	d.vcodec = vcodec.value_or("");
	d.acodec = acodec.value_or("");
	d.width = utils::json_value_or<int>(f, {"width"}, 0);
	d.height = utils::json_value_or<int>(f, {"height"}, 0);

	if (auto tbr = utils::json_value<double>(f, {"tbr"})) {
		d.bitrate_kbps = *tbr;
	} else {
		d.bitrate_kbps = utils::json_value_or<double>(f, {"abr"}, 0.0) +
						 utils::json_value_or<double>(f, {"vbr"}, 0.0);
	}

	auto size = utils::json_value<double>(f, {"filesize"});
	if (!size) size = utils::json_value<double>(f, {"filesize_approx"});
	d.size_estimate = size ? static_cast<long long>(*size) : 0;

	if (auto headers = f.find("http_headers");
		headers != f.end() && headers->is_object()) {
		for (const auto &[key, value] : headers->items()) {
			if (value.is_string()) {
				d.http_headers[key] = value.get<std::string>();
			}
		}
	}
	return d;
}

}  // namespace

Result<MediaInfo> parse_ytdlp_json(std::string_view text) {
	json root = json::parse(text.begin(), text.end(), nullptr, false);
	if (root.is_discarded() || !root.is_object()) {
		spdlog::error("yt-dlp returned malformed JSON ({} bytes)", text.size());
		return make_error_code(errc::content_unavailable);
	}

	MediaInfo info;
	info.id = utils::json_value_or<std::string>(root, {"id"}, "");
	info.title = utils::json_value_or<std::string>(root, {"title"}, "");
	info.publisher =
		utils::first_string(root, {"channel", "uploader", "uploader_id"})
			.value_or("");
	info.webpage_url =
		utils::json_value_or<std::string>(root, {"webpage_url"}, "");

	auto formats = root.find("formats");
	if (formats != root.end() && formats->is_array()) {
		for (const auto &f : *formats) {
			if (!f.is_object()) continue;
			if (auto d = descriptor_from(f)) info.streams.push_back(std::move(*d));
		}
	} else if (auto d = descriptor_from(root)) {
		info.streams.push_back(std::move(*d));
	}

	spdlog::debug("Resolved '{}' by '{}' with {} usable formats", info.title,
				  info.publisher, info.streams.size());
	return info;
}

std::error_code classify_ytdlp_failure(std::string_view stderr_text) {
	if (contains_any(stderr_text, {"Unsupported URL", "is not a valid URL"})) {
		return make_error_code(errc::invalid_url);
	}
	if (contains_any(stderr_text, {"unavailable", "Private video", "removed"})) {
		return make_error_code(errc::content_unavailable);
	}
	if (contains_any(stderr_text, {"Unable to download", "HTTP Error",
								   "timed out", "getaddrinfo", "Connection"})) {
		return make_error_code(errc::network_error);
	}
	return make_error_code(errc::content_unavailable);
}

YtDlpResolver::YtDlpResolver(std::string tool) : tool_(std::move(tool)) {
	tool_path_ = process::find_executable(tool_);
	if (tool_path_.empty()) {
		spdlog::warn("Resolver tool '{}' not found", tool_);
	} else {
		spdlog::debug("Using resolver tool {}", tool_path_.string());
	}
}

Result<MediaInfo> YtDlpResolver::resolve(const std::string &url,
										 const CancellationToken &cancel) {
	if (tool_path_.empty()) return make_error_code(errc::tool_missing);

	process::RunOptions options;
	options.capture_stdout = true;
	options.cancel = &cancel;
	auto res = process::run(
		tool_path_,
		{"--dump-single-json", "--no-playlist", "--no-warnings", "--", url},
		options);
	if (res.has_error()) return res.error();

	const auto &proc = res.value();
	if (proc.exit_code != 0) {
		auto ec = classify_ytdlp_failure(proc.error_tail);
		spdlog::warn("yt-dlp could not resolve {}: {}", url,
					 proc.error_tail.empty() ? std::string_view("(no output)")
											 : last_line(proc.error_tail));
		return ec;
	}

	auto info = parse_ytdlp_json(proc.output);
	if (info.has_value() && info.value().webpage_url.empty()) {
		info.value().webpage_url = url;
	}
	return info;
}

}  // namespace vidstash
