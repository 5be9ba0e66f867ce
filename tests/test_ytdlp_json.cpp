#include <gtest/gtest.h>

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vidstash/ytdlp_resolver.hpp>

#include "test_support.hpp"
#include "utils.hpp"

using namespace vidstash;
using nlohmann::json;
using vidstash::testing::read_file;
using vidstash::testing::TempDir;
using vidstash::testing::write_script;

namespace {

json sample_dump() {
	return json::parse(R"({
		"id": "abc123",
		"title": "Sample Video",
		"channel": "Sample Channel",
		"uploader": "someone-else",
		"webpage_url": "https://www.youtube.com/watch?v=abc123",
		"formats": [
			{"format_id": "sb0", "url": "https://i.ytimg.com/sb/0.jpg",
			 "protocol": "mhtml", "ext": "mhtml",
			 "vcodec": "none", "acodec": "none"},
			{"format_id": "140", "url": "https://cdn.example.com/140",
			 "protocol": "https", "ext": "m4a",
			 "vcodec": "none", "acodec": "mp4a.40.2", "abr": 129.5,
			 "filesize": 3400000,
			 "http_headers": {"User-Agent": "UA", "Accept": "*/*"}},
			{"format_id": "137", "url": "https://cdn.example.com/137",
			 "protocol": "https", "ext": "mp4",
			 "vcodec": "avc1.640028", "acodec": "none",
			 "width": 1920, "height": 1080, "tbr": 4400.2,
			 "filesize_approx": 55000000},
			{"format_id": "18", "url": "https://cdn.example.com/18",
			 "protocol": "https", "ext": "mp4",
			 "vcodec": "avc1.42001E", "acodec": "mp4a.40.2",
			 "width": 640, "height": 360, "tbr": 600},
			{"format_id": "hls-720", "url": "https://cdn.example.com/720.m3u8",
			 "protocol": "m3u8_native", "ext": "mp4",
			 "vcodec": "avc1", "acodec": "mp4a"}
		]
	})");
}

}  // namespace

TEST(ParseYtDlpJson, MapsMetadataAndFormats) {
	auto info = parse_ytdlp_json(sample_dump().dump());
	ASSERT_TRUE(info) << info.error().message();

	const auto &m = info.value();
	EXPECT_EQ(m.id, "abc123");
	EXPECT_EQ(m.title, "Sample Video");
	EXPECT_EQ(m.publisher, "Sample Channel");
	EXPECT_EQ(m.webpage_url, "https://www.youtube.com/watch?v=abc123");

	// The storyboard and the HLS entry are not downloadable over plain HTTP.
	ASSERT_EQ(m.streams.size(), 3u);

	const auto &audio = m.streams[0];
	EXPECT_EQ(audio.kind, StreamKind::audio_only);
	EXPECT_EQ(audio.format_id, "140");
	EXPECT_EQ(audio.container, "m4a");
	EXPECT_DOUBLE_EQ(audio.bitrate_kbps, 129.5);
	EXPECT_EQ(audio.size_estimate, 3400000);
	EXPECT_EQ(audio.http_headers.at("User-Agent"), "UA");
	EXPECT_EQ(audio.http_headers.size(), 2u);

	const auto &video = m.streams[1];
	EXPECT_EQ(video.kind, StreamKind::video_only);
	EXPECT_EQ(video.locator, "https://cdn.example.com/137");
	EXPECT_EQ(video.width, 1920);
	EXPECT_EQ(video.height, 1080);
	EXPECT_DOUBLE_EQ(video.bitrate_kbps, 4400.2);
	EXPECT_EQ(video.size_estimate, 55000000);

	EXPECT_EQ(m.streams[2].kind, StreamKind::combined);
	EXPECT_EQ(m.streams[2].format_id, "18");
}

TEST(ParseYtDlpJson, PublisherFallsBackToUploader) {
	auto dump = sample_dump();
	dump.erase("channel");
	auto info = parse_ytdlp_json(dump.dump());
	ASSERT_TRUE(info);
	EXPECT_EQ(info.value().publisher, "someone-else");

	dump.erase("uploader");
	dump["uploader_id"] = "@handle";
	info = parse_ytdlp_json(dump.dump());
	ASSERT_TRUE(info);
	EXPECT_EQ(info.value().publisher, "@handle");
}

TEST(ParseYtDlpJson, SingleFormatAtTopLevel) {
	auto info = parse_ytdlp_json(R"({
		"id": "x", "title": "Direct", "uploader": "Site",
		"url": "http://media.example.com/file.webm", "ext": "webm"
	})");
	ASSERT_TRUE(info);
	ASSERT_EQ(info.value().streams.size(), 1u);
	const auto &s = info.value().streams[0];
	EXPECT_EQ(s.kind, StreamKind::combined);
	EXPECT_EQ(s.container, "webm");
	EXPECT_EQ(s.bitrate_kbps, 0.0);
}

TEST(ParseYtDlpJson, NullFieldsAreIgnored) {
	auto info = parse_ytdlp_json(R"({
		"id": "x", "title": null, "channel": null, "uploader": "Up",
		"formats": [{"format_id": "1", "url": "https://a/b", "width": null,
					 "height": 720, "tbr": null, "abr": 64, "vbr": 900}]
	})");
	ASSERT_TRUE(info);
	EXPECT_EQ(info.value().title, "");
	EXPECT_EQ(info.value().publisher, "Up");
	ASSERT_EQ(info.value().streams.size(), 1u);
	EXPECT_EQ(info.value().streams[0].width, 0);
	EXPECT_EQ(info.value().streams[0].height, 720);
	EXPECT_DOUBLE_EQ(info.value().streams[0].bitrate_kbps, 964.0);
}

TEST(ParseYtDlpJson, MalformedInputIsContentUnavailable) {
	for (const char *text : {"", "{", "[1, 2, 3]", "\"just a string\""}) {
		auto info = parse_ytdlp_json(text);
		ASSERT_FALSE(info) << text;
		EXPECT_EQ(info.error(), errc::content_unavailable);
	}
}

TEST(ClassifyYtDlpFailure, MapsKnownMessages) {
	EXPECT_EQ(classify_ytdlp_failure(
				  "ERROR: Unsupported URL: https://example.com/"),
			  errc::invalid_url);
	EXPECT_EQ(classify_ytdlp_failure(
				  "ERROR: [youtube] abc: Video unavailable. This video has "
				  "been removed by the uploader"),
			  errc::content_unavailable);
	EXPECT_EQ(classify_ytdlp_failure("ERROR: [youtube] abc: Private video."),
			  errc::content_unavailable);
	EXPECT_EQ(classify_ytdlp_failure(
				  "ERROR: Unable to download webpage: <urlopen error "
				  "[Errno -3] Temporary failure in name resolution>"),
			  errc::network_error);
	EXPECT_EQ(classify_ytdlp_failure("ERROR: HTTP Error 503"),
			  errc::network_error);
	EXPECT_EQ(classify_ytdlp_failure("something odd happened"),
			  errc::content_unavailable);
}

TEST(ResolverTool, MissingToolFailsCleanly) {
	YtDlpResolver resolver("/nonexistent/yt-dlp");
	EXPECT_FALSE(resolver.available());
	auto info = resolver.resolve("https://example.com/", CancellationToken{});
	ASSERT_FALSE(info);
	EXPECT_EQ(info.error(), errc::tool_missing);
	EXPECT_TRUE(info.error() == failure_kind::tool_missing);
}

class ResolverToolTest : public ::testing::Test {
   protected:
	// Stand-in yt-dlp that records its arguments and then runs body.
	YtDlpResolver make_resolver(const std::string &body) {
		auto tool = write_script(dir.path(), "yt-dlp",
								 "echo \"$@\" > '" + args_log().string() +
									 "'\n" + body);
		return YtDlpResolver(tool.string());
	}

	std::filesystem::path args_log() const { return dir.path() / "args.log"; }

	TempDir dir;
	CancellationToken token;
};

TEST_F(ResolverToolTest, ParsesDumpFromStdout) {
	auto resolver = make_resolver("cat <<'DUMP'\n" + sample_dump().dump() +
								  "\nDUMP\n");
	ASSERT_TRUE(resolver.available());

	auto info = resolver.resolve("https://www.youtube.com/watch?v=abc123", token);
	ASSERT_TRUE(info) << info.error().message();
	EXPECT_EQ(info.value().title, "Sample Video");
	EXPECT_EQ(info.value().publisher, "Sample Channel");
	ASSERT_EQ(info.value().streams.size(), 3u);
	EXPECT_EQ(info.value().streams[1].format_id, "137");

	auto args = read_file(args_log());
	EXPECT_NE(args.find("--dump-single-json --no-playlist --no-warnings -- "
						"https://www.youtube.com/watch?v=abc123"),
			  std::string::npos);
}

TEST_F(ResolverToolTest, MissingPageUrlFallsBackToInput) {
	auto resolver = make_resolver(
		"echo '{\"id\": \"x\", \"title\": \"T\", "
		"\"url\": \"https://media.example.com/x.mp4\", \"ext\": \"mp4\"}'\n");
	auto info = resolver.resolve("https://example.com/page", token);
	ASSERT_TRUE(info) << info.error().message();
	EXPECT_EQ(info.value().webpage_url, "https://example.com/page");
	ASSERT_EQ(info.value().streams.size(), 1u);
}

TEST_F(ResolverToolTest, PrivateVideoIsContentUnavailable) {
	auto resolver = make_resolver(
		"echo 'WARNING: [youtube] some notice' >&2\n"
		"echo 'ERROR: [youtube] abc123: Private video. Sign in if you have "
		"access' >&2\n"
		"exit 1\n");
	auto info = resolver.resolve("https://www.youtube.com/watch?v=abc123", token);
	ASSERT_FALSE(info);
	EXPECT_EQ(info.error(), errc::content_unavailable);
}

TEST_F(ResolverToolTest, UnsupportedUrlIsInvalidUrl) {
	auto resolver = make_resolver(
		"echo 'ERROR: Unsupported URL: https://example.com/' >&2\nexit 1\n");
	auto info = resolver.resolve("https://example.com/", token);
	ASSERT_FALSE(info);
	EXPECT_EQ(info.error(), errc::invalid_url);
}

TEST_F(ResolverToolTest, GarbageOutputIsContentUnavailable) {
	auto resolver = make_resolver("echo 'this is not json'\n");
	auto info = resolver.resolve("https://example.com/", token);
	ASSERT_FALSE(info);
	EXPECT_EQ(info.error(), errc::content_unavailable);
}

TEST_F(ResolverToolTest, CancelStopsTool) {
	auto resolver = make_resolver("exec sleep 30\n");

	auto started = std::chrono::steady_clock::now();
	std::thread canceller([this] {
		std::this_thread::sleep_for(std::chrono::milliseconds(200));
		token.request_cancel();
	});
	auto info = resolver.resolve("https://example.com/", token);
	canceller.join();

	ASSERT_FALSE(info);
	EXPECT_EQ(info.error(), errc::cancelled);
	EXPECT_LT(std::chrono::steady_clock::now() - started,
			  std::chrono::seconds(10));
}

TEST(JsonValue, PathsAndTypes) {
	auto j = sample_dump();
	EXPECT_EQ(utils::json_value<std::string>(j, {"formats", 1, "format_id"}),
			  "140");
	EXPECT_EQ(utils::json_value<std::string>(j, {"formats", -1, "format_id"}),
			  "hls-720");
	EXPECT_FALSE(utils::json_value<std::string>(j, {"formats", 99, "url"}));
	EXPECT_FALSE(utils::json_value<int>(j, {"title"}));
	EXPECT_FALSE(utils::json_value<std::string>(j, {"missing"}));
}

TEST(ParseInteger, RequiresWholeInput) {
	auto n = utils::parse_integer("12345");
	ASSERT_TRUE(n);
	EXPECT_EQ(n.value(), 12345);
	EXPECT_FALSE(utils::parse_integer("12abc"));
	EXPECT_FALSE(utils::parse_integer(""));
	EXPECT_FALSE(utils::parse_integer("-"));
}
