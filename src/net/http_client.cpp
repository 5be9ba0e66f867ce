#include "net/http_client.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/certify/extensions.hpp>
#include <boost/certify/https_verification.hpp>
#include <boost/url.hpp>
#include <cerrno>
#include <chrono>
#include <fstream>
#include <mutex>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "fs_utils.hpp"
#include "utils.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace vidstash::net {

namespace {

constexpr auto kIoTimeout = std::chrono::seconds(30);
constexpr auto kShutdownTimeout = std::chrono::seconds(2);
// How often a blocked transfer looks at its cancellation token.
constexpr auto kPollInterval = std::chrono::milliseconds(100);

// Endpoints of recently resolved hosts, shared by every download in the
// process. Each ranged GET of a large file would otherwise resolve again.
class EndpointCache {
   public:
	static constexpr auto kLifetime = std::chrono::minutes(5);
	static constexpr std::size_t kCapacity = 64;

	static EndpointCache &instance() {
		static EndpointCache cache;
		return cache;
	}

	std::optional<tcp::resolver::results_type> lookup(const std::string &key) {
		std::lock_guard<std::mutex> lk(mutex_);
		auto found = entries_.find(key);
		if (found == entries_.end()) return std::nullopt;
		if (found->second.first < std::chrono::steady_clock::now()) {
			entries_.erase(found);
			return std::nullopt;
		}
		return found->second.second;
	}

	void store(const std::string &key, tcp::resolver::results_type results) {
		std::lock_guard<std::mutex> lk(mutex_);
		auto now = std::chrono::steady_clock::now();
		if (entries_.size() >= kCapacity) {
			// Drop stale entries; when none are stale, start over.
			for (auto it = entries_.begin(); it != entries_.end();) {
				if (it->second.first < now) {
					it = entries_.erase(it);
				} else {
					++it;
				}
			}
			if (entries_.size() >= kCapacity) entries_.clear();
		}
		entries_[key] = {now + kLifetime, std::move(results)};
	}

	void forget(const std::string &key) {
		std::lock_guard<std::mutex> lk(mutex_);
		entries_.erase(key);
	}

   private:
	std::mutex mutex_;
	std::unordered_map<
		std::string,
		std::pair<std::chrono::steady_clock::time_point,
				  tcp::resolver::results_type>>
		entries_;
};

struct Target {
	bool tls = false;
	std::string host;
	std::string port;
	std::string host_header;
	std::string path;
};

Result<Target> parse_target(const std::string &url) {
	auto u_res = boost::urls::parse_uri(url);
	if (u_res.has_error()) return outcome::failure(errc::invalid_url);
	boost::urls::url_view u = u_res.value();

	Target t;
	if (u.scheme() == "https") {
		t.tls = true;
	} else if (u.scheme() != "http") {
		return outcome::failure(errc::invalid_url);
	}

	t.host = u.host();
	if (t.host.empty()) return outcome::failure(errc::invalid_url);
	t.port = std::string(u.port());
	t.host_header = t.host;
	if (t.port.empty()) {
		t.port = t.tls ? "443" : "80";
	} else {
		t.host_header += ":" + t.port;
	}

	t.path = std::string(u.encoded_path());
	if (t.path.empty()) t.path = "/";
	if (u.has_query()) {
		t.path += "?";
		t.path += std::string(u.encoded_query());
	}
	return t;
}

std::optional<long long> content_length(const http::fields &fields) {
	auto it = fields.find(http::field::content_length);
	if (it == fields.end()) return std::nullopt;
	auto len = utils::parse_integer(
		std::string_view(it->value().data(), it->value().size()));
	if (len) return len.value();
	return std::nullopt;
}

// Total from "bytes <first>-<last>/<total>"; nullopt for "/*".
std::optional<long long> range_total(const http::fields &fields) {
	auto it = fields.find(http::field::content_range);
	if (it == fields.end()) return std::nullopt;
	std::string_view cr(it->value().data(), it->value().size());
	auto slash_pos = cr.find('/');
	if (slash_pos == std::string_view::npos) return std::nullopt;
	auto len = utils::parse_integer(cr.substr(slash_pos + 1));
	if (len) return len.value();
	return std::nullopt;
}

// One download over plain TCP or TLS: HEAD for the size, then ranged GETs
// on a kept-alive connection, reconnecting when the server closes it.
template <class Stream>
class RangeDownload {
   public:
	static constexpr bool kTls = !std::is_same_v<Stream, beast::tcp_stream>;

	static constexpr long long kChunkSize = 2 * 1024 * 1024;
	static constexpr std::size_t kReadBufferSize = 256 * 1024;

	RangeDownload(ssl::context &ctx, const Target &target,
				  const std::map<std::string, std::string> &headers,
				  const CancellationToken &cancel,
				  const ProgressCallback &progress_cb, std::ofstream &out)
		: ctx_(ctx),
		  target_(target),
		  headers_(headers),
		  cancel_(cancel),
		  progress_cb_(progress_cb),
		  out_(out) {}

	Result<void> run() {
		if (auto r = connect(); r.has_error()) return r;
		if (auto r = probe_size(); r.has_error()) return r;

		bool finished = false;
		while (!finished &&
			   (total_size_ < 0 || current_offset_ < total_size_)) {
			if (auto r = fetch_chunk(finished); r.has_error()) return r;
		}
		close();
		spdlog::debug("Fetched {} bytes from {}", current_offset_,
					  target_.host);
		return outcome::success();
	}

   private:
	asio::io_context ioc_;
	ssl::context &ctx_;
	const Target &target_;
	const std::map<std::string, std::string> &headers_;
	const CancellationToken &cancel_;
	const ProgressCallback &progress_cb_;
	std::ofstream &out_;

	std::unique_ptr<Stream> stream_;
	bool connected_ = false;
	beast::flat_buffer buffer_;
	std::vector<char> buf_ = std::vector<char>(kReadBufferSize);
	long long total_size_ = -1;
	long long current_offset_ = 0;

	// Run the context until done is set. On cancellation the pending
	// operation is aborted and drained before returning.
	template <class OnCancel>
	Result<void> wait(const bool &done, OnCancel &&on_cancel) {
		ioc_.restart();
		while (!done) {
			if (cancel_.is_cancelled()) {
				on_cancel();
				ioc_.restart();
				ioc_.run();
				return outcome::failure(errc::interrupted);
			}
			ioc_.run_for(kPollInterval);
			if (ioc_.stopped() && !done) ioc_.restart();
		}
		return outcome::success();
	}

	void cancel_io() { beast::get_lowest_layer(*stream_).cancel(); }

	std::string endpoint_key() const {
		return target_.host + ":" + target_.port;
	}

	Result<void> fail(const beast::error_code &ec, const char *what) const {
		spdlog::warn("HTTP {} to {}:{} failed: {}", what, target_.host,
					 target_.port, ec.message());
		return outcome::failure(errc::network_error);
	}

	std::unique_ptr<Stream> make_stream() {
		if constexpr (kTls) {
			return std::make_unique<Stream>(ioc_, ctx_);
		} else {
			return std::make_unique<Stream>(ioc_);
		}
	}

	Result<void> connect() {
		stream_ = make_stream();
		buffer_.clear();
		beast::error_code ec;
		bool done = false;

		tcp::resolver::results_type results;
		if (auto cached = EndpointCache::instance().lookup(endpoint_key())) {
			results = *cached;
		} else {
			tcp::resolver resolver(ioc_);
			resolver.async_resolve(
				target_.host, target_.port,
				[&](beast::error_code e, tcp::resolver::results_type r) {
					ec = e;
					results = std::move(r);
					done = true;
				});
			if (auto r = wait(done, [&] { resolver.cancel(); });
				r.has_error())
				return r;
			if (ec) return fail(ec, "resolve");
			EndpointCache::instance().store(endpoint_key(), results);
		}

		auto &lowest = beast::get_lowest_layer(*stream_);
		lowest.expires_after(kIoTimeout);
		done = false;
		lowest.async_connect(results,
							 [&](beast::error_code e, const tcp::endpoint &) {
								 ec = e;
								 done = true;
							 });
		if (auto r = wait(done, [this] { cancel_io(); }); r.has_error())
			return r;
		if (ec) {
			EndpointCache::instance().forget(endpoint_key());
			return fail(ec, "connect");
		}

		if constexpr (kTls) {
			boost::certify::set_server_hostname(*stream_, target_.host);
			done = false;
			stream_->async_handshake(ssl::stream_base::client,
									 [&](beast::error_code e) {
										 ec = e;
										 done = true;
									 });
			if (auto r = wait(done, [this] { cancel_io(); }); r.has_error())
				return r;
			if (ec) return fail(ec, "handshake");
		}

		connected_ = true;
		return outcome::success();
	}

	void close() {
		if (!stream_) return;
		beast::error_code ec;
		if (connected_) {
			if constexpr (kTls) {
				bool done = false;
				beast::get_lowest_layer(*stream_).expires_after(
					kShutdownTimeout);
				stream_->async_shutdown([&](beast::error_code e) {
					ec = e;
					done = true;
				});
				auto r = wait(done, [this] { cancel_io(); });
				// Many servers drop the connection instead of answering
				// close_notify.
				if (r.has_error() || ec) {
					spdlog::debug("TLS shutdown with {} incomplete: {}",
								  target_.host,
								  r.has_error() ? r.error().message()
												: ec.message());
				}
			}
			beast::get_lowest_layer(*stream_).socket().shutdown(
				tcp::socket::shutdown_both, ec);
		}
		connected_ = false;
		stream_.reset();
	}

	http::request<http::empty_body> make_request(http::verb method) const {
		http::request<http::empty_body> req{method, target_.path, 11};
		req.set(http::field::host, target_.host_header);
		req.set(http::field::user_agent, "vidstash/1.0");
		req.set(http::field::accept, "*/*");
		req.keep_alive(true);
		for (const auto &[key, value] : headers_) req.set(key, value);
		return req;
	}

	Result<void> send(http::request<http::empty_body> &req) {
		beast::error_code ec;
		bool done = false;
		beast::get_lowest_layer(*stream_).expires_after(kIoTimeout);
		http::async_write(*stream_, req,
						  [&](beast::error_code e, std::size_t) {
							  ec = e;
							  done = true;
						  });
		if (auto r = wait(done, [this] { cancel_io(); }); r.has_error())
			return r;
		if (ec) return fail(ec, "write");
		return outcome::success();
	}

	Result<void> probe_size() {
		auto req = make_request(http::verb::head);
		if (auto r = send(req); r.has_error()) return r;

		http::response_parser<http::empty_body> head;
		head.skip(true);
		beast::error_code ec;
		bool done = false;
		http::async_read(*stream_, buffer_, head,
						 [&](beast::error_code e, std::size_t) {
							 ec = e;
							 done = true;
						 });
		if (auto r = wait(done, [this] { cancel_io(); }); r.has_error())
			return r;

		// The size is only a hint; the ranged GETs work without it.
		if (ec) {
			spdlog::warn("HEAD request to {} failed: {}", target_.host,
						 ec.message());
			close();
			return outcome::success();
		}
		if (head.get().result_int() == 200) {
			if (auto len = content_length(head.get())) total_size_ = *len;
		}
		if (!head.get().keep_alive()) close();
		return outcome::success();
	}

	Result<void> fetch_chunk(bool &finished) {
		if (!connected_) {
			if (auto r = connect(); r.has_error()) return r;
		}

		long long end = current_offset_ + kChunkSize - 1;
		if (total_size_ > 0) end = std::min(end, total_size_ - 1);
		auto req = make_request(http::verb::get);
		req.set(http::field::range,
				fmt::format("bytes={}-{}", current_offset_, end));
		if (auto r = send(req); r.has_error()) return r;

		http::response_parser<http::buffer_body> parser;
		parser.body_limit(boost::none);
		beast::error_code ec;
		bool done = false;
		http::async_read_header(*stream_, buffer_, parser,
								[&](beast::error_code e, std::size_t) {
									ec = e;
									done = true;
								});
		if (auto r = wait(done, [this] { cancel_io(); }); r.has_error())
			return r;
		if (ec) return fail(ec, "read_header");

		bool full_body = false;
		int status = parser.get().result_int();
		if (status == 200) {
			// Range ignored, the whole resource follows.
			full_body = true;
			current_offset_ = 0;
			out_.seekp(0);
			total_size_ = content_length(parser.get()).value_or(-1);
		} else if (status == 206) {
			if (auto total = range_total(parser.get())) total_size_ = *total;
		} else if (status == 416 && total_size_ < 0 && current_offset_ > 0) {
			// Size unknown and the previous chunk ended exactly at EOF.
			finished = true;
			close();
			return outcome::success();
		} else {
			spdlog::warn("GET {} returned status {}", target_.host, status);
			return outcome::failure(errc::network_error);
		}

		long long chunk_bytes = 0;
		while (!parser.is_done()) {
			parser.get().body().data = buf_.data();
			parser.get().body().size = buf_.size();
			beast::get_lowest_layer(*stream_).expires_after(kIoTimeout);
			done = false;
			http::async_read(*stream_, buffer_, parser,
							 [&](beast::error_code e, std::size_t) {
								 ec = e;
								 done = true;
							 });
			if (auto r = wait(done, [this] { cancel_io(); }); r.has_error())
				return r;
			if (ec == http::error::need_buffer) ec = {};
			if (ec) return fail(ec, "read_body");

			auto bytes_read = buf_.size() - parser.get().body().size;
			if (bytes_read == 0) continue;
			out_.write(buf_.data(), static_cast<std::streamsize>(bytes_read));
			if (!out_) {
				int err = errno;
				spdlog::error("Write failed after {} bytes", current_offset_);
				return utils::storage_error_from_errno(err);
			}
			current_offset_ += static_cast<long long>(bytes_read);
			chunk_bytes += static_cast<long long>(bytes_read);
			if (progress_cb_) {
				progress_cb_(current_offset_,
							 total_size_ > 0 ? total_size_ : 0);
			}
		}

		if (full_body) {
			finished = true;
		} else if (chunk_bytes == 0) {
			spdlog::warn("Empty range response from {} at offset {}",
						 target_.host, current_offset_);
			return outcome::failure(errc::network_error);
		} else if (total_size_ < 0 && chunk_bytes < kChunkSize) {
			finished = true;
		}

		if (!parser.get().keep_alive()) close();
		return outcome::success();
	}
};

}  // namespace

struct HttpClient::Impl {
	ssl::context tls{ssl::context::tlsv12_client};

	Impl() {
		boost::system::error_code ec;
		tls.set_verify_mode(ssl::verify_peer | ssl::verify_fail_if_no_peer_cert,
							ec);
		if (!ec) tls.set_default_verify_paths(ec);
		if (ec) {
			spdlog::error("TLS certificate verification setup failed: {}",
						  ec.message());
		}
		boost::certify::enable_native_https_server_verification(tls);
	}
};

HttpClient::HttpClient() : m_impl(std::make_unique<Impl>()) {}

HttpClient::~HttpClient() = default;
HttpClient::HttpClient(HttpClient &&) noexcept = default;
HttpClient &HttpClient::operator=(HttpClient &&) noexcept = default;

Result<void> HttpClient::download_file(
	const std::string &url, const std::filesystem::path &output_path,
	const std::map<std::string, std::string> &headers,
	const CancellationToken &cancel, ProgressCallback progress_cb) {
	auto target = parse_target(url);
	if (target.has_error()) {
		spdlog::error("Cannot download from malformed URL");
		return target.error();
	}

	std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
	if (!out.is_open()) {
		int err = errno;
		spdlog::error("Cannot open {} for writing", output_path.string());
		return utils::storage_error_from_errno(err);
	}

	Result<void> res = outcome::success();
	try {
		if (target.value().tls) {
			RangeDownload<beast::ssl_stream<beast::tcp_stream>> dl(
				m_impl->tls, target.value(), headers, cancel, progress_cb,
				out);
			res = dl.run();
		} else {
			RangeDownload<beast::tcp_stream> dl(m_impl->tls, target.value(),
												headers, cancel, progress_cb,
												out);
			res = dl.run();
		}
	} catch (const std::exception &e) {
		spdlog::error("Download from {} failed: {}", target.value().host,
					  e.what());
		res = make_error_code(errc::network_error);
	}

	out.close();
	if (res.has_value() && out.fail()) {
		int err = errno;
		spdlog::error("Could not finish writing {}", output_path.string());
		return utils::storage_error_from_errno(err);
	}
	return res;
}

}  // namespace vidstash::net
