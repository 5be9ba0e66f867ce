#include <string>
#include <vidstash/result.hpp>

namespace vidstash {

namespace {

failure_kind classify(errc e) {
	switch (e) {
		case errc::success: return failure_kind::none;
		case errc::invalid_input: return failure_kind::invalid_input;
		case errc::invalid_url:
		case errc::content_unavailable:
		case errc::no_suitable_stream: return failure_kind::resolution_failed;
		case errc::network_error:
		case errc::interrupted:
		case errc::timed_out: return failure_kind::network_error;
		case errc::disk_full:
		case errc::io_error:
		case errc::path_conflict: return failure_kind::storage_error;
		case errc::tool_missing: return failure_kind::tool_missing;
		case errc::encode_error: return failure_kind::encode_error;
		case errc::cancelled: return failure_kind::cancelled;
		default: return failure_kind::internal;
	}
}

struct vidstash_error_category : std::error_category {
	const char *name() const noexcept override { return "vidstash"; }

	std::string message(int ev) const override {
		switch (static_cast<errc>(ev)) {
			case errc::success: return "Success";
			case errc::invalid_input: return "Invalid input";
			case errc::invalid_url: return "Invalid URL";
			case errc::content_unavailable: return "Content unavailable";
			case errc::no_suitable_stream: return "No suitable stream";
			case errc::network_error: return "Network error";
			case errc::interrupted: return "Transfer interrupted";
			case errc::timed_out: return "Stage timed out";
			case errc::disk_full: return "Disk full";
			case errc::io_error: return "I/O error";
			case errc::path_conflict: return "Path conflict";
			case errc::tool_missing: return "External tool missing";
			case errc::encode_error: return "Encode error";
			case errc::cancelled: return "Cancelled";
			default: return "Unknown error";
		}
	}

	std::error_condition default_error_condition(
		int ev) const noexcept override {
		return make_error_condition(classify(static_cast<errc>(ev)));
	}
};

struct failure_kind_error_category : std::error_category {
	const char *name() const noexcept override { return "vidstash.kind"; }

	std::string message(int ev) const override {
		switch (static_cast<failure_kind>(ev)) {
			case failure_kind::none: return "none";
			case failure_kind::invalid_input: return "InvalidInput";
			case failure_kind::resolution_failed: return "ResolutionFailed";
			case failure_kind::network_error: return "NetworkError";
			case failure_kind::storage_error: return "IOError";
			case failure_kind::tool_missing: return "ToolMissing";
			case failure_kind::encode_error: return "EncodeError";
			case failure_kind::cancelled: return "Cancelled";
			default: return "Internal";
		}
	}
};

}  // namespace

const std::error_category &vidstash_category() {
	static vidstash_error_category category;
	return category;
}

const std::error_category &failure_kind_category() {
	static failure_kind_error_category category;
	return category;
}

std::error_code make_error_code(errc e) {
	return {static_cast<int>(e), vidstash_category()};
}

std::error_condition make_error_condition(failure_kind k) {
	return {static_cast<int>(k), failure_kind_category()};
}

failure_kind kind_of(const std::error_code &ec) {
	if (!ec) return failure_kind::none;
	if (ec.category() == vidstash_category()) {
		return classify(static_cast<errc>(ec.value()));
	}
	return failure_kind::internal;
}

}  // namespace vidstash
