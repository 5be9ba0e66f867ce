#pragma once

#include <vidstash/vidstash_export.h>

#include <boost/outcome.hpp>
#include <system_error>

namespace vidstash {

namespace outcome = boost::outcome_v2;

enum class errc {
	success = 0,
	// Input
	invalid_input = 10,

	// Resolution
	invalid_url = 20,
	content_unavailable,
	no_suitable_stream,

	// Transfer
	network_error = 30,
	interrupted,
	timed_out,

	// Local storage
	disk_full = 40,
	io_error,
	path_conflict,

	// External tools
	tool_missing = 50,
	encode_error,

	cancelled = 60,

	unknown = 100
};

// User-facing failure kinds. Every errc value compares equal to exactly one
// of these through std::error_condition.
enum class failure_kind {
	none = 0,
	invalid_input,
	resolution_failed,
	network_error,
	storage_error,
	tool_missing,
	encode_error,
	cancelled,
	internal
};

VIDSTASH_EXPORT const std::error_category &vidstash_category();
VIDSTASH_EXPORT const std::error_category &failure_kind_category();

VIDSTASH_EXPORT std::error_code make_error_code(errc e);
VIDSTASH_EXPORT std::error_condition make_error_condition(failure_kind k);

/// Kind of a code from any category; codes outside vidstash map to internal.
VIDSTASH_EXPORT failure_kind kind_of(const std::error_code &ec);

}  // namespace vidstash

namespace std {
template <>
struct is_error_code_enum<vidstash::errc> : true_type {};

template <>
struct is_error_condition_enum<vidstash::failure_kind> : true_type {};
}  // namespace std

namespace vidstash {
template <typename T>
using Result = outcome::result<T, std::error_code>;
}  // namespace vidstash
