#pragma once

#include <cerrno>
#include <system_error>
#include <vidstash/result.hpp>

namespace vidstash::utils {

// Map a filesystem failure onto the storage error codes.
inline std::error_code storage_error(const std::error_code &ec) {
	if (ec == std::errc::no_space_on_device) {
		return make_error_code(errc::disk_full);
	}
	return make_error_code(errc::io_error);
}

// Same, for a failed C or iostream write that left errno behind.
inline std::error_code storage_error_from_errno(int err = errno) {
	if (err == ENOSPC) return make_error_code(errc::disk_full);
	return make_error_code(errc::io_error);
}

}  // namespace vidstash::utils
