#pragma once

#include <vidstash/vidstash_export.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace vidstash {

namespace detail {
constexpr unsigned char MAX_ASCII = 127;
constexpr std::size_t HASH_SUFFIX_LENGTH = 9;  // "-" + 8 hex digits
}  // namespace detail

/// Make one path component safe on common filesystems: replaces
/// / \ : * ? " < > | and control characters, collapses whitespace, trims
/// leading spaces and trailing spaces/dots, and guards Windows device names.
/// Returns fallback when nothing usable is left.
VIDSTASH_EXPORT std::string sanitize_filename(std::string_view name,
											  std::string_view fallback,
											  bool restrict_to_ascii = false);

/// Lower-cased alphanumeric extension, "bin" when empty.
VIDSTASH_EXPORT std::string sanitize_extension(std::string_view ext);

/// 8 hex digits of the CRC-32 of text.
VIDSTASH_EXPORT std::string short_hash(std::string_view text);

/// Shorten name to at most max_bytes. Overlong names are cut on a UTF-8
/// boundary and get "-<short_hash(name)>" appended.
VIDSTASH_EXPORT std::string fit_component(std::string_view name,
										  std::size_t max_bytes);

/// "<stem>.<ext>" for n <= 1, "<stem> (n).<ext>" otherwise, with the stem
/// shortened so the whole name fits in max_bytes.
VIDSTASH_EXPORT std::string numbered_filename(std::string_view stem,
											  unsigned n,
											  std::string_view ext,
											  std::size_t max_bytes);

}  // namespace vidstash
