#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <boost/crc.hpp>
#include <boost/regex.hpp>
#include <cctype>
#include <vidstash/filename.hpp>

namespace vidstash {

namespace {

bool is_reserved_device_name(std::string_view name) {
	// Windows refuses these with any extension, case-insensitively.
	static const std::array<std::string_view, 22> kReserved = {
		"CON",	"PRN",	"AUX",	"NUL",	"COM1", "COM2", "COM3", "COM4",
		"COM5", "COM6", "COM7", "COM8", "COM9", "LPT1", "LPT2", "LPT3",
		"LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"};
	auto base = name.substr(0, name.find('.'));
	std::string upper(base);
	std::transform(upper.begin(), upper.end(), upper.begin(),
				   [](unsigned char c) { return std::toupper(c); });
	return std::find(kReserved.begin(), kReserved.end(), upper) !=
		   kReserved.end();
}

// Largest prefix length <= limit that does not split a UTF-8 sequence.
std::size_t utf8_boundary(std::string_view text, std::size_t limit) {
	if (limit >= text.size()) return text.size();
	while (limit > 0 &&
		   (static_cast<unsigned char>(text[limit]) & 0xC0) == 0x80) {
		--limit;
	}
	return limit;
}

void trim_trailing(std::string &s) {
	while (!s.empty() && (s.back() == ' ' || s.back() == '.')) s.pop_back();
}

}  // namespace

std::string sanitize_filename(std::string_view name, std::string_view fallback,
							  bool restrict_to_ascii) {
	std::string result;
	result.reserve(name.size());

	for (char c : name) {
		switch (c) {
			case '/':
			case '\\':
			case ':':
			case '*':
			case '?':
			case '"':
			case '<':
			case '>':
			case '|': result += '_'; break;
			case '\n':
			case '\r':
			case '\t': result += ' '; break;
			default: {
				auto uc = static_cast<unsigned char>(c);
				if (uc < 32 || uc == 127) {
					// other control characters are dropped
				} else if (restrict_to_ascii && uc > detail::MAX_ASCII) {
					result += '_';
				} else {
					result += c;
				}
				break;
			}
		}
	}

	static const boost::regex kSpaces(" {2,}");
	result = boost::regex_replace(result, kSpaces, " ");

	auto first = result.find_first_not_of(' ');
	result.erase(0, first == std::string::npos ? result.size() : first);
	trim_trailing(result);

	if (result.empty() || result == "." || result == "..") {
		return std::string(fallback);
	}
	if (is_reserved_device_name(result)) result.insert(0, "_");
	return result;
}

std::string sanitize_extension(std::string_view ext) {
	std::string result;
	for (char c : ext) {
		if (std::isalnum(static_cast<unsigned char>(c))) {
			result += static_cast<char>(
				std::tolower(static_cast<unsigned char>(c)));
		}
	}
	if (result.empty()) result = "bin";
	return result;
}

std::string short_hash(std::string_view text) {
	boost::crc_32_type crc;
	crc.process_bytes(text.data(), text.size());
	return fmt::format("{:08x}", crc.checksum());
}

std::string fit_component(std::string_view name, std::size_t max_bytes) {
	if (name.size() <= max_bytes) return std::string(name);
	auto hash = short_hash(name);
	if (max_bytes <= detail::HASH_SUFFIX_LENGTH) {
		return hash.substr(0, max_bytes);
	}

	std::string head(
		name.substr(0, utf8_boundary(
						   name, max_bytes - detail::HASH_SUFFIX_LENGTH)));
	trim_trailing(head);
	return head + "-" + hash;
}

std::string numbered_filename(std::string_view stem, unsigned n,
							  std::string_view ext, std::size_t max_bytes) {
	std::string suffix = n > 1 ? fmt::format(" ({})", n) : std::string();
	if (!ext.empty()) {
		suffix += '.';
		suffix += ext;
	}
	std::size_t budget =
		max_bytes > suffix.size() ? max_bytes - suffix.size() : 1;
	return fit_component(stem, budget) + suffix;
}

}  // namespace vidstash
