#pragma once

#include <boost/charconv.hpp>
#include <cstddef>
#include <initializer_list>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vidstash/result.hpp>

namespace vidstash::utils {

// Whole-string decimal integer, as found in Content-Length and
// Content-Range headers.
inline Result<long long> parse_integer(std::string_view text) {
	long long value = 0;
	const char *end = text.data() + text.size();
	auto res = boost::charconv::from_chars(text.data(), end, value);
	if (text.empty() || res.ec != std::errc{} || res.ptr != end) {
		return std::make_error_code(std::errc::invalid_argument);
	}
	return value;
}

// One step of a JSON lookup: an object member or an array element.
// Negative indices count from the back.
struct JsonKey {
	JsonKey(const char *member) : name(member) {}
	JsonKey(int element) : index(element), by_index(true) {}

	const char *name = nullptr;
	int index = 0;
	bool by_index = false;
};

inline const nlohmann::json *find_path(const nlohmann::json &root,
									   std::initializer_list<JsonKey> path) {
	const nlohmann::json *node = &root;
	for (const auto &key : path) {
		if (key.by_index) {
			if (!node->is_array()) return nullptr;
			auto size = static_cast<int>(node->size());
			int i = key.index < 0 ? key.index + size : key.index;
			if (i < 0 || i >= size) return nullptr;
			node = &(*node)[static_cast<std::size_t>(i)];
		} else {
			if (!node->is_object()) return nullptr;
			auto it = node->find(key.name);
			if (it == node->end()) return nullptr;
			node = &*it;
		}
	}
	return node;
}

/// Value at path as T. Missing, null and wrongly typed values are all
/// nullopt.
///
///   auto height = json_value<int>(format, {"height"});
///   auto first = json_value<std::string>(info, {"formats", 0, "url"});
template <typename T>
std::optional<T> json_value(const nlohmann::json &root,
							std::initializer_list<JsonKey> path) {
	const auto *node = find_path(root, path);
	if (!node || node->is_null()) return std::nullopt;
	try {
		return node->get<T>();
	} catch (const nlohmann::json::type_error &) {
		return std::nullopt;
	}
}

template <typename T>
T json_value_or(const nlohmann::json &root,
				std::initializer_list<JsonKey> path, T fallback) {
	return json_value<T>(root, path).value_or(std::move(fallback));
}

/// First non-empty string among several top-level members.
inline std::optional<std::string> first_string(
	const nlohmann::json &root, std::initializer_list<const char *> members) {
	for (const char *member : members) {
		auto v = json_value<std::string>(root, {member});
		if (v && !v->empty()) return v;
	}
	return std::nullopt;
}

}  // namespace vidstash::utils
