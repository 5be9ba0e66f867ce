#pragma once

#include <vidstash/vidstash_export.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string_view>
#include <vidstash/result.hpp>
#include <vidstash/types.hpp>

namespace vidstash {

// Files finished artifacts under <root>/<publisher>/<title>.<ext>.
// Safe to share between workers.
class VIDSTASH_EXPORT Organizer {
   public:
	Organizer(const Organizer &) = delete;
	Organizer &operator=(const Organizer &) = delete;
	Organizer(Organizer &&) noexcept;
	Organizer &operator=(Organizer &&) noexcept;
	~Organizer();

	explicit Organizer(std::filesystem::path output_root,
					   std::size_t max_component_length = 120,
					   bool restrict_to_ascii = false);

	/// Sanitized destination for a resolved item.
	[[nodiscard]] Destination destination_for(const MediaInfo &info,
											  std::string_view ext) const;

	/// Move artifact into place. An existing file is never overwritten,
	/// including one created by another process while placing; the name
	/// gets " (2)", " (3)", ... instead.
	Result<std::filesystem::path> place(const std::filesystem::path &artifact,
										const Destination &dest);

	[[nodiscard]] const std::filesystem::path &output_root() const;

   private:
	struct Impl;
	std::unique_ptr<Impl> m_impl;
};

}  // namespace vidstash
