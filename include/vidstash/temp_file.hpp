#pragma once

#include <vidstash/vidstash_export.h>

#include <filesystem>
#include <string_view>
#include <vidstash/result.hpp>

namespace vidstash {

// Owns a path on disk and removes it when destroyed unless released.
// The file itself is created by whoever writes to path().
class VIDSTASH_EXPORT TempFile {
   public:
	TempFile() = default;
	explicit TempFile(std::filesystem::path path);
	~TempFile();

	TempFile(const TempFile &) = delete;
	TempFile &operator=(const TempFile &) = delete;
	TempFile(TempFile &&other) noexcept;
	TempFile &operator=(TempFile &&other) noexcept;

	[[nodiscard]] const std::filesystem::path &path() const { return path_; }
	[[nodiscard]] bool owns() const { return owned_; }

	/// Give up ownership; the file is left where it is.
	std::filesystem::path release();

	/// Remove the file now.
	void reset() noexcept;

   private:
	std::filesystem::path path_;
	bool owned_ = false;
};

// Private scratch directory, removed recursively on destruction.
class VIDSTASH_EXPORT ScopedTempDir {
   public:
	/// Create <parent>/<prefix>-<random>. Parent directories are created
	/// as needed.
	static Result<ScopedTempDir> create(const std::filesystem::path &parent,
										std::string_view prefix);

	ScopedTempDir() = default;
	~ScopedTempDir();

	ScopedTempDir(const ScopedTempDir &) = delete;
	ScopedTempDir &operator=(const ScopedTempDir &) = delete;
	ScopedTempDir(ScopedTempDir &&other) noexcept;
	ScopedTempDir &operator=(ScopedTempDir &&other) noexcept;

	[[nodiscard]] const std::filesystem::path &path() const { return path_; }

	void reset() noexcept;

   private:
	explicit ScopedTempDir(std::filesystem::path path);

	std::filesystem::path path_;
};

}  // namespace vidstash
