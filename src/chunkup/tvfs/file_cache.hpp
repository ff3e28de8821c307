#ifndef CHUNKUP_TVFS_FILE_CACHE_HPP
#define CHUNKUP_TVFS_FILE_CACHE_HPP

#include <map>
#include <optional>
#include <string>

#include <libfilezilla/mutex.hpp>
#include <libfilezilla/time.hpp>

#include "../util/filesystem.hpp"

namespace chunkup::tvfs {

struct file_metadata
{
	std::int64_t size{-1};
	std::string mimetype;
	std::string etag;
	fz::datetime mtime;
};

/// \brief Storage-layer metadata of the files the engine has written, keyed by tvfs path.
class file_cache
{
public:
	/// \brief Records the new size, etag and modification time of the file, re-detecting its mimetype.
	file_metadata update(const util::fs::absolute_unix_path &path, std::int64_t size, std::string etag, fz::datetime mtime = fz::datetime::now());

	/// \brief Forgets the given path and everything below it.
	void remove(const util::fs::absolute_unix_path &path);

	/// \brief Moves the metadata of \c from, and of everything below it, to \c to.
	void move(const util::fs::absolute_unix_path &from, const util::fs::absolute_unix_path &to);

	std::optional<file_metadata> get(const util::fs::absolute_unix_path &path) const;

	static std::string_view mime_from_name(std::string_view name);

private:
	mutable fz::mutex mutex_;
	std::map<std::string, file_metadata, std::less<>> entries_;
};

}

#endif // CHUNKUP_TVFS_FILE_CACHE_HPP
