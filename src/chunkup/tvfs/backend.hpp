#ifndef CHUNKUP_TVFS_BACKEND_HPP
#define CHUNKUP_TVFS_BACKEND_HPP

#include <memory>
#include <string_view>
#include <vector>

#include <libfilezilla/fsresult.hpp>

#include "../util/filesystem.hpp"
#include "entry.hpp"
#include "reader.hpp"

namespace chunkup::upload {

class chunked_file_write;

}

namespace chunkup::tvfs {

/// \brief A storage location the tvfs engine mounts.
/// All paths are absolute unix paths relative to the root of the storage itself.
class backend
{
public:
	virtual ~backend() = default;

	/// \brief A name for the storage, used in logs.
	virtual std::string_view name() const = 0;

	virtual fz::result info(const util::fs::absolute_unix_path &path, entry &out) = 0;
	virtual fz::result list(const util::fs::absolute_unix_path &path, std::vector<entry> &out) = 0;
	virtual fz::result mkdir(const util::fs::absolute_unix_path &path) = 0;
	virtual fz::result open_reader(const util::fs::absolute_unix_path &path, std::unique_ptr<reader> &out) = 0;

	/// \brief Replaces the content of the file at \c path with the content of \c data, atomically.
	/// The file is created if it doesn't exist yet; its parent directory must exist.
	virtual fz::result write(const util::fs::absolute_unix_path &path, reader &data, std::int64_t &written) = 0;

	/// \brief Renames \c from into \c to. An existing file at \c to is replaced.
	virtual fz::result rename(const util::fs::absolute_unix_path &from, const util::fs::absolute_unix_path &to) = 0;
	virtual fz::result remove_file(const util::fs::absolute_unix_path &path) = 0;
	virtual fz::result remove_directory(const util::fs::absolute_unix_path &path, bool recursive) = 0;

	/// \brief Capability query for chunked writes.
	/// \returns the storage's implementation of the chunked-write contract, or nullptr if the storage doesn't support it.
	virtual upload::chunked_file_write *chunked_file_write()
	{
		return nullptr;
	}
};

}

#endif // CHUNKUP_TVFS_BACKEND_HPP
