#ifndef CHUNKUP_UPLOAD_CHUNKED_FILE_WRITE_HPP
#define CHUNKUP_UPLOAD_CHUNKED_FILE_WRITE_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "../tvfs/reader.hpp"
#include "../util/filesystem.hpp"
#include "error.hpp"

namespace chunkup::upload {

/// \brief The contract a storage backend implements in order to take part in chunked uploads.
///
/// A transaction is opened by begin_chunked_file(), which hands out a token.
/// Parts are then staged, in any order and possibly concurrently, by put_chunked_file_part(),
/// and finally either assembled into the target by write_chunked_file() or dropped by cancel_chunked_file().
///
/// All paths are absolute paths within the backend's own storage.
class chunked_file_write
{
public:
	virtual ~chunked_file_write() = default;

	/// \brief Opens a new transaction for \c target_path. The target need not exist, and isn't created.
	/// \returns a fresh token, or error::backend_unsupported / error::backend_failure.
	virtual std::pair<error, std::string /*token*/> begin_chunked_file(const util::fs::absolute_unix_path &target_path) = 0;

	/// \brief Stages the content of \c data as the part identified by \c part_id. A previous part with the same id is replaced.
	/// \param size_hint the declared length of data, or -1 if unknown. A mismatch makes the part get rejected.
	/// \returns error::session_not_found if the token is unknown, error::part_rejected if the backend refuses the part.
	virtual error put_chunked_file_part(const util::fs::absolute_unix_path &target_path, std::string_view token, std::string_view part_id, tvfs::reader &data, std::int64_t size_hint = -1) = 0;

	/// \brief Atomically assembles the staged parts, in ascending order of part id, into \c target_path.
	/// On success the token is no longer valid. On failure the target is left untouched.
	/// \returns the size of the assembled file, or error::incomplete_upload if no part was staged, error::assembly_failure otherwise.
	virtual std::pair<error, std::int64_t /*size*/> write_chunked_file(const util::fs::absolute_unix_path &target_path, std::string_view token) = 0;

	/// \brief Releases whatever the backend holds for \c token. Safe to invoke on an unknown or already released token.
	virtual void cancel_chunked_file(const util::fs::absolute_unix_path &target_path, std::string_view token) = 0;
};

}

#endif // CHUNKUP_UPLOAD_CHUNKED_FILE_WRITE_HPP
