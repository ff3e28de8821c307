#ifndef CHUNKUP_TVFS_BACKENDS_LOCAL_FILESYS_HPP
#define CHUNKUP_TVFS_BACKENDS_LOCAL_FILESYS_HPP

#include "../../logger/modularized.hpp"
#include "../../upload/chunked_file_write.hpp"
#include "../backend.hpp"

namespace chunkup::tvfs::backends {

/// \brief Storage on the local file system, rooted at a native directory.
///
/// Chunked writes are staged in a directory of their own, one subdirectory per token,
/// and assembled next to the target before being renamed over it.
/// Neither the staging directory nor the files being assembled can be reached through the backend's operations.
class local_filesys final: public backend, private upload::chunked_file_write
{
public:
	struct options
	{
		options(){}

		/// Where the parts of chunked writes are staged. Defaults to the ".chunkup" directory under the root.
		/// Must be on the same device as the root.
		fz::native_string staging_dir{};

		/// Parts bigger than this are rejected. Negative means no limit.
		std::int64_t max_part_size{-1};
	};

	local_filesys(fz::native_string root, fz::logger_interface &logger, options opts = {});

	std::string_view name() const override;

	fz::result info(const util::fs::absolute_unix_path &path, entry &out) override;
	fz::result list(const util::fs::absolute_unix_path &path, std::vector<entry> &out) override;
	fz::result mkdir(const util::fs::absolute_unix_path &path) override;
	fz::result open_reader(const util::fs::absolute_unix_path &path, std::unique_ptr<reader> &out) override;
	fz::result write(const util::fs::absolute_unix_path &path, reader &data, std::int64_t &written) override;
	fz::result rename(const util::fs::absolute_unix_path &from, const util::fs::absolute_unix_path &to) override;
	fz::result remove_file(const util::fs::absolute_unix_path &path) override;
	fz::result remove_directory(const util::fs::absolute_unix_path &path, bool recursive) override;

	upload::chunked_file_write *chunked_file_write() override;

	const fz::native_string &root() const
	{
		return root_;
	}

	const fz::native_string &staging_dir() const
	{
		return opts_.staging_dir;
	}

private:
	std::pair<upload::error, std::string> begin_chunked_file(const util::fs::absolute_unix_path &target_path) override;
	upload::error put_chunked_file_part(const util::fs::absolute_unix_path &target_path, std::string_view token, std::string_view part_id, reader &data, std::int64_t size_hint) override;
	std::pair<upload::error, std::int64_t> write_chunked_file(const util::fs::absolute_unix_path &target_path, std::string_view token) override;
	void cancel_chunked_file(const util::fs::absolute_unix_path &target_path, std::string_view token) override;

	fz::native_string native(const util::fs::absolute_unix_path &path) const;
	bool is_staging(const fz::native_string &native_path) const;
	fz::native_string session_dir(std::string_view token) const;
	bool session_matches(std::string_view token, const util::fs::absolute_unix_path &target_path) const;
	fz::native_string unique_name(const fz::native_string &prefix) const;

	logger::modularized logger_;
	fz::native_string root_;
	options opts_;
};

}

#endif // CHUNKUP_TVFS_BACKENDS_LOCAL_FILESYS_HPP
