#ifndef CHUNKUP_TVFS_ENGINE_HPP
#define CHUNKUP_TVFS_ENGINE_HPP

#include <memory>
#include <string>
#include <vector>

#include <libfilezilla/fsresult.hpp>
#include <libfilezilla/logger.hpp>

#include "../logger/modularized.hpp"
#include "../util/filesystem.hpp"

#include "backend.hpp"
#include "entry.hpp"
#include "file_cache.hpp"
#include "hooks.hpp"

namespace chunkup::tvfs {

struct mount_point
{
	std::string tvfs_path;
	std::shared_ptr<tvfs::backend> backend;
};

struct mount_table: std::vector<mount_point>
{
	using std::vector<mount_point>::vector;
};

struct resolved_path
{
	std::shared_ptr<tvfs::backend> backend;
	util::fs::absolute_unix_path tvfs_path;

	// The path within the backend
	util::fs::absolute_unix_path path;

	explicit operator bool() const
	{
		return backend && path;
	}
};

class engine
{
public:
	engine(fz::logger_interface &logger);

	void set_mount_table(const mount_table &mt);
	void add_write_hook(write_hook &hook);

	[[nodiscard]] resolved_path resolve_path(std::string_view tvfs_path) const;

	[[nodiscard]] std::pair<fz::result, entry> get_entry(std::string_view tvfs_path);
	[[nodiscard]] fz::result get_entries(std::vector<entry> &out, std::string_view tvfs_path);
	[[nodiscard]] fz::result make_directory(std::string_view tvfs_path, bool recursive = false);
	[[nodiscard]] fz::result open_reader(std::unique_ptr<reader> &out, std::string_view tvfs_path);
	[[nodiscard]] std::pair<fz::result, bool /*overwritten*/> put_contents(std::string_view tvfs_path, reader &data);
	[[nodiscard]] fz::result rename(std::string_view from, std::string_view to);
	[[nodiscard]] fz::result remove_file(std::string_view tvfs_path);
	[[nodiscard]] fz::result remove_directory(std::string_view tvfs_path, bool recursive = false);

	/// \brief Runs the write hooks for an overwrite of the existing file at \c tvfs_path.
	/// put_contents() does this on its own; writers that bypass it must invoke it themselves.
	void run_write_hooks(const util::fs::absolute_unix_path &tvfs_path);

	/// \brief Refreshes the cached metadata of the file at \c tvfs_path, after its content changed behind the engine's back.
	/// The etag is the md5 digest of the content, which is read back from the storage.
	file_metadata update_metadata(std::string_view tvfs_path, std::int64_t size);

	const file_cache &get_file_cache() const
	{
		return file_cache_;
	}

private:
	std::string content_etag(const resolved_path &r);

	logger::modularized logger_;

	mount_table mount_table_;
	std::vector<write_hook *> write_hooks_;
	file_cache file_cache_;
};

}

#endif // CHUNKUP_TVFS_ENGINE_HPP
