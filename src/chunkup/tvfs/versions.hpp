#ifndef CHUNKUP_TVFS_VERSIONS_HPP
#define CHUNKUP_TVFS_VERSIONS_HPP

#include <string>
#include <vector>

#include "../logger/modularized.hpp"
#include "hooks.hpp"

namespace chunkup::tvfs {

/// \brief Keeps a copy of a file's previous content each time it gets overwritten.
/// The copy of /dir/name is stored as <root>/dir/name.v<milliseconds since the epoch>.
class versions final: public write_hook
{
public:
	versions(util::fs::absolute_unix_path root, fz::logger_interface &logger);

	void before_overwrite(engine &tvfs, const util::fs::absolute_unix_path &tvfs_path) override;

	/// \returns the tvfs paths of the versions retained for \c tvfs_path, oldest first.
	std::vector<std::string> list(engine &tvfs, const util::fs::absolute_unix_path &tvfs_path) const;

private:
	util::fs::absolute_unix_path version_base(const util::fs::absolute_unix_path &tvfs_path) const;

	util::fs::absolute_unix_path root_;
	logger::modularized logger_;
};

}

#endif // CHUNKUP_TVFS_VERSIONS_HPP
