#ifndef CHUNKUP_TVFS_HOOKS_HPP
#define CHUNKUP_TVFS_HOOKS_HPP

#include "../util/filesystem.hpp"

namespace chunkup::tvfs {

class engine;

class write_hook
{
public:
	virtual ~write_hook() = default;

	/// \brief Invoked before the content of the existing file at \c tvfs_path gets replaced.
	/// The file still holds its previous content when this is invoked.
	virtual void before_overwrite(engine &tvfs, const util::fs::absolute_unix_path &tvfs_path) = 0;
};

}

#endif // CHUNKUP_TVFS_HOOKS_HPP
