#include <algorithm>

#include <libfilezilla/format.hpp>

#include "../logger/type.hpp"
#include "../strresult.hpp"

#include "engine.hpp"
#include "versions.hpp"

namespace chunkup::tvfs {

versions::versions(util::fs::absolute_unix_path root, fz::logger_interface &logger)
	: root_(std::move(root))
	, logger_(logger, "versions")
{
}

util::fs::absolute_unix_path versions::version_base(const util::fs::absolute_unix_path &tvfs_path) const
{
	return root_ / tvfs_path.str().substr(1);
}

void versions::before_overwrite(engine &tvfs, const util::fs::absolute_unix_path &tvfs_path)
{
	if (!root_ || tvfs_path.is_within(root_))
		return;

	static const fz::datetime datetime_0(0, fz::datetime::milliseconds);

	auto base = version_base(tvfs_path);

	if (auto res = tvfs.make_directory(base.parent().str(), true); !res) {
		logger_.log_u(logmsg::warning, L"Could not create the versions directory for '%s': %s.", tvfs_path.str(), strresult(res));
		return;
	}

	std::unique_ptr<reader> current;
	if (auto res = tvfs.open_reader(current, tvfs_path.str()); !res) {
		logger_.log_u(logmsg::warning, L"Could not read '%s' in order to version it: %s.", tvfs_path.str(), strresult(res));
		return;
	}

	auto stamp = (fz::datetime::now() - datetime_0).get_milliseconds();
	auto version = util::fs::absolute_unix_path(fz::sprintf("%s.v%d", base.str(), stamp));

	// Two overwrites within the same millisecond must not clobber each other's versions.
	while (tvfs.get_entry(version.str()).first)
		version = util::fs::absolute_unix_path(fz::sprintf("%s.v%d", base.str(), ++stamp));

	if (auto res = tvfs.put_contents(version.str(), *current).first; !res) {
		logger_.log_u(logmsg::warning, L"Could not store a version of '%s': %s.", tvfs_path.str(), strresult(res));
		return;
	}

	logger_.log_u(logmsg::debug_info, L"Stored version '%s' of '%s'.", version.str(), tvfs_path.str());
}

std::vector<std::string> versions::list(engine &tvfs, const util::fs::absolute_unix_path &tvfs_path) const
{
	std::vector<std::string> ret;

	auto base = version_base(tvfs_path);
	auto prefix = std::string(base.base()) + ".v";

	std::vector<entry> entries;
	if (!tvfs.get_entries(entries, base.parent().str()))
		return ret;

	std::vector<std::pair<std::int64_t, std::string>> found;

	for (auto &e: entries) {
		if (!e.is_file() || !fz::starts_with(e.name(), prefix))
			continue;

		auto stamp = fz::to_integral<std::int64_t>(std::string_view(e.name()).substr(prefix.size()), -1);
		if (stamp < 0)
			continue;

		found.emplace_back(stamp, (base.parent() / e.name()).str());
	}

	std::sort(found.begin(), found.end());

	for (auto &f: found)
		ret.push_back(std::move(f.second));

	return ret;
}

}
