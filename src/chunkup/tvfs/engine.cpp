#include <algorithm>

#include "../logger/type.hpp"
#include "../strresult.hpp"

#include "engine.hpp"

namespace chunkup::tvfs {

engine::engine(fz::logger_interface &logger)
	: logger_(logger, "tvfs")
{
}

void engine::set_mount_table(const mount_table &mt)
{
	mount_table_.clear();

	for (auto &mp: mt) {
		util::fs::absolute_unix_path p(mp.tvfs_path);

		if (!p || !mp.backend) {
			logger_.log_u(logmsg::error, L"Invalid mount point '%s': ignoring it.", mp.tvfs_path);
			continue;
		}

		mount_table_.push_back({p.str(), mp.backend});
		logger_.log_u(logmsg::debug_info, L"Mounted storage '%s' at '%s'.", mp.backend->name(), p.str());
	}

	// Deepest mount points first, so that they take precedence over their ancestors.
	std::stable_sort(mount_table_.begin(), mount_table_.end(), [](const mount_point &lhs, const mount_point &rhs) {
		return lhs.tvfs_path.size() > rhs.tvfs_path.size();
	});
}

void engine::add_write_hook(write_hook &hook)
{
	write_hooks_.push_back(&hook);
}

resolved_path engine::resolve_path(std::string_view tvfs_path) const
{
	resolved_path r;
	r.tvfs_path = util::fs::absolute_unix_path(tvfs_path);

	if (!r.tvfs_path)
		return r;

	for (auto &mp: mount_table_) {
		util::fs::absolute_unix_path mount_path(mp.tvfs_path);

		if (r.tvfs_path.is_within(mount_path)) {
			r.backend = mp.backend;
			r.path = r.tvfs_path.relative_to(mount_path);
			break;
		}
	}

	return r;
}

std::pair<fz::result, entry> engine::get_entry(std::string_view tvfs_path)
{
	entry e;

	auto r = resolve_path(tvfs_path);
	if (!r)
		return { fz::result{fz::result::invalid}, e };

	auto res = r.backend->info(r.path, e);
	logger_.log_u(logmsg::debug_debug, L"get_entry(%s): result: %d (raw = %d)", r.tvfs_path.str(), res.error_, res.raw_);

	return { res, std::move(e) };
}

fz::result engine::get_entries(std::vector<entry> &out, std::string_view tvfs_path)
{
	out.clear();

	auto r = resolve_path(tvfs_path);
	if (!r)
		return { fz::result::invalid };

	auto res = r.backend->list(r.path, out);
	logger_.log_u(logmsg::debug_debug, L"get_entries(%s): %d entries, result: %d (raw = %d)", r.tvfs_path.str(), out.size(), res.error_, res.raw_);

	return res;
}

fz::result engine::make_directory(std::string_view tvfs_path, bool recursive)
{
	auto r = resolve_path(tvfs_path);
	if (!r)
		return { fz::result::invalid };

	if (!recursive) {
		auto res = r.backend->mkdir(r.path);
		logger_.log_u(logmsg::debug_debug, L"make_directory(%s): result: %d (raw = %d)", r.tvfs_path.str(), res.error_, res.raw_);
		return res;
	}

	util::fs::absolute_unix_path partial("/");

	for (auto e: r.path.elements_view()) {
		partial = partial / e;

		entry info;
		if (r.backend->info(partial, info)) {
			if (info.is_dir())
				continue;

			return { fz::result::other, CHUNKUP_RESULT_RAW_ALREADY_EXISTS };
		}

		if (auto res = r.backend->mkdir(partial); !res) {
			logger_.log_u(logmsg::debug_warning, L"make_directory(%s): could not create '%s': %s", r.tvfs_path.str(), partial.str(), strresult(res));
			return res;
		}
	}

	return { fz::result::ok };
}

fz::result engine::open_reader(std::unique_ptr<reader> &out, std::string_view tvfs_path)
{
	auto r = resolve_path(tvfs_path);
	if (!r)
		return { fz::result::invalid };

	return r.backend->open_reader(r.path, out);
}

std::pair<fz::result, bool> engine::put_contents(std::string_view tvfs_path, reader &data)
{
	auto r = resolve_path(tvfs_path);
	if (!r)
		return { fz::result{fz::result::invalid}, false };

	entry existing;
	bool overwriting = false;

	if (r.backend->info(r.path, existing)) {
		if (existing.is_dir())
			return { fz::result{fz::result::other, CHUNKUP_RESULT_RAW_ALREADY_EXISTS}, false };

		overwriting = true;
		run_write_hooks(r.tvfs_path);
	}

	hashing_reader hashed(data);

	std::int64_t written = 0;
	auto res = r.backend->write(r.path, hashed, written);

	logger_.log_u(logmsg::debug_debug, L"put_contents(%s): %d bytes, result: %d (raw = %d)", r.tvfs_path.str(), written, res.error_, res.raw_);

	if (res)
		file_cache_.update(r.tvfs_path, written, hashed.hex_digest());

	return { res, overwriting };
}

fz::result engine::rename(std::string_view from, std::string_view to)
{
	auto rf = resolve_path(from);
	auto rt = resolve_path(to);

	if (!rf || !rt)
		return { fz::result::invalid };

	if (rf.backend != rt.backend) {
		logger_.log_u(logmsg::debug_warning, L"rename(%s, %s): source and destination live on different storages.", rf.tvfs_path.str(), rt.tvfs_path.str());
		return { fz::result::other, CHUNKUP_RESULT_RAW_CROSS_DEVICE };
	}

	auto res = rf.backend->rename(rf.path, rt.path);
	logger_.log_u(logmsg::debug_debug, L"rename(%s, %s): result: %d (raw = %d)", rf.tvfs_path.str(), rt.tvfs_path.str(), res.error_, res.raw_);

	if (res)
		file_cache_.move(rf.tvfs_path, rt.tvfs_path);

	return res;
}

fz::result engine::remove_file(std::string_view tvfs_path)
{
	auto r = resolve_path(tvfs_path);
	if (!r)
		return { fz::result::invalid };

	auto res = r.backend->remove_file(r.path);
	logger_.log_u(logmsg::debug_debug, L"remove_file(%s): result: %d (raw = %d)", r.tvfs_path.str(), res.error_, res.raw_);

	if (res)
		file_cache_.remove(r.tvfs_path);

	return res;
}

fz::result engine::remove_directory(std::string_view tvfs_path, bool recursive)
{
	auto r = resolve_path(tvfs_path);
	if (!r)
		return { fz::result::invalid };

	if (r.path.is_root()) {
		logger_.log_u(logmsg::debug_warning, L"remove_directory(%s): refusing to remove the root of a storage.", r.tvfs_path.str());
		return { fz::result::noperm };
	}

	auto res = r.backend->remove_directory(r.path, recursive);
	logger_.log_u(logmsg::debug_debug, L"remove_directory(%s, %d): result: %d (raw = %d)", r.tvfs_path.str(), recursive, res.error_, res.raw_);

	if (res)
		file_cache_.remove(r.tvfs_path);

	return res;
}

void engine::run_write_hooks(const util::fs::absolute_unix_path &tvfs_path)
{
	for (auto h: write_hooks_)
		h->before_overwrite(*this, tvfs_path);
}

std::string engine::content_etag(const resolved_path &r)
{
	std::unique_ptr<reader> content;
	if (auto res = r.backend->open_reader(r.path, content); !res) {
		logger_.log_u(logmsg::warning, L"Could not read '%s' back: %s. Its etag is left empty.", r.tvfs_path.str(), strresult(res));
		return {};
	}

	hashing_reader hashed(*content);
	std::string buffer(64*1024, '\0');

	while (true) {
		auto rr = hashed.read(buffer.data(), buffer.size());
		if (!rr) {
			logger_.log_u(logmsg::warning, L"Could not read '%s' back: %s. Its etag is left empty.", r.tvfs_path.str(), strresult(rr));
			return {};
		}

		if (rr.value_ == 0)
			break;
	}

	return hashed.hex_digest();
}

file_metadata engine::update_metadata(std::string_view tvfs_path, std::int64_t size)
{
	auto r = resolve_path(tvfs_path);
	if (!r)
		return {};

	auto m = file_cache_.update(r.tvfs_path, size, content_etag(r));
	logger_.log_u(logmsg::debug_info, L"Metadata of '%s' refreshed: size = %d, type = %s, etag = %s.", tvfs_path, m.size, m.mimetype, m.etag);

	return m;
}

}
