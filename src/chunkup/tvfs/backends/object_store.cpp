#include <libfilezilla/encode.hpp>
#include <libfilezilla/hash.hpp>
#include <libfilezilla/util.hpp>

#include "../../logger/type.hpp"
#include "../../strresult.hpp"

#include "object_store.hpp"

namespace chunkup::tvfs::backends {

namespace {

std::string key_of(const util::fs::absolute_unix_path &path)
{
	return path ? path.str().substr(1) : std::string();
}

std::string dir_key_of(const std::string &key)
{
	return key.empty() ? key : key + '/';
}

std::string parent_key_of(const std::string &key)
{
	auto pos = key.rfind('/');
	return pos == std::string::npos ? std::string() : key.substr(0, pos);
}

std::string new_id()
{
	return fz::hex_encode<std::string>(fz::random_bytes(16));
}

}

object_store::object_store(std::string name, fz::logger_interface &logger, options opts)
	: logger_(logger, "object_store")
	, name_(std::move(name))
	, opts_(std::move(opts))
{
}

std::string_view object_store::name() const
{
	return name_;
}

object_store::kind object_store::kind_of(const std::string &key) const
{
	if (key.empty())
		return kind::dir;

	if (objects_.count(key))
		return kind::file;

	auto dir_key = dir_key_of(key);
	if (objects_.count(dir_key) || has_children(dir_key))
		return kind::dir;

	return kind::none;
}

bool object_store::has_children(const std::string &dir_key) const
{
	auto it = objects_.lower_bound(dir_key);
	if (it != objects_.end() && it->first == dir_key)
		++it;

	return it != objects_.end() && fz::starts_with(it->first, dir_key);
}

fz::result object_store::info(const util::fs::absolute_unix_path &path, entry &out)
{
	if (!path)
		return { fz::result::invalid };

	fz::scoped_lock lock(mutex_);

	auto key = key_of(path);

	switch (kind_of(key)) {
		case kind::file: {
			auto &o = objects_.at(key);
			out = entry(std::string(path.base()), fz::local_filesys::file, std::int64_t(o.data.size()), o.mtime);
			return { fz::result::ok };
		}

		case kind::dir: {
			fz::datetime mtime;
			if (auto it = objects_.find(dir_key_of(key)); it != objects_.end())
				mtime = it->second.mtime;

			out = entry(path.is_root() ? std::string("/") : std::string(path.base()), fz::local_filesys::dir, -1, mtime);
			return { fz::result::ok };
		}

		case kind::none:
			break;
	}

	return { fz::result::nofile };
}

fz::result object_store::list(const util::fs::absolute_unix_path &path, std::vector<entry> &out)
{
	if (!path)
		return { fz::result::invalid };

	fz::scoped_lock lock(mutex_);

	auto key = key_of(path);
	if (kind_of(key) != kind::dir)
		return { fz::result::nodir };

	auto prefix = dir_key_of(key);
	std::string last_dir;

	for (auto it = objects_.lower_bound(prefix); it != objects_.end() && fz::starts_with(it->first, prefix); ++it) {
		auto rest = std::string_view(it->first).substr(prefix.size());
		if (rest.empty())
			continue;

		if (auto pos = rest.find('/'); pos != std::string_view::npos) {
			auto name = std::string(rest.substr(0, pos));

			// Keys are sorted, so all the keys below one directory come one after the other.
			if (name != last_dir) {
				out.emplace_back(name, fz::local_filesys::dir);
				last_dir = std::move(name);
			}
		}
		else
			out.emplace_back(std::string(rest), fz::local_filesys::file, std::int64_t(it->second.data.size()), it->second.mtime);
	}

	return { fz::result::ok };
}

fz::result object_store::mkdir(const util::fs::absolute_unix_path &path)
{
	if (!path || path.is_root())
		return { fz::result::invalid };

	fz::scoped_lock lock(mutex_);

	auto key = key_of(path);

	if (kind_of(key) != kind::none)
		return { fz::result::other, CHUNKUP_RESULT_RAW_ALREADY_EXISTS };

	if (kind_of(parent_key_of(key)) != kind::dir)
		return { fz::result::nodir };

	objects_[dir_key_of(key)] = { {}, fz::datetime::now() };

	logger_.log_u(logmsg::debug_debug, L"mkdir(%s)", key);

	return { fz::result::ok };
}

fz::result object_store::open_reader(const util::fs::absolute_unix_path &path, std::unique_ptr<reader> &out)
{
	if (!path)
		return { fz::result::invalid };

	fz::scoped_lock lock(mutex_);

	auto it = objects_.find(key_of(path));
	if (it == objects_.end())
		return { fz::result::nofile };

	out = std::make_unique<string_reader>(it->second.data);

	return { fz::result::ok };
}

fz::result object_store::write(const util::fs::absolute_unix_path &path, reader &data, std::int64_t &written)
{
	written = 0;

	if (!path || path.is_root())
		return { fz::result::invalid };

	std::string content;
	if (auto r = read_all(data, content); !r) {
		logger_.log_u(logmsg::debug_warning, L"write(%s): %s", path.str(), strresult(r));
		return { r.error_ == fz::rwresult::nospace ? fz::result::nospace : fz::result::other, r.raw_ };
	}

	fz::scoped_lock lock(mutex_);

	auto key = key_of(path);

	if (kind_of(key) == kind::dir)
		return { fz::result::other, CHUNKUP_RESULT_RAW_ALREADY_EXISTS };

	if (kind_of(parent_key_of(key)) != kind::dir)
		return { fz::result::nodir };

	written = std::int64_t(content.size());
	objects_[key] = { std::move(content), fz::datetime::now() };

	logger_.log_u(logmsg::debug_debug, L"write(%s): %d bytes", key, written);

	return { fz::result::ok };
}

fz::result object_store::rename(const util::fs::absolute_unix_path &from, const util::fs::absolute_unix_path &to)
{
	if (!from || !to || from.is_root() || to.is_root() || to.is_within(from))
		return { fz::result::invalid };

	fz::scoped_lock lock(mutex_);

	auto from_key = key_of(from);
	auto to_key = key_of(to);

	auto from_kind = kind_of(from_key);
	auto to_kind = kind_of(to_key);

	if (from_kind == kind::none)
		return { fz::result::nofile };

	if (kind_of(parent_key_of(to_key)) != kind::dir)
		return { fz::result::nodir };

	if (from_kind == kind::file) {
		if (to_kind == kind::dir)
			return { fz::result::other, CHUNKUP_RESULT_RAW_ALREADY_EXISTS };

		auto o = std::move(objects_.at(from_key));
		objects_.erase(from_key);
		objects_[to_key] = std::move(o);
	}
	else {
		if (to_kind != kind::none)
			return { fz::result::other, CHUNKUP_RESULT_RAW_ALREADY_EXISTS };

		auto from_prefix = dir_key_of(from_key);
		auto to_prefix = dir_key_of(to_key);

		std::vector<std::string> keys;
		for (auto it = objects_.lower_bound(from_prefix); it != objects_.end() && fz::starts_with(it->first, from_prefix); ++it)
			keys.push_back(it->first);

		for (auto &k: keys) {
			auto node = objects_.extract(k);
			node.key() = to_prefix + k.substr(from_prefix.size());
			objects_.insert(std::move(node));
		}
	}

	logger_.log_u(logmsg::debug_debug, L"rename(%s, %s)", from_key, to_key);

	return { fz::result::ok };
}

fz::result object_store::remove_file(const util::fs::absolute_unix_path &path)
{
	if (!path)
		return { fz::result::invalid };

	fz::scoped_lock lock(mutex_);

	if (!objects_.erase(key_of(path)))
		return { fz::result::nofile };

	return { fz::result::ok };
}

fz::result object_store::remove_directory(const util::fs::absolute_unix_path &path, bool recursive)
{
	if (!path || path.is_root())
		return { fz::result::invalid };

	fz::scoped_lock lock(mutex_);

	auto key = key_of(path);
	if (kind_of(key) != kind::dir)
		return { fz::result::nodir };

	auto prefix = dir_key_of(key);

	if (!recursive && has_children(prefix))
		return { fz::result::other, CHUNKUP_RESULT_RAW_NOT_EMPTY };

	auto it = objects_.lower_bound(prefix);
	while (it != objects_.end() && fz::starts_with(it->first, prefix))
		it = objects_.erase(it);

	logger_.log_u(logmsg::debug_debug, L"remove_directory(%s, %d)", key, recursive);

	return { fz::result::ok };
}

upload::chunked_file_write *object_store::chunked_file_write()
{
	return this;
}

std::string object_store::create_multipart_upload(const std::string &key)
{
	fz::scoped_lock lock(mutex_);

	auto id = new_id();
	uploads_[id].key = key;

	logger_.log_u(logmsg::debug_debug, L"create_multipart_upload(%s): upload id %s", key, id);

	return id;
}

std::pair<fz::result, std::string> object_store::upload_part(const std::string &upload_id, std::uint32_t part_number, std::string data)
{
	if (part_number < 1 || part_number > max_part_number)
		return { fz::result{fz::result::invalid}, {} };

	auto etag = fz::hex_encode<std::string>(fz::md5(data));

	fz::scoped_lock lock(mutex_);

	auto it = uploads_.find(upload_id);
	if (it == uploads_.end())
		return { fz::result{fz::result::nofile}, {} };

	it->second.parts[part_number] = { etag, std::move(data) };

	logger_.log_u(logmsg::debug_debug, L"upload_part(%s, %d): etag %s", upload_id, part_number, etag);

	return { fz::result{fz::result::ok}, std::move(etag) };
}

fz::result object_store::complete_multipart_upload(const std::string &upload_id, const std::vector<completed_part> &parts, std::int64_t &size)
{
	fz::scoped_lock lock(mutex_);

	auto it = uploads_.find(upload_id);
	if (it == uploads_.end())
		return { fz::result::nofile };

	auto &upload = it->second;

	if (parts.empty())
		return { fz::result::invalid };

	if (kind_of(upload.key) == kind::dir)
		return { fz::result::other, CHUNKUP_RESULT_RAW_ALREADY_EXISTS };

	if (kind_of(parent_key_of(upload.key)) != kind::dir)
		return { fz::result::nodir };

	std::string data;

	for (auto &p: parts) {
		auto pit = upload.parts.find(p.number);
		if (pit == upload.parts.end() || pit->second.first != p.etag) {
			logger_.log_u(logmsg::debug_warning, L"complete_multipart_upload(%s): part %d is missing or has a different etag.", upload_id, p.number);
			return { fz::result::invalid };
		}

		data += pit->second.second;
	}

	size = std::int64_t(data.size());
	objects_[upload.key] = { std::move(data), fz::datetime::now() };

	logger_.log_u(logmsg::debug_debug, L"complete_multipart_upload(%s): %d parts, %d bytes into %s", upload_id, parts.size(), size, upload.key);

	uploads_.erase(it);

	return { fz::result::ok };
}

void object_store::abort_multipart_upload(const std::string &upload_id)
{
	fz::scoped_lock lock(mutex_);

	if (uploads_.erase(upload_id))
		logger_.log_u(logmsg::debug_debug, L"abort_multipart_upload(%s)", upload_id);
}

std::size_t object_store::pending_uploads() const
{
	fz::scoped_lock lock(mutex_);
	return uploads_.size();
}

std::pair<upload::error, std::string> object_store::begin_chunked_file(const util::fs::absolute_unix_path &target_path)
{
	if (!target_path || target_path.is_root())
		return { upload::error::backend_unsupported, {} };

	auto id = create_multipart_upload(key_of(target_path));

	fz::scoped_lock lock(chunked_mutex_);
	chunked_writes_[id].target = target_path;

	logger_.log_u(logmsg::debug_info, L"Began chunked write '%s' for '%s'.", id, target_path.str());

	return { upload::error::none, std::move(id) };
}

upload::error object_store::put_chunked_file_part(const util::fs::absolute_unix_path &target_path, std::string_view token, std::string_view part_id, reader &data, std::int64_t size_hint)
{
	{
		fz::scoped_lock lock(chunked_mutex_);

		auto it = chunked_writes_.find(token);
		if (it == chunked_writes_.end() || it->second.target != target_path) {
			logger_.log_u(logmsg::debug_warning, L"put_chunked_file_part(%s): no chunked write '%s' for this target.", target_path.str(), token);
			return upload::error::session_not_found;
		}
	}

	auto number = fz::to_integral<std::uint32_t>(part_id);
	if (number < 1 || number > max_part_number || std::to_string(number) != part_id) {
		logger_.log_u(logmsg::debug_warning, L"put_chunked_file_part(%s): invalid part id '%s'.", target_path.str(), part_id);
		return upload::error::part_rejected;
	}

	std::string content;
	if (auto r = read_all(data, content, opts_.max_part_size); !r) {
		if (r.error_ == fz::rwresult::nospace) {
			logger_.log_u(logmsg::debug_warning, L"Part %s of chunked write '%s' exceeds the maximum part size of %d bytes.", part_id, token, opts_.max_part_size);
			return upload::error::part_rejected;
		}

		logger_.log_u(logmsg::error, L"Could not read part %s of chunked write '%s': %s", part_id, token, strresult(r));
		return upload::error::backend_failure;
	}

	if (size_hint >= 0 && std::int64_t(content.size()) != size_hint) {
		logger_.log_u(logmsg::debug_warning, L"Part %s of chunked write '%s' is %d bytes long, %d were declared.", part_id, token, content.size(), size_hint);
		return upload::error::part_rejected;
	}

	// The part and its etag are recorded together: of concurrent uploads of the same part, the last one stored is the one assembled.
	fz::scoped_lock lock(chunked_mutex_);

	auto it = chunked_writes_.find(token);
	if (it == chunked_writes_.end())
		return upload::error::session_not_found;

	auto [res, etag] = upload_part(it->first, number, std::move(content));

	if (!res) {
		logger_.log_u(logmsg::error, L"Could not upload part %s of chunked write '%s': %s", part_id, token, strresult(res));
		return res.error_ == fz::result::nofile ? upload::error::session_not_found : upload::error::backend_failure;
	}

	it->second.etags[number] = std::move(etag);

	return upload::error::none;
}

std::pair<upload::error, std::int64_t> object_store::write_chunked_file(const util::fs::absolute_unix_path &target_path, std::string_view token)
{
	fz::scoped_lock lock(chunked_mutex_);

	auto it = chunked_writes_.find(token);
	if (it == chunked_writes_.end() || it->second.target != target_path) {
		logger_.log_u(logmsg::debug_warning, L"write_chunked_file(%s): no chunked write '%s' for this target.", target_path.str(), token);
		return { upload::error::session_not_found, -1 };
	}

	std::vector<completed_part> parts;
	for (auto &[n, etag]: it->second.etags)
		parts.push_back({n, etag});

	if (parts.empty()) {
		logger_.log_u(logmsg::debug_warning, L"write_chunked_file(%s): chunked write '%s' has no parts.", target_path.str(), token);
		return { upload::error::incomplete_upload, -1 };
	}

	std::int64_t size = -1;
	if (auto res = complete_multipart_upload(it->first, parts, size); !res) {
		logger_.log_u(logmsg::error, L"Could not complete chunked write '%s' into '%s': %s", token, target_path.str(), strresult(res));
		return { upload::error::assembly_failure, -1 };
	}

	chunked_writes_.erase(it);

	logger_.log_u(logmsg::debug_info, L"Assembled %d parts of chunked write '%s' into '%s': %d bytes.", parts.size(), token, target_path.str(), size);

	return { upload::error::none, size };
}

void object_store::cancel_chunked_file(const util::fs::absolute_unix_path &target_path, std::string_view token)
{
	{
		fz::scoped_lock lock(chunked_mutex_);

		auto it = chunked_writes_.find(token);
		if (it == chunked_writes_.end())
			return;

		if (it->second.target != target_path) {
			logger_.log_u(logmsg::warning, L"Not cancelling chunked write '%s': it doesn't belong to '%s'.", token, target_path.str());
			return;
		}

		chunked_writes_.erase(it);
	}

	abort_multipart_upload(std::string(token));

	logger_.log_u(logmsg::debug_info, L"Cancelled chunked write '%s'.", token);
}

}
