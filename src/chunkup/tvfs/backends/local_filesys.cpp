#include <algorithm>

#include <libfilezilla/encode.hpp>
#include <libfilezilla/local_filesys.hpp>
#include <libfilezilla/recursive_remove.hpp>
#include <libfilezilla/util.hpp>

#include "../../logger/type.hpp"
#include "../../strresult.hpp"
#include "../../strsyserror.hpp"
#include "../../util/scope_guard.hpp"

#include "local_filesys.hpp"

namespace chunkup::tvfs::backends {

namespace {

constexpr std::size_t token_size = 32;
constexpr std::int64_t max_target_record_size = 64*1024;

const fz::native_string part_suffix = fzT(".part");
const fz::native_string target_record = fzT("target");

bool is_token(std::string_view token)
{
	return token.size() == token_size && std::all_of(token.begin(), token.end(), [](char c) {
		return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
	});
}

// Canonical decimal numbers only: no sign, no leading zeros, no zero.
bool is_part_id(std::string_view id)
{
	if (id.empty() || id.size() > 10 || id[0] == '0')
		return false;

	return std::all_of(id.begin(), id.end(), [](char c) {
		return c >= '0' && c <= '9';
	});
}

const fz::native_string assembly_infix = fzT(".chunkup-");

// Files being assembled are named ".<target>.chunkup-<token>".
bool is_assembly_name(const fz::native_string &name)
{
	if (name.size() < assembly_infix.size() + token_size + 2 || name[0] != fzT('.'))
		return false;

	auto infix = name.size() - token_size - assembly_infix.size();

	return name.compare(infix, assembly_infix.size(), assembly_infix) == 0 && is_token(fz::to_utf8(name.substr(infix + assembly_infix.size())));
}

fz::native_string assembly_name(const util::fs::absolute_unix_path &target_path, std::string_view token)
{
	return fz::to_native(fz::sprintf(".%s", target_path.base())) + assembly_infix + fz::to_native(token);
}

fz::result from_rwresult(const fz::rwresult &r)
{
	switch (r.error_) {
		case fz::rwresult::none: return { fz::result::ok };
		case fz::rwresult::invalid: return { fz::result::invalid, r.raw_ };
		case fz::rwresult::nospace: return { fz::result::nospace, r.raw_ };
		case fz::rwresult::wouldblock:
		case fz::rwresult::other: break;
	}

	return { fz::result::other, r.raw_ };
}

}

local_filesys::local_filesys(fz::native_string root, fz::logger_interface &logger, options opts)
	: logger_(logger, "local_filesys")
	, root_(std::move(root))
	, opts_(std::move(opts))
{
	while (root_.size() > 1 && root_.back() == fz::local_filesys::path_separator)
		root_.pop_back();

	if (opts_.staging_dir.empty())
		opts_.staging_dir = root_ + fz::local_filesys::path_separator + fzT(".chunkup");
}

std::string_view local_filesys::name() const
{
	return "local_filesys";
}

fz::native_string local_filesys::native(const util::fs::absolute_unix_path &path) const
{
	return util::fs::to_native(root_, path);
}

bool local_filesys::is_staging(const fz::native_string &native_path) const
{
	auto &staging = opts_.staging_dir;

	if (!fz::starts_with(native_path, staging))
		return false;

	return native_path.size() == staging.size() || native_path[staging.size()] == fz::local_filesys::path_separator;
}

fz::result local_filesys::info(const util::fs::absolute_unix_path &path, entry &out)
{
	auto native_path = native(path);
	if (native_path.empty())
		return { fz::result::invalid };

	if (is_staging(native_path))
		return { fz::result::nofile };

	bool is_link{};
	std::int64_t size{-1};
	fz::datetime mtime;

	auto type = fz::local_filesys::get_file_info(native_path, is_link, &size, &mtime, nullptr, true);
	if (type == fz::local_filesys::unknown) {
		logger_.log_u(logmsg::debug_debug, L"info(%s): no such file or directory", native_path);
		return { fz::result::nofile };
	}

	out = entry(std::string(path.is_root() ? std::string_view("/") : path.base()), type, size, mtime);
	return { fz::result::ok };
}

fz::result local_filesys::list(const util::fs::absolute_unix_path &path, std::vector<entry> &out)
{
	auto native_path = native(path);
	if (native_path.empty())
		return { fz::result::invalid };

	if (is_staging(native_path))
		return { fz::result::nodir };

	fz::local_filesys lfs;
	auto res = lfs.begin_find_files(native_path, false, false);

	if (!res) {
		logger_.log_u(logmsg::debug_debug, L"list(%s): result: %d (raw = %d: %s)", native_path, res.error_, res.raw_, strsyserror(res.raw_));
		return res;
	}

	fz::native_string name;
	bool is_link{};
	fz::local_filesys::type type{};
	std::int64_t size{};
	fz::datetime mtime;
	int mode{};

	while (lfs.get_next_file(name, is_link, type, &size, &mtime, &mode)) {
		auto child = native_path;
		if (child.back() != fz::local_filesys::path_separator)
			child += fz::local_filesys::path_separator;
		child += name;

		// Neither the staging area nor the files being assembled are part of the namespace.
		if (is_staging(child) || is_assembly_name(name))
			continue;

		out.emplace_back(fz::to_utf8(name), type, size, mtime);
	}

	return { fz::result::ok };
}

fz::result local_filesys::mkdir(const util::fs::absolute_unix_path &path)
{
	auto native_path = native(path);
	if (native_path.empty())
		return { fz::result::invalid };

	if (is_staging(native_path))
		return { fz::result::noperm };

	fz::native_string last_created;
	auto res = fz::mkdir(native_path, false, fz::mkdir_permissions::normal, &last_created);

	if (res && last_created.empty())
		res = { fz::result::other, CHUNKUP_RESULT_RAW_ALREADY_EXISTS };

	logger_.log_u(logmsg::debug_debug, L"mkdir(%s): result: %d (raw = %d: %s)", native_path, res.error_, res.raw_, strsyserror(res.raw_));

	return res;
}

fz::result local_filesys::open_reader(const util::fs::absolute_unix_path &path, std::unique_ptr<reader> &out)
{
	auto native_path = native(path);
	if (native_path.empty())
		return { fz::result::invalid };

	if (is_staging(native_path))
		return { fz::result::nofile };

	if (fz::local_filesys::get_file_type(native_path, true) == fz::local_filesys::dir)
		return { fz::result::nofile };

	fz::file f;
	auto res = f.open(native_path, fz::file::reading, fz::file::existing);

	logger_.log_u(logmsg::debug_debug, L"open_reader(%s): result: %d (raw = %d: %s)", native_path, res.error_, res.raw_, strsyserror(res.raw_));

	if (res)
		out = std::make_unique<file_reader>(std::move(f));

	return res;
}

fz::native_string local_filesys::unique_name(const fz::native_string &prefix) const
{
	return prefix + fzT(".") + fz::to_native(fz::hex_encode<std::string>(fz::random_bytes(8))) + fzT(".tmp");
}

fz::result local_filesys::write(const util::fs::absolute_unix_path &path, reader &data, std::int64_t &written)
{
	written = 0;

	auto native_path = native(path);
	if (native_path.empty() || path.is_root())
		return { fz::result::invalid };

	if (is_staging(native_path))
		return { fz::result::noperm };

	auto tmp_path = unique_name(native(path.parent() / fz::sprintf(".%s", path.base())));

	fz::file f;
	if (auto res = f.open(tmp_path, fz::file::writing, fz::file::empty); !res) {
		logger_.log_u(logmsg::debug_warning, L"write(%s): could not create the temporary file: %s", native_path, strsyserror(res.raw_));
		return res;
	}

	CHUNKUP_SCOPE_GUARD {
		if (!tmp_path.empty())
			fz::remove_file(tmp_path, false);
	};

	auto r = copy(data, f, -1);
	if (!r) {
		logger_.log_u(logmsg::debug_warning, L"write(%s): %s", native_path, strresult(r));
		return from_rwresult(r);
	}

	if (!f.fsync())
		return { fz::result::other };

	f.close();

	auto res = fz::rename_file(tmp_path, native_path);
	logger_.log_u(logmsg::debug_debug, L"write(%s): %d bytes, result: %d (raw = %d: %s)", native_path, r.value_, res.error_, res.raw_, strsyserror(res.raw_));

	if (res) {
		tmp_path.clear();
		written = std::int64_t(r.value_);
	}

	return res;
}

fz::result local_filesys::rename(const util::fs::absolute_unix_path &from, const util::fs::absolute_unix_path &to)
{
	auto native_from = native(from);
	auto native_to = native(to);

	if (native_from.empty() || native_to.empty())
		return { fz::result::invalid };

	if (is_staging(native_from))
		return { fz::result::nofile };

	if (is_staging(native_to))
		return { fz::result::noperm };

	auto res = fz::rename_file(native_from, native_to);
	logger_.log_u(logmsg::debug_debug, L"rename(%s, %s): result: %d (raw = %d: %s)", native_from, native_to, res.error_, res.raw_, strsyserror(res.raw_));

	return res;
}

fz::result local_filesys::remove_file(const util::fs::absolute_unix_path &path)
{
	auto native_path = native(path);
	if (native_path.empty())
		return { fz::result::invalid };

	if (is_staging(native_path))
		return { fz::result::nofile };

	auto res = fz::remove_file(native_path, true);
	logger_.log_u(logmsg::debug_debug, L"remove_file(%s): result: %d (raw = %d: %s)", native_path, res.error_, res.raw_, strsyserror(res.raw_));

	return res;
}

fz::result local_filesys::remove_directory(const util::fs::absolute_unix_path &path, bool recursive)
{
	auto native_path = native(path);
	if (native_path.empty())
		return { fz::result::invalid };

	if (is_staging(native_path))
		return { fz::result::nodir };

	fz::result res;

	if (fz::local_filesys::get_file_type(native_path, false) != fz::local_filesys::dir)
		res = { fz::result::nodir };
	else
	if (recursive)
		res = fz::recursive_remove().remove(native_path) ? fz::result{ fz::result::ok } : fz::result{ fz::result::other };
	else
		res = fz::remove_dir(native_path, true);

	logger_.log_u(logmsg::debug_debug, L"remove_directory(%s, %d): result: %d (raw = %d: %s)", native_path, recursive, res.error_, res.raw_, strsyserror(res.raw_));

	return res;
}

upload::chunked_file_write *local_filesys::chunked_file_write()
{
	return this;
}

fz::native_string local_filesys::session_dir(std::string_view token) const
{
	return opts_.staging_dir + fz::local_filesys::path_separator + fz::to_native(token);
}

bool local_filesys::session_matches(std::string_view token, const util::fs::absolute_unix_path &target_path) const
{
	fz::file f;
	if (!f.open(session_dir(token) + fz::local_filesys::path_separator + target_record, fz::file::reading, fz::file::existing))
		return false;

	file_reader r(std::move(f));
	std::string recorded;

	if (!read_all(r, recorded, max_target_record_size))
		return false;

	return recorded == target_path.str();
}

std::pair<upload::error, std::string> local_filesys::begin_chunked_file(const util::fs::absolute_unix_path &target_path)
{
	if (!target_path || target_path.is_root())
		return { upload::error::backend_unsupported, {} };

	auto token = fz::hex_encode<std::string>(fz::random_bytes(token_size/2));
	auto dir = session_dir(token);

	if (auto res = fz::mkdir(dir, true, fz::mkdir_permissions::cur_user); !res) {
		logger_.log_u(logmsg::error, L"Could not create the staging directory '%s': %s", dir, strsyserror(res.raw_));
		return { upload::error::backend_failure, {} };
	}

	fz::file f;
	auto res = f.open(dir + fz::local_filesys::path_separator + target_record, fz::file::writing, fz::file::empty);

	if (res) {
		auto &s = target_path.str();
		auto w = f.write2(s.data(), s.size());

		if (!w || w.value_ != s.size() || !f.fsync())
			res = { fz::result::other };
	}

	if (!res) {
		logger_.log_u(logmsg::error, L"Could not record the target of chunked write '%s': %s", token, strsyserror(res.raw_));
		fz::recursive_remove().remove(dir);
		return { upload::error::backend_failure, {} };
	}

	logger_.log_u(logmsg::debug_info, L"Began chunked write '%s' for '%s'.", token, target_path.str());

	return { upload::error::none, std::move(token) };
}

upload::error local_filesys::put_chunked_file_part(const util::fs::absolute_unix_path &target_path, std::string_view token, std::string_view part_id, reader &data, std::int64_t size_hint)
{
	if (!is_token(token) || !session_matches(token, target_path)) {
		logger_.log_u(logmsg::debug_warning, L"put_chunked_file_part(%s): no chunked write '%s' for this target.", target_path.str(), token);
		return upload::error::session_not_found;
	}

	if (!is_part_id(part_id)) {
		logger_.log_u(logmsg::debug_warning, L"put_chunked_file_part(%s): invalid part id '%s'.", target_path.str(), part_id);
		return upload::error::part_rejected;
	}

	auto part_path = session_dir(token) + fz::local_filesys::path_separator + fz::to_native(part_id) + part_suffix;

	// Each writer gets its own temporary file, so that concurrent uploads of the same part never mix.
	auto tmp_path = unique_name(part_path);

	fz::file f;
	if (auto res = f.open(tmp_path, fz::file::writing, fz::file::empty); !res) {
		logger_.log_u(logmsg::error, L"Could not create '%s': %s", tmp_path, strsyserror(res.raw_));
		return upload::error::backend_failure;
	}

	CHUNKUP_SCOPE_GUARD {
		if (!tmp_path.empty())
			fz::remove_file(tmp_path, false);
	};

	auto r = copy(data, f, opts_.max_part_size);
	if (!r) {
		if (r.error_ == fz::rwresult::nospace) {
			logger_.log_u(logmsg::debug_warning, L"Part %s of chunked write '%s' exceeds the maximum part size of %d bytes.", part_id, token, opts_.max_part_size);
			return upload::error::part_rejected;
		}

		logger_.log_u(logmsg::error, L"Could not stage part %s of chunked write '%s': %s", part_id, token, strresult(r));
		return upload::error::backend_failure;
	}

	if (size_hint >= 0 && std::int64_t(r.value_) != size_hint) {
		logger_.log_u(logmsg::debug_warning, L"Part %s of chunked write '%s' is %d bytes long, %d were declared.", part_id, token, r.value_, size_hint);
		return upload::error::part_rejected;
	}

	if (!f.fsync()) {
		logger_.log_u(logmsg::error, L"Could not flush part %s of chunked write '%s'.", part_id, token);
		return upload::error::backend_failure;
	}

	f.close();

	if (auto res = fz::rename_file(tmp_path, part_path); !res) {
		logger_.log_u(logmsg::error, L"Could not store part %s of chunked write '%s': %s", part_id, token, strsyserror(res.raw_));
		return upload::error::backend_failure;
	}

	tmp_path.clear();

	logger_.log_u(logmsg::debug_debug, L"Staged part %s of chunked write '%s': %d bytes.", part_id, token, r.value_);

	return upload::error::none;
}

std::pair<upload::error, std::int64_t> local_filesys::write_chunked_file(const util::fs::absolute_unix_path &target_path, std::string_view token)
{
	if (!is_token(token) || !session_matches(token, target_path)) {
		logger_.log_u(logmsg::debug_warning, L"write_chunked_file(%s): no chunked write '%s' for this target.", target_path.str(), token);
		return { upload::error::session_not_found, -1 };
	}

	auto dir = session_dir(token);

	std::vector<std::pair<std::uint64_t, fz::native_string>> parts;

	{
		fz::local_filesys lfs;
		if (auto res = lfs.begin_find_files(dir, false, false); !res) {
			logger_.log_u(logmsg::error, L"Could not list the parts of chunked write '%s': %s", token, strsyserror(res.raw_));
			return { upload::error::assembly_failure, -1 };
		}

		fz::native_string name;
		bool is_link{};
		fz::local_filesys::type type{};

		while (lfs.get_next_file(name, is_link, type, nullptr, nullptr, nullptr)) {
			if (type != fz::local_filesys::file || !fz::ends_with(name, part_suffix))
				continue;

			auto id = fz::to_utf8(name.substr(0, name.size() - part_suffix.size()));
			if (!is_part_id(id))
				continue;

			parts.emplace_back(fz::to_integral<std::uint64_t>(id), dir + fz::local_filesys::path_separator + name);
		}
	}

	if (parts.empty()) {
		logger_.log_u(logmsg::debug_warning, L"write_chunked_file(%s): chunked write '%s' has no parts.", target_path.str(), token);
		return { upload::error::incomplete_upload, -1 };
	}

	std::sort(parts.begin(), parts.end());

	auto native_target = native(target_path);
	auto assembly_path = native(target_path.parent()) + fz::local_filesys::path_separator + assembly_name(target_path, token);

	fz::file out;
	if (auto res = out.open(assembly_path, fz::file::writing, fz::file::empty); !res) {
		logger_.log_u(logmsg::error, L"Could not create '%s': %s", assembly_path, strsyserror(res.raw_));
		return { upload::error::assembly_failure, -1 };
	}

	bool assembled = false;

	CHUNKUP_SCOPE_GUARD {
		if (!assembled)
			fz::remove_file(assembly_path, false);
	};

	std::int64_t size = 0;

	for (auto &[n, path]: parts) {
		fz::file in;
		if (auto res = in.open(path, fz::file::reading, fz::file::existing); !res) {
			logger_.log_u(logmsg::error, L"Could not open part %d of chunked write '%s': %s", n, token, strsyserror(res.raw_));
			return { upload::error::assembly_failure, -1 };
		}

		file_reader part(std::move(in));
		auto r = copy(part, out);

		if (!r) {
			logger_.log_u(logmsg::error, L"Could not append part %d of chunked write '%s': %s", n, token, strresult(r));
			return { upload::error::assembly_failure, -1 };
		}

		size += std::int64_t(r.value_);
	}

	if (!out.fsync()) {
		logger_.log_u(logmsg::error, L"Could not flush the assembled file of chunked write '%s'.", token);
		return { upload::error::assembly_failure, -1 };
	}

	out.close();

	if (auto res = fz::rename_file(assembly_path, native_target); !res) {
		logger_.log_u(logmsg::error, L"Could not move the assembled file of chunked write '%s' into '%s': %s", token, native_target, strsyserror(res.raw_));
		return { upload::error::assembly_failure, -1 };
	}

	assembled = true;

	if (!fz::recursive_remove().remove(dir))
		logger_.log_u(logmsg::warning, L"Could not remove the staging directory '%s'.", dir);

	logger_.log_u(logmsg::debug_info, L"Assembled %d parts of chunked write '%s' into '%s': %d bytes.", parts.size(), token, target_path.str(), size);

	return { upload::error::none, size };
}

void local_filesys::cancel_chunked_file(const util::fs::absolute_unix_path &target_path, std::string_view token)
{
	if (!is_token(token))
		return;

	auto dir = session_dir(token);

	if (fz::local_filesys::get_file_type(dir, false) == fz::local_filesys::dir) {
		if (!session_matches(token, target_path)) {
			logger_.log_u(logmsg::warning, L"Not cancelling chunked write '%s': it doesn't belong to '%s'.", token, target_path.str());
			return;
		}

		if (!fz::recursive_remove().remove(dir)) {
			logger_.log_u(logmsg::warning, L"Could not remove the staging directory '%s'.", dir);
			return;
		}
	}

	if (target_path && !target_path.is_root())
		fz::remove_file(native(target_path.parent()) + fz::local_filesys::path_separator + assembly_name(target_path, token), false);

	logger_.log_u(logmsg::debug_info, L"Cancelled chunked write '%s'.", token);
}

}
