#include <libfilezilla/string.hpp>

#include "file_cache.hpp"

namespace chunkup::tvfs {

namespace {

bool has_prefix(std::string_view key, std::string_view dir)
{
	return key.substr(0, dir.size()) == dir;
}

bool is_within(std::string_view key, std::string_view dir)
{
	if (!has_prefix(key, dir))
		return false;

	return key.size() == dir.size() || dir == "/" || key[dir.size()] == '/';
}

}

std::string_view file_cache::mime_from_name(std::string_view name)
{
	static const std::map<std::string_view /* ext */, std::string_view /* mime */, fz::less_insensitive_ascii> map = {
		{ "txt",  "text/plain" },
		{ "md",   "text/markdown" },
		{ "csv",  "text/csv" },
		{ "js",   "text/javascript" },
		{ "css",  "text/css" },
		{ "html", "text/html"},
		{ "json", "application/json" },
		{ "xml",  "application/xml" },
		{ "pdf",  "application/pdf" },
		{ "zip",  "application/zip" },
		{ "gz",   "application/gzip" },
		{ "tar",  "application/x-tar" },
		{ "svg",  "image/svg+xml" },
		{ "png",  "image/png" },
		{ "jpeg", "image/jpeg" },
		{ "jpg",  "image/jpeg" },
		{ "gif",  "image/gif" },
		{ "mp3",  "audio/mpeg" },
		{ "mp4",  "video/mp4" },
		{ "mkv",  "video/x-matroska" }
	};

	if (auto dot = name.rfind('.'); dot != name.npos && dot != 0) {
		auto it = map.find(name.substr(dot+1));
		if (it != map.end()) {
			return it->second;
		}
	}

	return "application/octet-stream";
}

file_metadata file_cache::update(const util::fs::absolute_unix_path &path, std::int64_t size, std::string etag, fz::datetime mtime)
{
	file_metadata m;
	m.size = size;
	m.mimetype = mime_from_name(path.base());
	m.etag = std::move(etag);
	m.mtime = mtime;

	fz::scoped_lock lock(mutex_);
	entries_[path.str()] = m;

	return m;
}

void file_cache::remove(const util::fs::absolute_unix_path &path)
{
	fz::scoped_lock lock(mutex_);

	// Siblings like "/a.txt" sort between "/a" and "/a/b", hence the prefix scan.
	for (auto it = entries_.lower_bound(path.str()); it != entries_.end() && has_prefix(it->first, path.str());) {
		if (is_within(it->first, path.str()))
			it = entries_.erase(it);
		else
			++it;
	}
}

void file_cache::move(const util::fs::absolute_unix_path &from, const util::fs::absolute_unix_path &to)
{
	fz::scoped_lock lock(mutex_);

	std::map<std::string, file_metadata, std::less<>> moved;

	for (auto it = entries_.lower_bound(from.str()); it != entries_.end() && has_prefix(it->first, from.str());) {
		if (!is_within(it->first, from.str())) {
			++it;
			continue;
		}

		auto rest = std::string_view(it->first).substr(from.str().size());
		moved.emplace(to.str() + std::string(rest), std::move(it->second));
		it = entries_.erase(it);
	}

	entries_.erase(to.str());

	for (auto &m: moved)
		entries_[m.first] = std::move(m.second);
}

std::optional<file_metadata> file_cache::get(const util::fs::absolute_unix_path &path) const
{
	fz::scoped_lock lock(mutex_);

	if (auto it = entries_.find(path.str()); it != entries_.end())
		return it->second;

	return std::nullopt;
}

}
