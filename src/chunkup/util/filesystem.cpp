#include <libfilezilla/local_filesys.hpp>

#include "filesystem.hpp"

namespace chunkup::util::fs {

absolute_unix_path::absolute_unix_path(std::string_view path)
{
	if (path.empty() || path.front() != '/' || path.find('\0') != std::string_view::npos)
		return;

	std::vector<std::string_view> normalized;

	for (auto e: fz::strtok_view(path, "/", true)) {
		if (e == ".")
			continue;

		if (e == "..") {
			if (!normalized.empty())
				normalized.pop_back();

			continue;
		}

		normalized.push_back(e);
	}

	if (normalized.empty()) {
		string_ = "/";
		return;
	}

	for (auto e: normalized)
		string_.append(1, '/').append(e);
}

std::vector<std::string_view> absolute_unix_path::elements_view() const
{
	return fz::strtok_view(string_, "/", true);
}

std::string_view absolute_unix_path::base() const
{
	if (string_.size() <= 1)
		return {};

	return std::string_view(string_).substr(string_.rfind('/') + 1);
}

absolute_unix_path absolute_unix_path::parent() const
{
	if (string_.size() <= 1)
		return *this;

	auto pos = string_.rfind('/');
	if (pos == 0)
		return absolute_unix_path("/");

	absolute_unix_path ret;
	ret.string_ = string_.substr(0, pos);
	return ret;
}

bool absolute_unix_path::is_within(const absolute_unix_path &dir) const
{
	if (!*this || !dir)
		return false;

	if (dir.is_root() || string_ == dir.string_)
		return true;

	return fz::starts_with(string_, dir.string_) && string_[dir.string_.size()] == '/';
}

bool absolute_unix_path::is_child_of(const absolute_unix_path &dir) const
{
	return *this && !is_root() && parent() == dir;
}

absolute_unix_path absolute_unix_path::operator/(std::string_view rhs) const
{
	if (!*this)
		return {};

	if (!rhs.empty() && rhs.front() == '/')
		return absolute_unix_path(rhs);

	std::string joined = string_;
	joined.append(1, '/').append(rhs);

	return absolute_unix_path(joined);
}

absolute_unix_path absolute_unix_path::relative_to(const absolute_unix_path &prefix) const
{
	if (!is_within(prefix))
		return {};

	if (prefix.is_root())
		return *this;

	if (string_.size() == prefix.string_.size())
		return absolute_unix_path("/");

	return absolute_unix_path(std::string_view(string_).substr(prefix.string_.size()));
}

fz::native_string to_native(const fz::native_string &root, const absolute_unix_path &path)
{
	if (root.empty() || !path)
		return {};

	auto native = root;
	while (native.size() > 1 && native.back() == fz::local_filesys::path_separator)
		native.pop_back();

	for (auto e: path.elements_view()) {
		native += fz::local_filesys::path_separator;
		native += fz::to_native(fz::to_wstring_from_utf8(e));
	}

	return native;
}

}
