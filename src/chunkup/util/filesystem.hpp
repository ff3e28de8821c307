#ifndef CHUNKUP_UTIL_FILESYSTEM_HPP
#define CHUNKUP_UTIL_FILESYSTEM_HPP

#include <string>
#include <string_view>
#include <vector>

#include <libfilezilla/string.hpp>

namespace chunkup::util::fs {

//! An absolute, normalized, unix-style path.
//! "." elements and repeated or trailing slashes are removed, ".." elements are resolved, never climbing above the root.
//! A path that is not absolute, or that holds a NUL character, is invalid and converts to false.
class absolute_unix_path
{
public:
	absolute_unix_path() = default;
	absolute_unix_path(std::string_view path);
	absolute_unix_path(const std::string &path)
		: absolute_unix_path(std::string_view(path))
	{}
	absolute_unix_path(const char *path)
		: absolute_unix_path(std::string_view(path))
	{}

	explicit operator bool() const
	{
		return !string_.empty();
	}

	const std::string &str() const
	{
		return string_;
	}

	operator const std::string &() const
	{
		return string_;
	}

	operator std::string_view() const
	{
		return string_;
	}

	bool is_root() const
	{
		return string_ == "/";
	}

	std::vector<std::string_view> elements_view() const;

	//! The last element of the path, empty for the root or an invalid path.
	std::string_view base() const;

	//! The parent of the path. The parent of the root is the root itself.
	absolute_unix_path parent() const;

	//! Whether this path is \c dir itself or lies anywhere below it.
	bool is_within(const absolute_unix_path &dir) const;

	//! Whether this path lies immediately below \c dir.
	bool is_child_of(const absolute_unix_path &dir) const;

	//! Appends a relative path. An absolute rhs replaces the path altogether.
	absolute_unix_path operator/(std::string_view rhs) const;

	//! The portion of this path below \c prefix, itself absolute. Invalid if this path isn't within prefix.
	absolute_unix_path relative_to(const absolute_unix_path &prefix) const;

	friend bool operator==(const absolute_unix_path &lhs, const absolute_unix_path &rhs)
	{
		return lhs.string_ == rhs.string_;
	}

	friend bool operator!=(const absolute_unix_path &lhs, const absolute_unix_path &rhs)
	{
		return !(lhs == rhs);
	}

	friend bool operator<(const absolute_unix_path &lhs, const absolute_unix_path &rhs)
	{
		return lhs.string_ < rhs.string_;
	}

private:
	std::string string_;
};

//! Converts an absolute unix path into a native one, rooted at \c root.
fz::native_string to_native(const fz::native_string &root, const absolute_unix_path &path);

}

#endif // CHUNKUP_UTIL_FILESYSTEM_HPP
