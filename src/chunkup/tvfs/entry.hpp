#ifndef CHUNKUP_TVFS_ENTRY_HPP
#define CHUNKUP_TVFS_ENTRY_HPP

#include <string>
#include <cstdint>

#include <libfilezilla/local_filesys.hpp>
#include <libfilezilla/time.hpp>

namespace chunkup::tvfs {

using entry_type = fz::local_filesys::type;
using entry_size = std::int64_t;
using entry_time = fz::datetime;

class entry
{
public:
	entry() = default;
	entry(std::string name, entry_type type, entry_size size = -1, entry_time mtime = {})
		: name_(std::move(name))
		, type_(type)
		, size_(type == fz::local_filesys::dir ? -1 : size)
		, mtime_(std::move(mtime))
	{}

	const std::string &name() const
	{
		return name_;
	}

	entry_type type() const
	{
		return type_;
	}

	entry_size size() const
	{
		return size_;
	}

	const entry_time &mtime() const
	{
		return mtime_;
	}

	bool is_dir() const
	{
		return type_ == fz::local_filesys::dir;
	}

	bool is_file() const
	{
		return type_ == fz::local_filesys::file;
	}

private:
	std::string name_;
	entry_type type_{fz::local_filesys::unknown};
	entry_size size_{-1};
	entry_time mtime_;
};

}

#endif // CHUNKUP_TVFS_ENTRY_HPP
