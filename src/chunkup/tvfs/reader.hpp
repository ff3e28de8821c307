#ifndef CHUNKUP_TVFS_READER_HPP
#define CHUNKUP_TVFS_READER_HPP

#include <string>
#include <utility>

#include <libfilezilla/file.hpp>
#include <libfilezilla/fsresult.hpp>
#include <libfilezilla/hash.hpp>

namespace chunkup::tvfs {

/// \brief A forward-only source of bytes: a request body, a file being read, an object in memory.
class reader
{
public:
	virtual ~reader() = default;

	/// \brief Reads up to \c size bytes into \c data.
	/// \returns the number of bytes read in the value_ member, 0 meaning that the end of the data has been reached.
	virtual fz::rwresult read(void *data, std::size_t size) = 0;
};

class string_reader final: public reader
{
public:
	explicit string_reader(std::string data = {})
		: data_(std::move(data))
	{}

	fz::rwresult read(void *data, std::size_t size) override;

private:
	std::string data_;
	std::size_t pos_{};
};

class file_reader final: public reader
{
public:
	explicit file_reader(fz::file &&file)
		: file_(std::move(file))
	{}

	fz::rwresult read(void *data, std::size_t size) override;

	fz::file &file()
	{
		return file_;
	}

private:
	fz::file file_;
};

/// \brief Hands out the bytes of another reader, computing their md5 digest along the way.
class hashing_reader final: public reader
{
public:
	explicit hashing_reader(reader &source)
		: source_(source)
		, hash_(fz::hash_algorithm::md5)
	{}

	fz::rwresult read(void *data, std::size_t size) override;

	/// The hex encoded digest of all the bytes read so far.
	std::string hex_digest();

private:
	reader &source_;
	fz::hash_accumulator hash_;
};

/// \brief Copies the whole content of \c from into \c to.
/// \param limit if non-negative, the copy fails with rwresult::nospace as soon as more than limit bytes would be written.
/// \returns in value_ the number of bytes copied.
fz::rwresult copy(reader &from, fz::file &to, std::int64_t limit = -1);

/// \brief Reads the whole content of \c from into \c out, failing with rwresult::nospace beyond \c limit bytes, if non-negative.
fz::rwresult read_all(reader &from, std::string &out, std::int64_t limit = -1);

}

#endif // CHUNKUP_TVFS_READER_HPP
