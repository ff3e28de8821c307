#ifndef CHUNKUP_DAV_HEADERS_HPP
#define CHUNKUP_DAV_HEADERS_HPP

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

#include <libfilezilla/string.hpp>

namespace chunkup::dav
{

class headers: public std::map<std::string, std::string, fz::less_insensitive_ascii>
{
public:
	static const key_type Content_Length;
	static const key_type Content_Type;
	static const key_type Destination;
	static const key_type ETag;
	static const key_type Overwrite;
	static const key_type X_Chunkup_Chunking;
	static const key_type X_Chunkup_Destination;

public:
	using map::map;

	bool has(std::string_view key) const;
	std::string_view get(std::string_view key, std::string_view def = {}) const;

	/// \returns the value of Content-Length, or -1 if it's missing or malformed.
	std::int64_t get_content_length() const;

	/// \returns false only if the Overwrite header is present and is "F".
	bool get_overwrite() const;
};

/// \brief Turns the value of a header holding a resource, like Destination, into a decoded path.
/// Scheme and authority, if present, are dropped.
/// \returns the empty string if the value is empty or can't be decoded.
std::string path_from_header_value(std::string_view value);

}

#endif // CHUNKUP_DAV_HEADERS_HPP
