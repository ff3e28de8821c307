#include <libfilezilla/encode.hpp>

#include "headers.hpp"

namespace chunkup::dav {

const headers::key_type headers::Content_Length = "Content-Length";
const headers::key_type headers::Content_Type = "Content-Type";
const headers::key_type headers::Destination = "Destination";
const headers::key_type headers::ETag = "ETag";
const headers::key_type headers::Overwrite = "Overwrite";
const headers::key_type headers::X_Chunkup_Chunking = "X-Chunkup-Chunking";
const headers::key_type headers::X_Chunkup_Destination = "X-Chunkup-Destination";

bool headers::has(std::string_view key) const
{
	return find(key_type(key)) != end();
}

std::string_view headers::get(std::string_view key, std::string_view def) const
{
	if (auto it = find(key_type(key)); it != end())
		return it->second;

	return def;
}

std::int64_t headers::get_content_length() const
{
	auto v = get(Content_Length);
	if (v.empty())
		return -1;

	return fz::to_integral<std::int64_t>(fz::trimmed(v), -1);
}

bool headers::get_overwrite() const
{
	return !fz::equal_insensitive_ascii(fz::trimmed(get(Overwrite, "T")), std::string_view("F"));
}

std::string path_from_header_value(std::string_view value)
{
	value = fz::trimmed(value);

	if (auto scheme_end = value.find("://"); scheme_end != std::string_view::npos) {
		auto path_start = value.find('/', scheme_end + 3);
		value = path_start == std::string_view::npos ? std::string_view("/") : value.substr(path_start);
	}

	// Neither query nor fragment are part of the path.
	if (auto pos = value.find_first_of("?#"); pos != std::string_view::npos)
		value = value.substr(0, pos);

	if (value.empty())
		return {};

	return fz::percent_decode_s(value, false, false);
}

}
