#ifndef CHUNKUP_DAV_REQUEST_HPP
#define CHUNKUP_DAV_REQUEST_HPP

#include <string>

#include "../tvfs/reader.hpp"
#include "headers.hpp"

namespace chunkup::dav {

struct request
{
	std::string method;

	/// Decoded, absolute path of the resource the request is about.
	std::string path;

	dav::headers headers;

	/// The request's body, if it has one. Not owned.
	tvfs::reader *body{};
};

}

#endif // CHUNKUP_DAV_REQUEST_HPP
