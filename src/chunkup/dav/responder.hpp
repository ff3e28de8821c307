#ifndef CHUNKUP_DAV_RESPONDER_HPP
#define CHUNKUP_DAV_RESPONDER_HPP

#include <string_view>

#include "../tvfs/reader.hpp"

namespace chunkup::dav {

/// \brief Interface for sending responses
/// \note all the methods return a boolean for success (true) or failure (false)
class responder
{
public:
	virtual ~responder() = default;

	/// \brief Sends the response status and related reason
	/// \note If the reason is the empty string, the default reason for the given code is used.
	virtual bool send_status(unsigned int code, std::string_view reason = {}) = 0;

	virtual bool send_header(std::string_view name, std::string_view value) = 0;

	/// \brief Sends the given string_view as the body of the response, then ends the response.
	virtual bool send_body(std::string_view body) = 0;

	/// \brief Sends whatever \c body provides as the body of the response, then ends the response.
	virtual bool send_body(tvfs::reader &body) = 0;

	/// \brief Ends the response, which has no body.
	virtual bool send_end() = 0;

	static std::string_view default_reason(unsigned int code);
};

}

#endif // CHUNKUP_DAV_RESPONDER_HPP
