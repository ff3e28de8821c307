#ifndef CHUNKUP_DAV_SERVER_HPP
#define CHUNKUP_DAV_SERVER_HPP

#include <vector>

#include <libfilezilla/fsresult.hpp>
#include <libfilezilla/logger.hpp>

#include "../logger/modularized.hpp"
#include "../tvfs/engine.hpp"
#include "../tvfs/events.hpp"

#include "plugin.hpp"
#include "request.hpp"
#include "responder.hpp"

namespace chunkup::dav {

/* Requests handled:
 *
 *	GET /path/to/entry
 *		Returns the entry's content. A directory's content is the list of its entries, one per line, directories with a trailing slash.
 *
 *		Status Codes:
 *			200 OK - Successful retrieval
 *			404 Not Found - Entry not found
 *
 *	PUT /path/to/entry
 *		Replaces the content of the entry with the body of the request.
 *
 *		Status Codes:
 *			201 Created - The entry didn't exist
 *			204 No Content - The entry has been overwritten
 *			404 Not Found - The parent directory doesn't exist
 *			409 Conflict - The entry is a directory
 *
 *	MKCOL /path/to/directory
 *		Creates a directory. Its parent must exist.
 *
 *		Status Codes:
 *			201 Created - Successful creation
 *			405 Method Not Allowed - The entry already exists
 *			409 Conflict - The parent directory doesn't exist
 *
 *	MOVE /path/to/source
 *		Moves the entry to the path in the Destination header. An existing file at the destination is replaced,
 *		unless the Overwrite header is "F".
 *
 *		Status Codes:
 *			201 Created - The destination didn't exist
 *			204 No Content - The destination has been overwritten
 *			400 Bad Request - Missing or invalid Destination header
 *			404 Not Found - The source doesn't exist
 *			412 Precondition Failed - The destination exists and Overwrite is "F"
 *
 *	DELETE /path/to/entry
 *		Deletes the entry, recursively if it's a directory.
 *
 *		Status Codes:
 *			204 No Content - Successful deletion
 *			404 Not Found - Entry not found
 *
 *	Plugins get to handle requests before (or, for MKCOL, after) the server does. See plugin.hpp.
 */
class server
{
public:
	struct options
	{
		options(){}

		bool can_get{true};
		bool can_put{true};
		bool can_mkcol{true};
		bool can_move{true};
		bool can_delete{true};
	};

	server(tvfs::engine &tvfs, fz::logger_interface &logger, tvfs::event_sink &events = tvfs::get_null_event_sink(), options opts = {});

	void add_plugin(plugin &p);

	void handle(request &req, responder &res);

	/// \brief Responds according to the outcome of a file system operation.
	/// \param success_code the status to respond with if \c result is successful.
	static void send_response_from_result(responder &res, fz::result result, unsigned int success_code = 204);

private:
	void do_get(request &req, responder &res);
	void do_put(request &req, responder &res);
	void do_mkcol(request &req, responder &res);
	void do_move(request &req, responder &res);
	void do_delete(request &req, responder &res);

	void send_not_allowed_response(responder &res);

	tvfs::engine &tvfs_;
	logger::modularized logger_;
	tvfs::event_sink &events_;
	options opts_;
	std::vector<plugin *> plugins_;
};

}

#endif // CHUNKUP_DAV_SERVER_HPP
