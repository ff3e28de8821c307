#ifndef CHUNKUP_DAV_CHUNKING_PLUGIN_HPP
#define CHUNKUP_DAV_CHUNKING_PLUGIN_HPP

#include "../logger/modularized.hpp"
#include "../upload/orchestrator.hpp"

#include "plugin.hpp"

namespace chunkup::dav {

/* Chunked uploads:
 *
 *	All the requests below must carry the X-Chunkup-Chunking header, whatever its value, or they get the ordinary treatment.
 *
 *	MKCOL /uploads/<session>
 *		X-Chunkup-Destination: /path/to/file
 *		Opens an upload session for the file.
 *
 *	PUT /uploads/<session>/<N>
 *		Uploads part N, 1 <= N <= 10000. Uploading the same part twice replaces it.
 *
 *	MOVE /uploads/<session>[/<anything>]
 *		Destination: /path/to/file
 *		Assembles the parts, in ascending order, into the file. The session is gone afterwards, whatever the outcome.
 *
 *	DELETE /uploads/<session>
 *		Aborts the session.
 *
 *	Status Codes:
 *		201 Created - Session opened, part stored, new file assembled
 *		204 No Content - Existing file overwritten, session aborted
 *		400 Bad Request - Invalid part number, nothing to assemble
 *		404 Not Found - No such session
 *		413 Payload Too Large - The storage rejected the part
 *		501 Not Implemented - The destination's storage can't take this session's parts
 *		500 Internal Server Error - The storage failed
 */
class chunking_plugin final: public plugin
{
public:
	chunking_plugin(upload::orchestrator &orchestrator, fz::logger_interface &logger, tvfs::event_sink &events = tvfs::get_null_event_sink());

	bool before_put(request &req, responder &res) override;
	bool after_mkcol(request &req, responder &res) override;
	bool before_move(request &req, responder &res) override;
	bool before_delete(request &req, responder &res) override;

	static void send_outcome(responder &res, const upload::orchestrator::outcome &o);
	static unsigned int status_from_error(upload::error e);

private:
	upload::orchestrator::context context_for(const request &req) const;

	upload::orchestrator &orchestrator_;
	logger::modularized logger_;
	tvfs::event_sink &events_;
};

}

#endif // CHUNKUP_DAV_CHUNKING_PLUGIN_HPP
