#include "../logger/type.hpp"

#include "chunking_plugin.hpp"
#include "server.hpp"

namespace chunkup::dav {

chunking_plugin::chunking_plugin(upload::orchestrator &orchestrator, fz::logger_interface &logger, tvfs::event_sink &events)
	: orchestrator_(orchestrator)
	, logger_(logger, "dav chunking")
	, events_(events)
{
}

upload::orchestrator::context chunking_plugin::context_for(const request &req) const
{
	return { req.headers.has(headers::X_Chunkup_Chunking), events_ };
}

unsigned int chunking_plugin::status_from_error(upload::error e)
{
	switch (e) {
		case upload::error::none: return 200;
		case upload::error::invalid_part_number: return 400;
		case upload::error::incomplete_upload: return 400;
		case upload::error::session_not_found: return 404;
		case upload::error::part_rejected: return 413;
		case upload::error::storage_unsupported: return 501;
		case upload::error::backend_unsupported: return 501;
		case upload::error::backend_failure: return 500;
		case upload::error::assembly_failure: return 500;
	}

	return 500;
}

void chunking_plugin::send_outcome(responder &res, const upload::orchestrator::outcome &o)
{
	switch (o.status) {
		case upload::orchestrator::outcome::pass_through:
			break;

		case upload::orchestrator::outcome::created:
			res.send_status(201, "Created") &&
			res.send_end();
			break;

		case upload::orchestrator::outcome::no_content:
			res.send_status(204, "No Content") &&
			res.send_end();
			break;

		case upload::orchestrator::outcome::failed:
			if (o.error)
				res.send_status(status_from_error(o.error)) &&
				res.send_body(upload::toString<std::string>(o.error) + "\n");
			else
				server::send_response_from_result(res, o.fs_result);
			break;
	}
}

bool chunking_plugin::after_mkcol(request &req, responder &res)
{
	auto destination = path_from_header_value(req.headers.get(headers::X_Chunkup_Destination));

	auto o = orchestrator_.create(context_for(req), req.path, destination);

	// On success the server responds as for any other collection.
	if (o.status != upload::orchestrator::outcome::failed)
		return true;

	send_outcome(res, o);
	return false;
}

bool chunking_plugin::before_put(request &req, responder &res)
{
	tvfs::string_reader empty;
	auto &body = req.body ? *req.body : static_cast<tvfs::reader &>(empty);

	auto o = orchestrator_.put_part(context_for(req), req.path, body, req.headers.get_content_length());
	if (!o.handled())
		return true;

	send_outcome(res, o);
	return false;
}

bool chunking_plugin::before_move(request &req, responder &res)
{
	auto destination = path_from_header_value(req.headers.get(headers::Destination));
	if (destination.empty()) {
		logger_.log_u(logmsg::debug_warning, L"MOVE %s without a destination, letting the server deal with it.", req.path);
		return true;
	}

	auto o = orchestrator_.finalize(context_for(req), req.path, destination);
	if (!o.handled())
		return true;

	send_outcome(res, o);
	return false;
}

bool chunking_plugin::before_delete(request &req, responder &res)
{
	auto o = orchestrator_.abort(context_for(req), req.path);
	if (!o.handled())
		return true;

	send_outcome(res, o);
	return false;
}

}
