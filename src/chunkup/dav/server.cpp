#include <libfilezilla/format.hpp>

#include "../logger/type.hpp"
#include "../strresult.hpp"

#include "server.hpp"

namespace chunkup::dav {

server::server(tvfs::engine &tvfs, fz::logger_interface &logger, tvfs::event_sink &events, options opts)
	: tvfs_(tvfs)
	, logger_(logger, "dav")
	, events_(events)
	, opts_(std::move(opts))
{
}

void server::add_plugin(plugin &p)
{
	plugins_.push_back(&p);
}

void server::send_response_from_result(responder &res, fz::result result, unsigned int success_code)
{
	if (result) {
		res.send_status(success_code) &&
		res.send_end();
	}
	else
	if (result.error_ == result.invalid) {
		res.send_status(400, "Bad Request") &&
		res.send_end();
	}
	else
	if (result.error_ == result.noperm) {
		res.send_status(403, "Forbidden") &&
		res.send_end();
	}
	else
	if (result.error_ == result.nofile || result.error_ == result.nodir) {
		res.send_status(404, "Not Found") &&
		res.send_end();
	}
	else
	if (result.error_ == result.nospace) {
		res.send_status(507, "Insufficient Storage") &&
		res.send_end();
	}
	else
	if (result.raw_ == CHUNKUP_RESULT_RAW_NOT_IMPLEMENTED) {
		res.send_status(501, "Not Implemented") &&
		res.send_end();
	}
	else
	if (result.raw_ == CHUNKUP_RESULT_RAW_ALREADY_EXISTS || result.raw_ == CHUNKUP_RESULT_RAW_NOT_EMPTY) {
		res.send_status(409, "Conflict") &&
		res.send_end();
	}
	else
	if (result.raw_ == CHUNKUP_RESULT_RAW_CROSS_DEVICE) {
		res.send_status(502, "Bad Gateway") &&
		res.send_end();
	}
	else {
		res.send_status(500, "Internal Server Error") &&
		res.send_body(fz::sprintf("%s\n", strresult(result)));
	}
}

void server::send_not_allowed_response(responder &res)
{
	std::string allowed;

	auto add = [&allowed](bool can, std::string_view verb) {
		if (!can)
			return;

		if (!allowed.empty())
			allowed += ", ";

		allowed += verb;
	};

	add(opts_.can_get, "GET");
	add(opts_.can_put, "PUT");
	add(opts_.can_mkcol, "MKCOL");
	add(opts_.can_move, "MOVE");
	add(opts_.can_delete, "DELETE");

	if (!allowed.empty()) {
		res.send_status(405, "Method Not Allowed") &&
		res.send_header("Allow", allowed) &&
		res.send_end();
	}
	else {
		res.send_status(403, "Forbidden") &&
		res.send_end();
	}
}

void server::do_get(request &req, responder &res)
{
	auto [result, e] = tvfs_.get_entry(req.path);

	if (!result)
		return send_response_from_result(res, result);

	if (e.is_dir()) {
		std::vector<tvfs::entry> entries;
		if (auto r = tvfs_.get_entries(entries, req.path); !r)
			return send_response_from_result(res, r);

		std::string listing;
		for (auto &c: entries) {
			listing += c.name();
			if (c.is_dir())
				listing += '/';
			listing += '\n';
		}

		res.send_status(200, "OK") &&
		res.send_header(headers::Content_Type, "text/plain; charset=utf-8") &&
		res.send_body(listing);

		return;
	}

	std::unique_ptr<tvfs::reader> reader;
	if (auto r = tvfs_.open_reader(reader, req.path); !r)
		return send_response_from_result(res, r);

	auto path = util::fs::absolute_unix_path(req.path);
	auto m = tvfs_.get_file_cache().get(path);

	res.send_status(200, "OK") &&
	res.send_header(headers::Content_Type, m ? std::string_view(m->mimetype) : tvfs::file_cache::mime_from_name(path.base())) &&
	(!m || res.send_header(headers::ETag, fz::sprintf("\"%s\"", m->etag))) &&
	res.send_body(*reader);
}

void server::do_put(request &req, responder &res)
{
	for (auto p: plugins_) {
		if (!p->before_put(req, res))
			return;
	}

	tvfs::string_reader empty;
	auto &body = req.body ? *req.body : static_cast<tvfs::reader &>(empty);

	auto [result, overwritten] = tvfs_.put_contents(req.path, body);

	if (!result)
		logger_.log_u(logmsg::error, L"Could not write '%s': %s.", req.path, strresult(result));

	send_response_from_result(res, result, overwritten ? 204 : 201);
}

void server::do_mkcol(request &req, responder &res)
{
	if (auto result = tvfs_.make_directory(req.path); !result) {
		if (result.raw_ == CHUNKUP_RESULT_RAW_ALREADY_EXISTS) {
			res.send_status(405, "Method Not Allowed") &&
			res.send_end();
		}
		else
		if (result.error_ == fz::result::nodir || result.error_ == fz::result::nofile) {
			res.send_status(409, "Conflict") &&
			res.send_end();
		}
		else
			send_response_from_result(res, result);

		return;
	}

	for (auto p: plugins_) {
		if (!p->after_mkcol(req, res))
			return;
	}

	res.send_status(201, "Created") &&
	res.send_end();
}

void server::do_move(request &req, responder &res)
{
	for (auto p: plugins_) {
		if (!p->before_move(req, res))
			return;
	}

	auto destination = path_from_header_value(req.headers.get(headers::Destination));
	if (destination.empty() || !util::fs::absolute_unix_path(destination)) {
		logger_.log_u(logmsg::error, L"Missing or invalid %s header.", headers::Destination);

		res.send_status(400, "Bad Request") &&
		res.send_end();

		return;
	}

	bool existed = bool(tvfs_.get_entry(destination).first);

	if (existed && !req.headers.get_overwrite()) {
		res.send_status(412, "Precondition Failed") &&
		res.send_end();

		return;
	}

	auto result = tvfs_.rename(req.path, destination);

	if (result) {
		events_.after_move(req.path, destination);
		events_.after_unbind(req.path);
		events_.after_bind(destination);
	}

	send_response_from_result(res, result, existed ? 204 : 201);
}

void server::do_delete(request &req, responder &res)
{
	for (auto p: plugins_) {
		if (!p->before_delete(req, res))
			return;
	}

	auto result = tvfs_.remove_file(req.path);

	if (result.error_ == fz::result::nofile)
		result = tvfs_.remove_directory(req.path, true);

	if (result)
		events_.after_unbind(req.path);

	send_response_from_result(res, result);
}

void server::handle(request &req, responder &res)
{
	logger_.log_u(logmsg::debug_info, L"%s %s", req.method, req.path);

	for (auto &h: req.headers)
		logger_.log_u(logmsg::debug_verbose, L"H: %s: %s", h.first, h.second);

	if (!util::fs::absolute_unix_path(req.path)) {
		res.send_status(400, "Bad Request") &&
		res.send_end();

		return;
	}

	if (req.method == "GET" && opts_.can_get)
		return do_get(req, res);

	if (req.method == "PUT" && opts_.can_put)
		return do_put(req, res);

	if (req.method == "MKCOL" && opts_.can_mkcol)
		return do_mkcol(req, res);

	if (req.method == "MOVE" && opts_.can_move)
		return do_move(req, res);

	if (req.method == "DELETE" && opts_.can_delete)
		return do_delete(req, res);

	send_not_allowed_response(res);
}

}
