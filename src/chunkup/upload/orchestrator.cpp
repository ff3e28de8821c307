#include "../logger/type.hpp"
#include "../strresult.hpp"
#include "../util/scope_guard.hpp"

#include "orchestrator.hpp"

namespace chunkup::upload {

namespace {

using outcome = orchestrator::outcome;

outcome pass()
{
	return {};
}

outcome done(outcome::status_type status)
{
	return { status, error::none, fz::result{fz::result::ok} };
}

outcome fail(error e)
{
	return { outcome::failed, e, fz::result{fz::result::ok} };
}

outcome fail(fz::result r)
{
	return { outcome::failed, error::none, r };
}

}

orchestrator::orchestrator(tvfs::engine &tvfs, props::property_store &store, fz::logger_interface &logger, options opts)
	: tvfs_(tvfs)
	, store_(store)
	, logger_(logger, "chunking")
	, opts_(std::move(opts))
	, uploads_root_(opts_.uploads_root)
{
	if (!uploads_root_)
		logger_.log_u(logmsg::error, L"Invalid uploads root '%s': chunked uploads are disabled.", opts_.uploads_root);
}

orchestrator::location orchestrator::locate(const util::fs::absolute_unix_path &session_id)
{
	location loc;

	if (!uploads_root_ || !session_id.is_child_of(uploads_root_))
		return loc;

	loc.where = tvfs_.resolve_path(session_id.str());
	if (!loc.where)
		return loc;

	loc.writer = loc.where.backend->chunked_file_write();
	if (!loc.writer) {
		logger_.log_u(logmsg::debug_info, L"%s: %s.", session_id.str(), toString<std::string>(error(error::storage_unsupported)));
		return loc;
	}

	loc.id = session_id;
	return loc;
}

void orchestrator::teardown(const util::fs::absolute_unix_path &session_id)
{
	if (auto res = tvfs_.remove_directory(session_id.str(), true); !res && res.error_ != fz::result::nodir && res.error_ != fz::result::nofile)
		logger_.log_u(logmsg::warning, L"Could not remove the session folder '%s': %s.", session_id.str(), strresult(res));

	if (!session::forget(store_, session_id))
		logger_.log_u(logmsg::warning, L"Could not drop the properties of session '%s'.", session_id.str());
}

outcome orchestrator::create(const context &ctx, std::string_view session_path, std::string_view destination)
{
	if (!ctx.chunking_requested)
		return pass();

	auto loc = locate(util::fs::absolute_unix_path(session_path));
	if (!loc)
		return pass();

	if (destination.empty()) {
		logger_.log_u(logmsg::debug_info, L"%s: no destination given, not a chunked upload.", loc.id.str());
		return pass();
	}

	if (session::load(store_, loc.id)) {
		logger_.log_u(logmsg::error, L"%s: a session already exists.", loc.id.str());
		return fail(fz::result{fz::result::other, CHUNKUP_RESULT_RAW_ALREADY_EXISTS});
	}

	auto dest = tvfs_.resolve_path(destination);
	if (!dest) {
		logger_.log_u(logmsg::error, L"%s: invalid destination '%s'.", loc.id.str(), destination);
		teardown(loc.id);
		return fail(fz::result{fz::result::invalid});
	}

	// The session's storage must be the one that's going to hold the file.
	if (dest.backend != loc.where.backend) {
		logger_.log_u(logmsg::debug_info, L"%s: destination '%s' is on storage '%s', the session on '%s'. Not a chunked upload.", loc.id.str(), dest.tvfs_path.str(), dest.backend->name(), loc.where.backend->name());
		return pass();
	}

	bool succeeded = false;

	// The collection is of no use if the session couldn't be opened.
	CHUNKUP_SCOPE_GUARD {
		if (!succeeded)
			teardown(loc.id);
	};

	util::fs::absolute_unix_path target;

	if (auto [res, e] = tvfs_.get_entry(dest.tvfs_path.str()); res) {
		if (e.is_dir()) {
			logger_.log_u(logmsg::error, L"%s: destination '%s' is a directory.", loc.id.str(), dest.tvfs_path.str());
			return fail(fz::result{fz::result::invalid});
		}

		target = dest.path;
	}
	else
	if (res.error_ == fz::result::nofile || res.error_ == fz::result::nodir) {
		auto placeholder = loc.id / opts_.placeholder_name;

		tvfs::string_reader nothing;
		if (auto pres = tvfs_.put_contents(placeholder.str(), nothing).first; !pres) {
			logger_.log_u(logmsg::error, L"%s: could not create the placeholder '%s': %s.", loc.id.str(), placeholder.str(), strresult(pres));
			return fail(pres);
		}

		target = loc.where.path / opts_.placeholder_name;
	}
	else {
		logger_.log_u(logmsg::error, L"%s: could not look up destination '%s': %s.", loc.id.str(), dest.tvfs_path.str(), strresult(res));
		return fail(res);
	}

	auto [err, token] = loc.writer->begin_chunked_file(target);
	if (err) {
		logger_.log_u(logmsg::error, L"%s: could not begin a chunked write: %s.", loc.id.str(), toString<std::string>(err));
		return fail(err);
	}

	session s(loc.id, target, std::move(token));

	if (!s.save(store_)) {
		logger_.log_u(logmsg::error, L"%s: could not persist the session.", loc.id.str());
		loc.writer->cancel_chunked_file(target, s.token());
		return fail(fz::result{fz::result::other});
	}

	succeeded = true;

	logger_.log_u(logmsg::debug_info, L"%s: session opened on storage '%s' for '%s', target '%s'.", loc.id.str(), loc.where.backend->name(), dest.tvfs_path.str(), target.str());

	return done(outcome::created);
}

outcome orchestrator::put_part(const context &ctx, std::string_view part_path, tvfs::reader &body, std::int64_t declared_length)
{
	if (!ctx.chunking_requested)
		return pass();

	util::fs::absolute_unix_path path(part_path);
	if (!path)
		return pass();

	auto loc = locate(path.parent());
	if (!loc)
		return pass();

	auto n = parse_part_number(path.base(), opts_.max_part_number);
	if (n == 0) {
		logger_.log_u(logmsg::error, L"%s: '%s' is not a valid part number.", loc.id.str(), path.base());
		return fail(error::invalid_part_number);
	}

	auto s = session::load(store_, loc.id);
	if (!s) {
		logger_.log_u(logmsg::error, L"%s: %s.", loc.id.str(), toString<std::string>(error(error::session_not_found)));
		return fail(error::session_not_found);
	}

	if (auto err = loc.writer->put_chunked_file_part(s.target_path(), s.token(), std::to_string(n), body, declared_length)) {
		logger_.log_u(logmsg::error, L"%s: part %d: %s.", loc.id.str(), n, toString<std::string>(err));
		return fail(err);
	}

	logger_.log_u(logmsg::debug_info, L"%s: part %d received.", loc.id.str(), n);

	return done(outcome::created);
}

outcome orchestrator::finalize(const context &ctx, std::string_view source_path, std::string_view destination)
{
	if (!ctx.chunking_requested)
		return pass();

	util::fs::absolute_unix_path source(source_path);
	if (!source || !uploads_root_)
		return pass();

	// Either the session itself is being moved, or any resource within it.
	auto id = source.is_child_of(uploads_root_) ? source : source.parent();

	auto loc = locate(id);
	if (!loc)
		return pass();

	auto s = session::load(store_, loc.id);
	if (!s) {
		logger_.log_u(logmsg::error, L"%s: %s.", loc.id.str(), toString<std::string>(error(error::session_not_found)));
		return fail(error::session_not_found);
	}

	s.set_state(session::state::committing);

	CHUNKUP_SCOPE_GUARD {
		teardown(loc.id);
		logger_.log_u(logmsg::debug_info, L"%s: session closed, state: %s.", loc.id.str(), toString<std::string>(s.get_state()));
	};

	auto abort_with = [&](auto failure) {
		loc.writer->cancel_chunked_file(s.target_path(), s.token());
		s.set_state(session::state::aborted);
		return fail(failure);
	};

	auto dest = tvfs_.resolve_path(destination);
	if (!dest) {
		logger_.log_u(logmsg::error, L"%s: invalid destination '%s'.", loc.id.str(), destination);
		return abort_with(fz::result{fz::result::invalid});
	}

	// The token is only meaningful to the storage that issued it.
	if (dest.backend != loc.where.backend) {
		logger_.log_u(logmsg::error, L"%s: destination '%s' is on storage '%s', the session on '%s'.", loc.id.str(), dest.tvfs_path.str(), dest.backend->name(), loc.where.backend->name());
		return abort_with(error::backend_unsupported);
	}

	auto placeholder = loc.id / opts_.placeholder_name;
	bool to_placeholder = s.target_path() == loc.where.path / opts_.placeholder_name;

	if (!to_placeholder && s.target_path() != dest.path) {
		logger_.log_u(logmsg::error, L"%s: the session was opened for '%s', not for '%s'.", loc.id.str(), s.target_path().str(), dest.path.str());
		return abort_with(fz::result{fz::result::invalid});
	}

	bool overwriting = false;

	if (auto [res, e] = tvfs_.get_entry(dest.tvfs_path.str()); res) {
		if (e.is_dir()) {
			logger_.log_u(logmsg::error, L"%s: destination '%s' is a directory.", loc.id.str(), dest.tvfs_path.str());
			return abort_with(fz::result{fz::result::other, CHUNKUP_RESULT_RAW_ALREADY_EXISTS});
		}

		overwriting = true;

		// Give versioning the chance to keep the current content, as an ordinary overwrite would.
		tvfs_.run_write_hooks(dest.tvfs_path);
	}

	auto [err, size] = loc.writer->write_chunked_file(s.target_path(), s.token());
	if (err) {
		logger_.log_u(logmsg::error, L"%s: could not assemble '%s': %s.", loc.id.str(), dest.tvfs_path.str(), toString<std::string>(err));
		return abort_with(err);
	}

	if (to_placeholder) {
		if (auto res = tvfs_.rename(placeholder.str(), dest.tvfs_path.str()); !res) {
			logger_.log_u(logmsg::error, L"%s: could not move the assembled file into '%s': %s.", loc.id.str(), dest.tvfs_path.str(), strresult(res));
			s.set_state(session::state::aborted);
			return fail(res);
		}
	}

	s.set_state(session::state::committed);

	auto m = tvfs_.update_metadata(dest.tvfs_path.str(), size);

	logger_.log_u(logmsg::status, L"Chunked upload of '%s' committed: %d bytes, type %s.", dest.tvfs_path.str(), m.size, m.mimetype);

	ctx.events.after_move(source.str(), dest.tvfs_path.str());
	ctx.events.after_unbind(source.str());
	ctx.events.after_bind(dest.tvfs_path.str());

	return done(overwriting ? outcome::no_content : outcome::created);
}

outcome orchestrator::abort(const context &ctx, std::string_view session_path)
{
	if (!ctx.chunking_requested)
		return pass();

	auto loc = locate(util::fs::absolute_unix_path(session_path));
	if (!loc)
		return pass();

	if (auto s = session::load(store_, loc.id)) {
		loc.writer->cancel_chunked_file(s.target_path(), s.token());
		s.set_state(session::state::aborted);

		logger_.log_u(logmsg::debug_info, L"%s: session aborted.", loc.id.str());
	}

	// Aborting an already aborted session is not an error.
	teardown(loc.id);

	return done(outcome::no_content);
}

std::size_t orchestrator::expire_stale_sessions(fz::duration max_age)
{
	return expire_sessions_older_than(fz::datetime::now() - max_age);
}

std::size_t orchestrator::expire_sessions_older_than(const fz::datetime &cutoff)
{
	std::size_t count = 0;

	for (auto &p: store_.find_older_than(session::token_property, cutoff)) {
		util::fs::absolute_unix_path id(p);

		auto s = session::load(store_, id);
		auto loc = locate(id);

		if (s && loc)
			loc.writer->cancel_chunked_file(s.target_path(), s.token());
		else
			logger_.log_u(logmsg::warning, L"%s: stale session belongs to no capable storage, only its properties are dropped.", p);

		if (loc)
			teardown(loc.id);
		else
		if (!store_.remove(p))
			logger_.log_u(logmsg::warning, L"Could not drop the properties of session '%s'.", p);

		++count;
	}

	if (count)
		logger_.log_u(logmsg::status, L"Expired %d stale chunked upload sessions.", count);

	return count;
}

}
