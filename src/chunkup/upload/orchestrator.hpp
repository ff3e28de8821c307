#ifndef CHUNKUP_UPLOAD_ORCHESTRATOR_HPP
#define CHUNKUP_UPLOAD_ORCHESTRATOR_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include <libfilezilla/fsresult.hpp>
#include <libfilezilla/logger.hpp>
#include <libfilezilla/time.hpp>

#include "../logger/modularized.hpp"
#include "../props/property_store.hpp"
#include "../tvfs/engine.hpp"
#include "../tvfs/events.hpp"
#include "../tvfs/reader.hpp"

#include "chunked_file_write.hpp"
#include "error.hpp"
#include "session.hpp"

namespace chunkup::upload {

/// \brief Drives chunked uploads: opens sessions, forwards parts to the storage, commits or aborts.
///
/// Sessions are collections created directly below the uploads root, while the client asks for chunking.
/// Parts are the resources written into a session, named after their part number.
/// Moving the session, or any resource in it, to its destination assembles the parts there.
///
/// Whenever a request doesn't qualify as a chunked upload request, the orchestrator lets it pass through,
/// so that it gets the ordinary treatment.
class orchestrator
{
public:
	struct options
	{
		options(){}

		std::string uploads_root{"/uploads"};
		std::uint32_t max_part_number{10000};

		/// Name of the resource that, within a session, reserves the destination's place until the upload is committed.
		std::string placeholder_name{".target"};
	};

	/// What the orchestrator needs to know about the request being served.
	struct context
	{
		bool chunking_requested{};
		tvfs::event_sink &events = tvfs::get_null_event_sink();
	};

	struct outcome
	{
		enum status_type {
			pass_through,
			created,
			no_content,
			failed
		};

		status_type status{pass_through};
		upload::error error{};
		fz::result fs_result{fz::result::ok};

		bool handled() const
		{
			return status != pass_through;
		}
	};

	orchestrator(tvfs::engine &tvfs, props::property_store &store, fz::logger_interface &logger, options opts = {});

	/// \brief Opens a session in the just created collection at \c session_path, for an upload to \c destination.
	[[nodiscard]] outcome create(const context &ctx, std::string_view session_path, std::string_view destination);

	/// \brief Forwards \c body, the content of the part resource \c part_path, to the storage.
	/// \param declared_length the length the client declared for the body, or -1.
	[[nodiscard]] outcome put_part(const context &ctx, std::string_view part_path, tvfs::reader &body, std::int64_t declared_length = -1);

	/// \brief Assembles the parts of the session \c source_path belongs to into \c destination, then disposes of the session.
	[[nodiscard]] outcome finalize(const context &ctx, std::string_view source_path, std::string_view destination);

	/// \brief Drops the session at \c session_path, along with everything uploaded into it.
	[[nodiscard]] outcome abort(const context &ctx, std::string_view session_path);

	/// \brief Aborts the sessions opened more than \c max_age ago.
	/// \returns the number of sessions aborted.
	std::size_t expire_stale_sessions(fz::duration max_age);

	/// \brief Aborts the sessions opened before \c cutoff.
	/// \returns the number of sessions aborted.
	std::size_t expire_sessions_older_than(const fz::datetime &cutoff);

	const options &get_options() const
	{
		return opts_;
	}

private:
	struct location
	{
		util::fs::absolute_unix_path id;
		tvfs::resolved_path where;
		chunked_file_write *writer{};

		explicit operator bool() const
		{
			return writer != nullptr;
		}
	};

	location locate(const util::fs::absolute_unix_path &session_id);
	void teardown(const util::fs::absolute_unix_path &session_id);

	tvfs::engine &tvfs_;
	props::property_store &store_;
	logger::modularized logger_;
	options opts_;
	util::fs::absolute_unix_path uploads_root_;
};

}

#endif // CHUNKUP_UPLOAD_ORCHESTRATOR_HPP
