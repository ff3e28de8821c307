#ifndef CHUNKUP_UPLOAD_SESSION_HPP
#define CHUNKUP_UPLOAD_SESSION_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "../props/property_store.hpp"
#include "../util/filesystem.hpp"

namespace chunkup::upload {

/// \brief One chunked upload in progress.
///
/// A session is identified by the collection its parts are uploaded into.
/// Its target path and the backend's token are persisted as properties of that collection,
/// so that every request of the upload, whichever process serves it, gets to see them.
class session
{
public:
	enum class state {
		created,
		parts_receiving,
		committing,
		committed,
		aborted
	};

	static constexpr std::string_view token_property = "{chunkup:}upload-token";
	static constexpr std::string_view target_property = "{chunkup:}upload-target";

	session() = default;
	session(util::fs::absolute_unix_path id, util::fs::absolute_unix_path target_path, std::string token, state s = state::created);

	explicit operator bool() const
	{
		return id_ && target_path_ && !token_.empty();
	}

	const util::fs::absolute_unix_path &id() const
	{
		return id_;
	}

	/// The path, within the session's storage, the assembled file will end up at.
	const util::fs::absolute_unix_path &target_path() const
	{
		return target_path_;
	}

	const std::string &token() const
	{
		return token_;
	}

	state get_state() const
	{
		return state_;
	}

	void set_state(state s)
	{
		state_ = s;
	}

	/// \brief Persists target path and token.
	[[nodiscard]] bool save(props::property_store &store) const;

	/// \returns the session identified by \c id, or an invalid session if there isn't one.
	/// A loaded session is in the parts_receiving state.
	static session load(props::property_store &store, const util::fs::absolute_unix_path &id);

	/// \brief Drops whatever was persisted for the session identified by \c id.
	static bool forget(props::property_store &store, const util::fs::absolute_unix_path &id);

private:
	util::fs::absolute_unix_path id_;
	util::fs::absolute_unix_path target_path_;
	std::string token_;
	state state_{state::created};
};

/// \brief Parses the name of a part resource into a part number.
/// Only decimal digits are accepted, leading zeros included.
/// \returns the part number, or 0 if \c name isn't a number in the range [1, max].
std::uint32_t parse_part_number(std::string_view name, std::uint32_t max = 10000);

template <typename String>
String toString(session::state s)
{
	using C = typename String::value_type;

	switch (s) {
		case session::state::created: return fzS(C, "created");
		case session::state::parts_receiving: return fzS(C, "parts_receiving");
		case session::state::committing: return fzS(C, "committing");
		case session::state::committed: return fzS(C, "committed");
		case session::state::aborted: return fzS(C, "aborted");
	}

	return fzS(C, "unknown");
}

}

#endif // CHUNKUP_UPLOAD_SESSION_HPP
