#ifndef CHUNKUP_UPLOAD_ERROR_HPP
#define CHUNKUP_UPLOAD_ERROR_HPP

#include <libfilezilla/string.hpp>

#include <cstdint>

namespace chunkup::upload
{

struct error
{
	enum type: std::uint8_t {
		none,

		/* Client's fault */
		invalid_part_number,
		incomplete_upload,

		/* Storage can't take part in chunked uploads */
		storage_unsupported,
		backend_unsupported,

		/* Backend-side failures */
		session_not_found,
		part_rejected,
		backend_failure,
		assembly_failure
	};

	constexpr error(type v = none) noexcept
		: v_(v)
	{}

	constexpr explicit operator bool() const noexcept
	{
		return v_ != none;
	}

	constexpr operator type() const noexcept
	{
		return v_;
	}

private:
	type v_;
};

template <typename String>
String toString(const error &e)
{
	using C = typename String::value_type;

	switch (e) {
		case error::none: return fzS(C, "No error");
		case error::invalid_part_number: return fzS(C, "Invalid part number");
		case error::incomplete_upload: return fzS(C, "No parts were uploaded");
		case error::storage_unsupported: return fzS(C, "Storage does not support chunked file writes");
		case error::backend_unsupported: return fzS(C, "Backend does not support chunked file writes at this location");
		case error::session_not_found: return fzS(C, "Upload session not found");
		case error::part_rejected: return fzS(C, "Part rejected by the backend");
		case error::backend_failure: return fzS(C, "Backend failure");
		case error::assembly_failure: return fzS(C, "Assembling the parts failed");
	}

	return fzS(C, "Unknown error");
}

}

#endif // CHUNKUP_UPLOAD_ERROR_HPP
