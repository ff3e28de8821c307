#include "strresult.hpp"

namespace chunkup {

std::string_view strresult(fz::result r)
{
	using namespace std::string_view_literals;

	switch (r.error_) {
		case fz::result::ok:             return "No error"sv;
		case fz::result::invalid:        return "Invalid file name or path"sv;
		case fz::result::noperm:         return "Permission denied"sv;
		case fz::result::nofile:         return "No such file"sv;
		case fz::result::nodir:          return "No such directory"sv;
		case fz::result::nospace:        return "No space left on the storage"sv;
		case fz::result::resource_limit: return "Too many open files or directories"sv;
		case fz::result::other: {
			switch (r.raw_) {
				case CHUNKUP_RESULT_RAW_NOT_IMPLEMENTED:
					return "Operation not supported by the storage"sv;

				case CHUNKUP_RESULT_RAW_ALREADY_EXISTS:
					return "File or directory already exists"sv;

				case CHUNKUP_RESULT_RAW_CROSS_DEVICE:
					return "Source and destination are on different storages"sv;

				case CHUNKUP_RESULT_RAW_NOT_EMPTY:
					return "Directory is not empty"sv;
			}

			return "Unknown error"sv;
		}
	}

	return {};
}

std::string_view strresult(fz::rwresult r)
{
	using namespace std::string_view_literals;

	switch (r.error_) {
		case fz::rwresult::none:       return "No error"sv;
		case fz::rwresult::invalid:    return "Invalid argument"sv;
		case fz::rwresult::nospace:    return "No space left on the storage"sv;
		case fz::rwresult::wouldblock: return "The operation would have blocked"sv;
		case fz::rwresult::other:      return "Read or write error"sv;
	}

	return {};
}

}
