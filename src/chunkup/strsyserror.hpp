#ifndef CHUNKUP_STRSYSERROR_HPP
#define CHUNKUP_STRSYSERROR_HPP

#include <libfilezilla/string.hpp>

namespace chunkup {

#ifdef FZ_WINDOWS
	using syserror_type = unsigned int;
#else
	using syserror_type = int;
#endif

/// Describes a "system error", the one found in the raw_ member of fz::result: GetLastError() on Windows, errno elsewhere.
/// Thread safe.
fz::native_string strsyserror(syserror_type error);

}

#endif // CHUNKUP_STRSYSERROR_HPP
