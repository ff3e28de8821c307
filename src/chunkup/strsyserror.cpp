#include <libfilezilla/format.hpp>

#ifdef FZ_WINDOWS
#	include <windows.h>
#else
#	include <string.h>
#endif

#include "strsyserror.hpp"

namespace chunkup {

#ifdef FZ_WINDOWS

fz::native_string strsyserror(syserror_type error)
{
	if (error == 0)
		return fzT("No error");

	wchar_t *out{};

	if (FormatMessageW(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS, nullptr, error, MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT), reinterpret_cast<wchar_t*>(&out), 0, nullptr) == 0 || !out)
		return fz::sprintf(fzT("Unknown error %d"), error);

	fz::native_string ret = out;
	LocalFree(out);

	fz::replace_substrings(ret, fzT("\r\n"), fzT(" "));
	fz::trim(ret);

	return ret;
}

#else

namespace {

// XSI strerror_r returns int, the GNU one returns the message.
fz::native_string describe(int res, const char *buf, syserror_type error)
{
	if (res != 0)
		return fz::sprintf(fzT("Unknown error %d"), error);

	return buf;
}

fz::native_string describe(const char *res, const char *, syserror_type)
{
	return res;
}

}

fz::native_string strsyserror(syserror_type error)
{
	if (error == 0)
		return fzT("No error");

	char buf[512]{};
	return describe(::strerror_r(error, buf, sizeof(buf)), buf, error);
}

#endif

}
