#ifndef CHUNKUP_STRRESULT_HPP
#define CHUNKUP_STRRESULT_HPP

#include <string_view>

#ifdef FZ_WINDOWS
#	include <winerror.h>
#else
#	include <cerrno>
#endif

#include <libfilezilla/fsresult.hpp>

namespace chunkup {

std::string_view strresult(fz::result r);
std::string_view strresult(fz::rwresult r);

}

#ifdef CHUNKUP_RESULT_RAW
#	error "CHUNKUP_RESULT_RAW already defined"
#else
#	ifdef FZ_WINDOWS
#		define CHUNKUP_RESULT_RAW(win, nix) win
#	else
#		define CHUNKUP_RESULT_RAW(win, nix) nix
#	endif
#endif

#define CHUNKUP_RESULT_RAW_ALREADY_EXISTS   CHUNKUP_RESULT_RAW(ERROR_ALREADY_EXISTS, EEXIST)
#define CHUNKUP_RESULT_RAW_NOT_IMPLEMENTED  CHUNKUP_RESULT_RAW(ERROR_CALL_NOT_IMPLEMENTED, ENOSYS)
#define CHUNKUP_RESULT_RAW_CROSS_DEVICE     CHUNKUP_RESULT_RAW(ERROR_NOT_SAME_DEVICE, EXDEV)
#define CHUNKUP_RESULT_RAW_NOT_EMPTY        CHUNKUP_RESULT_RAW(ERROR_DIR_NOT_EMPTY, ENOTEMPTY)

#endif // CHUNKUP_STRRESULT_HPP
