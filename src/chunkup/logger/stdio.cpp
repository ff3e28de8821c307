#include <libfilezilla/format.hpp>
#include <libfilezilla/time.hpp>

#include "stdio.hpp"
#include "type.hpp"

namespace chunkup::logger {

stdio::stdio(std::FILE *file)
	: file_(file)
{
	set_all(logmsg::default_types);
}

void stdio::do_log(fz::logmsg::type t, std::wstring &&msg)
{
	auto line = fz::sprintf(L"%s %s %s\n",
		fz::datetime::now().format(L"%Y-%m-%dT%H:%M:%SZ", fz::datetime::utc),
		type2str<std::wstring>(t),
		msg);

	auto utf8 = fz::to_utf8(line);

	fz::scoped_lock lock(mutex_);

	std::fputs(utf8.c_str(), file_);
	std::fflush(file_);
}

}
