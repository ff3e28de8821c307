#ifndef CHUNKUP_LOGGER_STDIO_HPP
#define CHUNKUP_LOGGER_STDIO_HPP

#include <cstdio>

#include <libfilezilla/logger.hpp>
#include <libfilezilla/mutex.hpp>

namespace chunkup::logger {

class stdio: public fz::logger_interface
{
public:
	explicit stdio(std::FILE *file);

	void do_log(fz::logmsg::type t, std::wstring &&msg) override;

private:
	fz::mutex mutex_;
	std::FILE *file_;
};

}

#endif // CHUNKUP_LOGGER_STDIO_HPP
