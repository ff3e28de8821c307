#ifndef CHUNKUP_LOGGER_MODULARIZED_HPP
#define CHUNKUP_LOGGER_MODULARIZED_HPP

#include <string_view>

#include <libfilezilla/logger.hpp>

namespace chunkup::logger {

/// \brief A logger that tags each message with the name of the module emitting it, and forwards it to a parent logger.
/// \note Filtering is done by the parent: the modularized logger itself lets everything through.
class modularized: public fz::logger_interface
{
public:
	modularized(fz::logger_interface &parent, std::string_view module_name);

	void do_log(fz::logmsg::type t, std::wstring &&msg) override;

	const std::wstring &module_name() const
	{
		return name_;
	}

private:
	fz::logger_interface &parent_;
	std::wstring name_;
};

}

#endif // CHUNKUP_LOGGER_MODULARIZED_HPP
