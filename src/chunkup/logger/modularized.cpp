#include <libfilezilla/string.hpp>

#include "modularized.hpp"

namespace chunkup::logger {

modularized::modularized(fz::logger_interface &parent, std::string_view module_name)
	: parent_(parent)
	, name_(fz::to_wstring_from_utf8(module_name))
{
	set_all(fz::logmsg::type(~0));
}

void modularized::do_log(fz::logmsg::type t, std::wstring &&msg)
{
	if (!parent_.should_log(t))
		return;

	if (name_.empty())
		return parent_.do_log(t, std::move(msg));

	std::wstring tagged;
	tagged.reserve(name_.size() + msg.size() + 3);
	tagged.append(1, L'[').append(name_).append(L"] ").append(msg);

	parent_.do_log(t, std::move(tagged));
}

}
