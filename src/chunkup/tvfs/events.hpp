#ifndef CHUNKUP_TVFS_EVENTS_HPP
#define CHUNKUP_TVFS_EVENTS_HPP

#include <string_view>

namespace chunkup::tvfs {

/// \brief Receives the namespace notifications that collaborators (indexers, sync clients, activity feeds) observe.
class event_sink
{
public:
	virtual ~event_sink() = default;

	virtual void after_move(std::string_view from, std::string_view to) = 0;
	virtual void after_unbind(std::string_view path) = 0;
	virtual void after_bind(std::string_view path) = 0;
};

class null_event_sink final: public event_sink
{
public:
	void after_move(std::string_view, std::string_view) override {}
	void after_unbind(std::string_view) override {}
	void after_bind(std::string_view) override {}
};

event_sink &get_null_event_sink();

}

#endif // CHUNKUP_TVFS_EVENTS_HPP
