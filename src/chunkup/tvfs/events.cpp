#include "events.hpp"

namespace chunkup::tvfs {

event_sink &get_null_event_sink()
{
	static null_event_sink sink;
	return sink;
}

}
