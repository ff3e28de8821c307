#ifndef CHUNKUP_DAV_PLUGIN_HPP
#define CHUNKUP_DAV_PLUGIN_HPP

#include "request.hpp"
#include "responder.hpp"

namespace chunkup::dav {

/// \brief Hooks into the server's handling of requests.
/// Each hook returns true if the server must go on handling the request as usual,
/// false if the plugin took care of it, response included.
class plugin
{
public:
	virtual ~plugin() = default;

	virtual bool before_put(request &, responder &)
	{
		return true;
	}

	/// Invoked after the collection has been successfully created, before responding.
	virtual bool after_mkcol(request &, responder &)
	{
		return true;
	}

	virtual bool before_move(request &, responder &)
	{
		return true;
	}

	virtual bool before_delete(request &, responder &)
	{
		return true;
	}
};

}

#endif // CHUNKUP_DAV_PLUGIN_HPP
