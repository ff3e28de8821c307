#ifndef CHUNKUP_PROPS_PROPERTY_STORE_HPP
#define CHUNKUP_PROPS_PROPERTY_STORE_HPP

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <libfilezilla/time.hpp>

namespace chunkup::props {

using property_map = std::map<std::string, std::string, std::less<>>;

/// \brief Named properties attached to resources of the virtual file system, kept across requests and processes.
class property_store
{
public:
	virtual ~property_store() = default;

	/// \brief Sets all of \c props on \c path, or none of them.
	/// Properties already set with the same name are replaced, the others are left alone.
	virtual bool set(std::string_view path, const property_map &props) = 0;

	/// \returns the properties of \c path among those listed in \c names. The missing ones are absent from the result.
	virtual property_map get(std::string_view path, const std::vector<std::string> &names) = 0;

	/// \brief Removes all the properties of \c path.
	virtual bool remove(std::string_view path) = 0;

	/// \returns the paths holding a property named \c name that was last set before \c cutoff.
	virtual std::vector<std::string> find_older_than(std::string_view name, const fz::datetime &cutoff) = 0;
};

}

#endif // CHUNKUP_PROPS_PROPERTY_STORE_HPP
