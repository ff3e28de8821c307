#include <algorithm>

#include "session.hpp"

namespace chunkup::upload {

session::session(util::fs::absolute_unix_path id, util::fs::absolute_unix_path target_path, std::string token, state s)
	: id_(std::move(id))
	, target_path_(std::move(target_path))
	, token_(std::move(token))
	, state_(s)
{
}

bool session::save(props::property_store &store) const
{
	if (!*this)
		return false;

	return store.set(id_.str(), {
		{ std::string(token_property), token_ },
		{ std::string(target_property), target_path_.str() }
	});
}

session session::load(props::property_store &store, const util::fs::absolute_unix_path &id)
{
	if (!id)
		return {};

	auto props = store.get(id.str(), { std::string(token_property), std::string(target_property) });

	auto token = props.find(token_property);
	auto target = props.find(target_property);

	if (token == props.end() || target == props.end())
		return {};

	return { id, util::fs::absolute_unix_path(target->second), token->second, state::parts_receiving };
}

bool session::forget(props::property_store &store, const util::fs::absolute_unix_path &id)
{
	return id && store.remove(id.str());
}

std::uint32_t parse_part_number(std::string_view name, std::uint32_t max)
{
	// More than 10 digits could overflow, and no valid part number needs that many.
	if (name.empty() || name.size() > 10)
		return 0;

	if (!std::all_of(name.begin(), name.end(), [](char c) { return c >= '0' && c <= '9'; }))
		return 0;

	std::uint64_t n = 0;
	for (auto c: name)
		n = n*10 + std::uint64_t(c - '0');

	if (n < 1 || n > max)
		return 0;

	return std::uint32_t(n);
}

}
