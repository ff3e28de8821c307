#include <algorithm>
#include <cstring>

#include <libfilezilla/encode.hpp>

#include "reader.hpp"

namespace chunkup::tvfs {

namespace {

constexpr std::size_t copy_buffer_size = 128*1024;

}

fz::rwresult string_reader::read(void *data, std::size_t size)
{
	auto to_read = std::min(size, data_.size() - pos_);
	if (to_read) {
		std::memcpy(data, data_.data() + pos_, to_read);
		pos_ += to_read;
	}

	return fz::rwresult{to_read};
}

fz::rwresult file_reader::read(void *data, std::size_t size)
{
	if (!file_)
		return fz::rwresult{fz::rwresult::invalid, 0};

	return file_.read2(data, size);
}

fz::rwresult hashing_reader::read(void *data, std::size_t size)
{
	auto r = source_.read(data, size);
	if (r && r.value_)
		hash_.update(static_cast<const std::uint8_t *>(data), r.value_);

	return r;
}

std::string hashing_reader::hex_digest()
{
	return fz::hex_encode<std::string>(hash_.digest());
}

fz::rwresult copy(reader &from, fz::file &to, std::int64_t limit)
{
	std::string buffer(copy_buffer_size, '\0');
	std::size_t total = 0;

	while (true) {
		auto r = from.read(buffer.data(), buffer.size());
		if (!r)
			return r;

		if (r.value_ == 0)
			break;

		if (limit >= 0 && total + r.value_ > std::size_t(limit))
			return fz::rwresult{fz::rwresult::nospace, 0};

		for (std::size_t written = 0; written < r.value_;) {
			auto w = to.write2(buffer.data() + written, r.value_ - written);
			if (!w)
				return w;

			written += w.value_;
		}

		total += r.value_;
	}

	return fz::rwresult{total};
}

fz::rwresult read_all(reader &from, std::string &out, std::int64_t limit)
{
	std::string buffer(copy_buffer_size, '\0');
	out.clear();

	while (true) {
		auto r = from.read(buffer.data(), buffer.size());
		if (!r)
			return r;

		if (r.value_ == 0)
			break;

		if (limit >= 0 && out.size() + r.value_ > std::size_t(limit))
			return fz::rwresult{fz::rwresult::nospace, 0};

		out.append(buffer.data(), r.value_);
	}

	return fz::rwresult{out.size()};
}

}
