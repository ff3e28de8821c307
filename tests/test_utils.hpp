#ifndef CHUNKUP_TESTS_TEST_UTILS_HPP
#define CHUNKUP_TESTS_TEST_UTILS_HPP

#include <algorithm>
#include <cstdlib>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <cppunit/TestAssert.h>
#include <cppunit/extensions/HelperMacros.h>

#include <libfilezilla/encode.hpp>
#include <libfilezilla/format.hpp>
#include <libfilezilla/local_filesys.hpp>
#include <libfilezilla/logger.hpp>
#include <libfilezilla/recursive_remove.hpp>
#include <libfilezilla/util.hpp>

#include "../src/chunkup/dav/responder.hpp"
#include "../src/chunkup/props/sqlite_property_store.hpp"
#include "../src/chunkup/tvfs/backends/local_filesys.hpp"
#include "../src/chunkup/tvfs/backends/object_store.hpp"
#include "../src/chunkup/tvfs/engine.hpp"
#include "../src/chunkup/tvfs/events.hpp"
#include "../src/chunkup/tvfs/versions.hpp"
#include "../src/chunkup/upload/error.hpp"
#include "../src/chunkup/upload/orchestrator.hpp"

namespace CppUnit {

template <>
struct assertion_traits<chunkup::upload::error>
{
	static bool equal(const chunkup::upload::error &lhs, const chunkup::upload::error &rhs)
	{
		return chunkup::upload::error::type(lhs) == chunkup::upload::error::type(rhs);
	}

	static std::string toString(const chunkup::upload::error &e)
	{
		return chunkup::upload::toString<std::string>(e);
	}
};

}

namespace chunkup::test {

/// A directory under the system's temporary directory, removed with all its content on destruction.
class temp_dir
{
public:
	temp_dir()
	{
		const char *tmp = std::getenv("TMPDIR");
		if (!tmp || !*tmp)
			tmp = "/tmp";

		path_ = fz::to_native(fz::sprintf("%s/chunkup-test-%s", tmp, fz::hex_encode<std::string>(fz::random_bytes(8))));
		fz::mkdir(path_, true, fz::mkdir_permissions::cur_user);
	}

	~temp_dir()
	{
		fz::recursive_remove().remove(path_);
	}

	temp_dir(const temp_dir &) = delete;
	temp_dir &operator=(const temp_dir &) = delete;

	const fz::native_string &path() const
	{
		return path_;
	}

	fz::native_string operator/(std::string_view name) const
	{
		return path_ + fz::local_filesys::path_separator + fz::to_native(name);
	}

private:
	fz::native_string path_;
};

class recording_event_sink final: public tvfs::event_sink
{
public:
	void after_move(std::string_view from, std::string_view to) override
	{
		events.push_back(fz::sprintf("move %s -> %s", from, to));
	}

	void after_unbind(std::string_view path) override
	{
		events.push_back(fz::sprintf("unbind %s", path));
	}

	void after_bind(std::string_view path) override
	{
		events.push_back(fz::sprintf("bind %s", path));
	}

	std::vector<std::string> events;
};

class recording_responder final: public dav::responder
{
public:
	bool send_status(unsigned int code, std::string_view reason) override
	{
		status = code;
		this->reason = std::string(reason.empty() ? default_reason(code) : reason);
		return true;
	}

	bool send_header(std::string_view name, std::string_view value) override
	{
		headers[std::string(name)] = std::string(value);
		return true;
	}

	bool send_body(std::string_view b) override
	{
		body = std::string(b);
		return send_end();
	}

	bool send_body(tvfs::reader &b) override
	{
		if (!tvfs::read_all(b, body))
			return false;

		return send_end();
	}

	bool send_end() override
	{
		ended = true;
		return true;
	}

	unsigned int status{};
	std::string reason;
	std::map<std::string, std::string> headers;
	std::string body;
	bool ended{};
};

/// Forwards everything to another backend, except for the assembly of chunked writes, which always fails.
class faulty_backend final: public tvfs::backend, private upload::chunked_file_write
{
public:
	explicit faulty_backend(std::shared_ptr<tvfs::backend> inner)
		: inner_(std::move(inner))
	{}

	std::string_view name() const override { return "faulty"; }

	fz::result info(const util::fs::absolute_unix_path &path, tvfs::entry &out) override { return inner_->info(path, out); }
	fz::result list(const util::fs::absolute_unix_path &path, std::vector<tvfs::entry> &out) override { return inner_->list(path, out); }
	fz::result mkdir(const util::fs::absolute_unix_path &path) override { return inner_->mkdir(path); }
	fz::result open_reader(const util::fs::absolute_unix_path &path, std::unique_ptr<tvfs::reader> &out) override { return inner_->open_reader(path, out); }
	fz::result write(const util::fs::absolute_unix_path &path, tvfs::reader &data, std::int64_t &written) override { return inner_->write(path, data, written); }
	fz::result rename(const util::fs::absolute_unix_path &from, const util::fs::absolute_unix_path &to) override { return inner_->rename(from, to); }
	fz::result remove_file(const util::fs::absolute_unix_path &path) override { return inner_->remove_file(path); }
	fz::result remove_directory(const util::fs::absolute_unix_path &path, bool recursive) override { return inner_->remove_directory(path, recursive); }

	upload::chunked_file_write *chunked_file_write() override
	{
		return inner_->chunked_file_write() ? this : nullptr;
	}

	int part_uploads{};
	int cancellations{};

private:
	std::pair<upload::error, std::string> begin_chunked_file(const util::fs::absolute_unix_path &target_path) override
	{
		return inner_->chunked_file_write()->begin_chunked_file(target_path);
	}

	upload::error put_chunked_file_part(const util::fs::absolute_unix_path &target_path, std::string_view token, std::string_view part_id, tvfs::reader &data, std::int64_t size_hint) override
	{
		++part_uploads;
		return inner_->chunked_file_write()->put_chunked_file_part(target_path, token, part_id, data, size_hint);
	}

	std::pair<upload::error, std::int64_t> write_chunked_file(const util::fs::absolute_unix_path &, std::string_view) override
	{
		return { upload::error::assembly_failure, -1 };
	}

	void cancel_chunked_file(const util::fs::absolute_unix_path &target_path, std::string_view token) override
	{
		++cancellations;
		inner_->chunked_file_write()->cancel_chunked_file(target_path, token);
	}

	std::shared_ptr<tvfs::backend> inner_;
};

enum class backend_kind
{
	local_filesys,
	object_store
};

inline std::string to_string(backend_kind k)
{
	return k == backend_kind::local_filesys ? "local_filesys" : "object_store";
}

/// Everything needed to serve chunked uploads, on a single storage mounted at the root.
class environment
{
public:
	explicit environment(backend_kind kind, bool faulty = false)
	{
		if (kind == backend_kind::local_filesys) {
			fz::mkdir(dir / "root", true, fz::mkdir_permissions::cur_user);
			local = std::make_shared<tvfs::backends::local_filesys>(dir / "root", logger);
			storage = local;
		}
		else {
			objects = std::make_shared<tvfs::backends::object_store>("memory", logger);
			storage = objects;
		}

		if (faulty) {
			broken = std::make_shared<faulty_backend>(storage);
			storage = broken;
		}

		engine.set_mount_table({ { "/", storage } });
		engine.add_write_hook(versions);

		store = std::make_unique<props::sqlite_property_store>(dir / "properties.db", logger);
		orchestrator = std::make_unique<upload::orchestrator>(engine, *store, logger);

		CPPUNIT_ASSERT(engine.make_directory("/uploads"));
	}

	upload::orchestrator::context ctx(bool chunking = true)
	{
		return { chunking, events };
	}

	bool write(std::string_view path, std::string content)
	{
		tvfs::string_reader r(std::move(content));
		return bool(engine.put_contents(path, r).first);
	}

	std::string read(std::string_view path)
	{
		std::unique_ptr<tvfs::reader> r;
		std::string content;

		CPPUNIT_ASSERT_MESSAGE(fz::sprintf("Could not open %s", path), engine.open_reader(r, path));
		CPPUNIT_ASSERT(tvfs::read_all(*r, content));

		return content;
	}

	bool exists(std::string_view path)
	{
		return bool(engine.get_entry(path).first);
	}

	std::vector<std::string> list(std::string_view path)
	{
		std::vector<tvfs::entry> entries;
		std::vector<std::string> names;

		if (engine.get_entries(entries, path)) {
			for (auto &e: entries)
				names.push_back(e.name());
		}

		std::sort(names.begin(), names.end());
		return names;
	}

	upload::orchestrator::outcome put_part(std::string_view path, std::string content)
	{
		tvfs::string_reader r(content);
		return orchestrator->put_part(ctx(), path, r, std::int64_t(content.size()));
	}

	temp_dir dir;
	fz::logger_interface &logger = fz::get_null_logger();

	std::shared_ptr<tvfs::backends::local_filesys> local;
	std::shared_ptr<tvfs::backends::object_store> objects;
	std::shared_ptr<faulty_backend> broken;
	std::shared_ptr<tvfs::backend> storage;

	tvfs::engine engine{logger};
	tvfs::versions versions{util::fs::absolute_unix_path("/.versions"), logger};

	std::unique_ptr<props::sqlite_property_store> store;
	std::unique_ptr<upload::orchestrator> orchestrator;
	recording_event_sink events;
};

}

#endif // CHUNKUP_TESTS_TEST_UTILS_HPP
