#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <libfilezilla/format.hpp>
#include <libfilezilla/local_filesys.hpp>
#include <libfilezilla/string.hpp>

#include "../../chunkup/dav/chunking_plugin.hpp"
#include "../../chunkup/dav/server.hpp"
#include "../../chunkup/logger/stdio.hpp"
#include "../../chunkup/logger/type.hpp"
#include "../../chunkup/props/sqlite_property_store.hpp"
#include "../../chunkup/strresult.hpp"
#include "../../chunkup/tvfs/backends/local_filesys.hpp"
#include "../../chunkup/tvfs/engine.hpp"
#include "../../chunkup/tvfs/versions.hpp"
#include "../../chunkup/upload/orchestrator.hpp"

using namespace chunkup;

namespace {

class stdio_reader final: public tvfs::reader
{
public:
	explicit stdio_reader(std::FILE *file)
		: file_(file)
	{}

	fz::rwresult read(void *data, std::size_t size) override
	{
		auto n = std::fread(data, 1, size, file_);
		if (n == 0 && std::ferror(file_))
			return fz::rwresult{fz::rwresult::other, 0};

		return fz::rwresult{n};
	}

private:
	std::FILE *file_;
};

class stdio_responder final: public dav::responder
{
public:
	bool send_status(unsigned int code, std::string_view reason) override
	{
		code_ = code;
		std::cerr << code << " " << (reason.empty() ? default_reason(code) : reason) << "\n";
		return true;
	}

	bool send_header(std::string_view name, std::string_view value) override
	{
		std::cerr << name << ": " << value << "\n";
		return true;
	}

	bool send_body(std::string_view body) override
	{
		std::cout << body;
		return send_end();
	}

	bool send_body(tvfs::reader &body) override
	{
		std::string buffer(64*1024, '\0');

		for (;;) {
			auto r = body.read(buffer.data(), buffer.size());
			if (!r) {
				std::cerr << "Error while reading the body: " << strresult(r) << "\n";
				return false;
			}

			if (r.value_ == 0)
				break;

			std::cout.write(buffer.data(), std::streamsize(r.value_));
		}

		return send_end();
	}

	bool send_end() override
	{
		std::cout.flush();
		return true;
	}

	unsigned int code() const
	{
		return code_;
	}

private:
	unsigned int code_{};
};

class logging_event_sink final: public tvfs::event_sink
{
public:
	explicit logging_event_sink(fz::logger_interface &logger)
		: logger_(logger, "events")
	{}

	void after_move(std::string_view from, std::string_view to) override
	{
		logger_.log_u(logmsg::status, L"moved: %s -> %s", from, to);
	}

	void after_unbind(std::string_view path) override
	{
		logger_.log_u(logmsg::status, L"unbound: %s", path);
	}

	void after_bind(std::string_view path) override
	{
		logger_.log_u(logmsg::status, L"bound: %s", path);
	}

private:
	logger::modularized logger_;
};

void print_usage(const char *argv0)
{
	std::cerr
		<< "Usage: " << argv0 << " [--help] [--verbose] [--chunking] --root <dir> [--db <file>] [--uploads <path>] [--versions <path>] [--max-part-size <bytes>] <command> <arguments>\n"
		<< "\n"
		<< "Commands:\n"
		<< "  mkcol <path> [<destination>]  Creates a collection. With --chunking, opens an upload session for <destination>.\n"
		<< "  put <path> [<file>]           Writes <file>, or the standard input, to <path>.\n"
		<< "  move <path> <destination>     Moves <path> to <destination>. With --chunking, commits an upload session.\n"
		<< "  delete <path>                 Deletes <path>. With --chunking, aborts an upload session.\n"
		<< "  get <path>                    Writes the content of <path> to the standard output.\n"
		<< "  sweep <seconds>               Aborts the upload sessions older than <seconds>.\n"
		<< "\n"
		<< "The upload sessions are kept in <file>, by default <dir>.chunkup.db.\n"
		<< std::flush;
}

}

int main(int argc, char *argv[])
{
	bool print_help = false;
	bool verbose = false;
	bool chunking = false;
	fz::native_string root;
	fz::native_string db;
	std::string uploads = "/uploads";
	std::string versions_root = "/.versions";
	std::int64_t max_part_size = -1;
	std::vector<std::string> args;

	for (int i = 1; i < argc; ++i) {
		std::string_view a = argv[i];

		auto value = [&]() -> const char * {
			if (i+1 < argc)
				return argv[++i];

			std::cerr << "Missing value for option " << a << ".\n";
			print_help = true;
			return "";
		};

		if (a == "--help")
			print_help = true;
		else
		if (a == "--verbose")
			verbose = true;
		else
		if (a == "--chunking")
			chunking = true;
		else
		if (a == "--root")
			root = fz::to_native(std::string_view(value()));
		else
		if (a == "--db")
			db = fz::to_native(std::string_view(value()));
		else
		if (a == "--uploads")
			uploads = value();
		else
		if (a == "--versions")
			versions_root = value();
		else
		if (a == "--max-part-size")
			max_part_size = fz::to_integral<std::int64_t>(std::string_view(value()), -1);
		else
		if (fz::starts_with(a, std::string_view("--"))) {
			std::cerr << "Unknown option " << a << ".\n";
			print_help = true;
		}
		else
			args.emplace_back(a);
	}

	if (!print_help && (root.empty() || args.empty())) {
		std::cerr << "Both --root and a command are required.\n";
		print_help = true;
	}

	if (print_help) {
		print_usage(argv[0]);
		return EXIT_FAILURE;
	}

	logger::stdio logger{stderr};

	if (verbose)
		logger.set_all(fz::logmsg::type(~0));

	tvfs::backends::local_filesys::options lopts;
	lopts.max_part_size = max_part_size;

	auto backend = std::make_shared<tvfs::backends::local_filesys>(root, logger, lopts);

	if (auto res = fz::mkdir(backend->staging_dir(), true, fz::mkdir_permissions::cur_user); !res) {
		logger.log_u(logmsg::error, L"Could not create the staging directory %s.", backend->staging_dir());
		return EXIT_FAILURE;
	}

	// The session store lives beside the served tree, never inside it.
	if (db.empty())
		db = backend->root() + fzT(".chunkup.db");

	props::sqlite_property_store store(db, logger);
	if (!store)
		return EXIT_FAILURE;

	tvfs::engine engine(logger);
	engine.set_mount_table({ { "/", backend } });

	tvfs::versions versions(util::fs::absolute_unix_path(versions_root), logger);
	engine.add_write_hook(versions);

	if (auto res = engine.make_directory(uploads, true); !res) {
		logger.log_u(logmsg::error, L"Could not create the uploads root %s.", uploads);
		return EXIT_FAILURE;
	}

	upload::orchestrator::options oopts;
	oopts.uploads_root = uploads;

	upload::orchestrator orchestrator(engine, store, logger, oopts);
	logging_event_sink events(logger);

	dav::server server(engine, logger, events);
	dav::chunking_plugin chunking_plugin(orchestrator, logger, events);
	server.add_plugin(chunking_plugin);

	auto &command = args[0];

	if (command == "sweep") {
		if (args.size() != 2) {
			print_usage(argv[0]);
			return EXIT_FAILURE;
		}

		auto seconds = fz::to_integral<std::int64_t>(args[1], -1);
		if (seconds < 0) {
			std::cerr << "Invalid number of seconds: " << args[1] << ".\n";
			return EXIT_FAILURE;
		}

		auto count = orchestrator.expire_stale_sessions(fz::duration::from_seconds(seconds));
		std::cout << count << "\n";

		return EXIT_SUCCESS;
	}

	dav::request req;
	req.path = args.size() > 1 ? args[1] : std::string();

	if (chunking)
		req.headers[dav::headers::X_Chunkup_Chunking] = "1";

	std::unique_ptr<tvfs::reader> body;

	if (command == "mkcol" && (args.size() == 2 || args.size() == 3)) {
		req.method = "MKCOL";
		if (args.size() == 3)
			req.headers[dav::headers::X_Chunkup_Destination] = args[2];
	}
	else
	if (command == "put" && (args.size() == 2 || args.size() == 3)) {
		req.method = "PUT";

		if (args.size() == 3) {
			fz::file f;
			if (auto res = f.open(fz::to_native(args[2]), fz::file::reading, fz::file::existing); !res) {
				std::cerr << "Could not open " << args[2] << ": " << strresult(res) << ".\n";
				return EXIT_FAILURE;
			}

			req.headers[dav::headers::Content_Length] = std::to_string(f.size());
			body = std::make_unique<tvfs::file_reader>(std::move(f));
		}
		else
			body = std::make_unique<stdio_reader>(stdin);

		req.body = body.get();
	}
	else
	if (command == "move" && args.size() == 3) {
		req.method = "MOVE";
		req.headers[dav::headers::Destination] = args[2];
	}
	else
	if (command == "delete" && args.size() == 2) {
		req.method = "DELETE";
	}
	else
	if (command == "get" && args.size() == 2) {
		req.method = "GET";
	}
	else {
		print_usage(argv[0]);
		return EXIT_FAILURE;
	}

	stdio_responder res;
	server.handle(req, res);

	return res.code() >= 200 && res.code() < 400 ? EXIT_SUCCESS : EXIT_FAILURE;
}
