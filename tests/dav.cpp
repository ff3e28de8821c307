#include <optional>

#include "../src/chunkup/dav/chunking_plugin.hpp"
#include "../src/chunkup/dav/server.hpp"
#include "../src/chunkup/upload/session.hpp"

#include "test_utils.hpp"

/*
 * This testsuite asserts the correctness of the WebDAV layer, with and without the chunking plugin,
 * by replaying sequences of requests against the server and checking its responses.
 */

using namespace chunkup;
using test::backend_kind;

class dav_test final : public CppUnit::TestFixture
{
	CPPUNIT_TEST_SUITE(dav_test);
	CPPUNIT_TEST(test_chunked_upload<backend_kind::local_filesys>);
	CPPUNIT_TEST(test_chunked_upload<backend_kind::object_store>);
	CPPUNIT_TEST(test_chunked_overwrite<backend_kind::local_filesys>);
	CPPUNIT_TEST(test_chunked_overwrite<backend_kind::object_store>);
	CPPUNIT_TEST(test_chunked_errors<backend_kind::local_filesys>);
	CPPUNIT_TEST(test_chunked_errors<backend_kind::object_store>);
	CPPUNIT_TEST(test_chunked_abort<backend_kind::local_filesys>);
	CPPUNIT_TEST(test_chunked_abort<backend_kind::object_store>);
	CPPUNIT_TEST(test_without_chunking<backend_kind::local_filesys>);
	CPPUNIT_TEST(test_without_chunking<backend_kind::object_store>);
	CPPUNIT_TEST(test_staging_area_unreachable);
	CPPUNIT_TEST(test_plain_requests);
	CPPUNIT_TEST(test_status_from_error);
	CPPUNIT_TEST(test_headers);
	CPPUNIT_TEST_SUITE_END();

public:
	template <backend_kind Kind> void test_chunked_upload();
	template <backend_kind Kind> void test_chunked_overwrite();
	template <backend_kind Kind> void test_chunked_errors();
	template <backend_kind Kind> void test_chunked_abort();
	template <backend_kind Kind> void test_without_chunking();
	void test_staging_area_unreachable();
	void test_plain_requests();
	void test_status_from_error();
	void test_headers();
};

CPPUNIT_TEST_SUITE_REGISTRATION(dav_test);

namespace {

class client
{
public:
	explicit client(test::backend_kind kind, dav::server::options opts = {})
		: env(kind)
		, server(env.engine, env.logger, env.events, std::move(opts))
		, chunking(*env.orchestrator, env.logger, env.events)
	{
		server.add_plugin(chunking);
	}

	test::recording_responder send(std::string method, std::string path, dav::headers headers = {}, std::optional<std::string> body = {})
	{
		dav::request req;
		req.method = std::move(method);
		req.path = std::move(path);
		req.headers = std::move(headers);

		tvfs::string_reader reader(body ? *body : std::string());
		if (body) {
			req.headers[dav::headers::Content_Length] = std::to_string(body->size());
			req.body = &reader;
		}

		test::recording_responder res;
		server.handle(req, res);

		CPPUNIT_ASSERT_MESSAGE(fz::sprintf("%s %s: response not ended", req.method, req.path), res.ended);

		return res;
	}

	unsigned int mkcol(std::string path, std::string destination = {}, bool chunked = true)
	{
		dav::headers h;
		if (chunked)
			h[dav::headers::X_Chunkup_Chunking] = "1";
		if (!destination.empty())
			h[dav::headers::X_Chunkup_Destination] = std::move(destination);

		return send("MKCOL", std::move(path), std::move(h)).status;
	}

	unsigned int put(std::string path, std::string body, bool chunked = true)
	{
		dav::headers h;
		if (chunked)
			h[dav::headers::X_Chunkup_Chunking] = "1";

		return send("PUT", std::move(path), std::move(h), std::move(body)).status;
	}

	unsigned int move(std::string path, std::string destination, bool chunked = true, bool overwrite = true)
	{
		dav::headers h;
		if (chunked)
			h[dav::headers::X_Chunkup_Chunking] = "1";
		if (!overwrite)
			h[dav::headers::Overwrite] = "F";
		h[dav::headers::Destination] = std::move(destination);

		return send("MOVE", std::move(path), std::move(h)).status;
	}

	unsigned int del(std::string path, bool chunked = true)
	{
		dav::headers h;
		if (chunked)
			h[dav::headers::X_Chunkup_Chunking] = "1";

		return send("DELETE", std::move(path), std::move(h)).status;
	}

	test::recording_responder get(std::string path)
	{
		return send("GET", std::move(path));
	}

	test::environment env;
	dav::server server;
	dav::chunking_plugin chunking;
};

}

template <backend_kind Kind>
void dav_test::test_chunked_upload()
{
	client c(Kind);
	CPPUNIT_ASSERT_EQUAL(201u, c.mkcol("/docs", {}, false));

	CPPUNIT_ASSERT_EQUAL(201u, c.mkcol("/uploads/s", "https://example.com/docs/a%20b.txt"));
	CPPUNIT_ASSERT(upload::session::load(*c.env.store, "/uploads/s"));

	CPPUNIT_ASSERT_EQUAL(201u, c.put("/uploads/s/2", "world"));
	CPPUNIT_ASSERT_EQUAL(201u, c.put("/uploads/s/1", "hello "));

	CPPUNIT_ASSERT_EQUAL(201u, c.move("/uploads/s", "https://example.com/docs/a%20b.txt"));

	auto res = c.get("/docs/a b.txt");
	CPPUNIT_ASSERT_EQUAL(200u, res.status);
	CPPUNIT_ASSERT_EQUAL(std::string("hello world"), res.body);
	CPPUNIT_ASSERT_EQUAL(std::string("text/plain"), res.headers[dav::headers::Content_Type]);
	CPPUNIT_ASSERT(!res.headers[dav::headers::ETag].empty());

	CPPUNIT_ASSERT_EQUAL(404u, c.get("/uploads/s").status);
	CPPUNIT_ASSERT_EQUAL(3u, unsigned(c.env.events.events.size()));
}

template <backend_kind Kind>
void dav_test::test_chunked_overwrite()
{
	client c(Kind);
	CPPUNIT_ASSERT_EQUAL(201u, c.mkcol("/docs", {}, false));
	CPPUNIT_ASSERT_EQUAL(201u, c.put("/docs/a.txt", "old", false));

	auto before = c.get("/docs/a.txt").headers[dav::headers::ETag];

	CPPUNIT_ASSERT_EQUAL(201u, c.mkcol("/uploads/s", "/docs/a.txt"));
	CPPUNIT_ASSERT_EQUAL(201u, c.put("/uploads/s/1", "new"));

	// Whichever resource of the session is moved, the session is committed.
	CPPUNIT_ASSERT_EQUAL(204u, c.move("/uploads/s/1", "/docs/a.txt"));

	auto after = c.get("/docs/a.txt");
	CPPUNIT_ASSERT_EQUAL(std::string("new"), after.body);
	CPPUNIT_ASSERT(!before.empty());
	CPPUNIT_ASSERT(before != after.headers[dav::headers::ETag]);

	CPPUNIT_ASSERT_EQUAL(std::size_t(1), c.env.versions.list(c.env.engine, "/docs/a.txt").size());
}

template <backend_kind Kind>
void dav_test::test_chunked_errors()
{
	client c(Kind);
	CPPUNIT_ASSERT_EQUAL(201u, c.mkcol("/docs", {}, false));
	CPPUNIT_ASSERT_EQUAL(201u, c.mkcol("/uploads/s", "/docs/a.txt"));

	CPPUNIT_ASSERT_EQUAL(400u, c.put("/uploads/s/abc", "x"));
	CPPUNIT_ASSERT_EQUAL(400u, c.put("/uploads/s/0", "x"));

	// Committing without parts.
	auto res = c.send("MOVE", "/uploads/s", { { dav::headers::X_Chunkup_Chunking, "1" }, { dav::headers::Destination, "/docs/a.txt" } });
	CPPUNIT_ASSERT_EQUAL(400u, res.status);
	CPPUNIT_ASSERT_EQUAL(std::string("No parts were uploaded\n"), res.body);
	CPPUNIT_ASSERT_EQUAL(404u, c.get("/docs/a.txt").status);

	// The session went away with the failed commit.
	CPPUNIT_ASSERT_EQUAL(404u, c.move("/uploads/s", "/docs/a.txt"));

	// A plain collection in the uploads root is no session.
	CPPUNIT_ASSERT_EQUAL(201u, c.mkcol("/uploads/t"));
	CPPUNIT_ASSERT_EQUAL(404u, c.put("/uploads/t/1", "x"));

	// The collection exists already.
	CPPUNIT_ASSERT_EQUAL(405u, c.mkcol("/uploads/t", "/docs/a.txt"));

	// A directory can't be the destination.
	CPPUNIT_ASSERT_EQUAL(400u, c.mkcol("/uploads/u", "/docs"));
	CPPUNIT_ASSERT_EQUAL(404u, c.get("/uploads/u").status);
}

template <backend_kind Kind>
void dav_test::test_chunked_abort()
{
	client c(Kind);
	CPPUNIT_ASSERT_EQUAL(201u, c.mkcol("/docs", {}, false));
	CPPUNIT_ASSERT_EQUAL(201u, c.mkcol("/uploads/s", "/docs/a.txt"));
	CPPUNIT_ASSERT_EQUAL(201u, c.put("/uploads/s/1", "x"));

	CPPUNIT_ASSERT_EQUAL(204u, c.del("/uploads/s"));
	CPPUNIT_ASSERT_EQUAL(204u, c.del("/uploads/s"));

	CPPUNIT_ASSERT_EQUAL(404u, c.get("/uploads/s").status);
	CPPUNIT_ASSERT_EQUAL(404u, c.get("/docs/a.txt").status);
	CPPUNIT_ASSERT(!upload::session::load(*c.env.store, "/uploads/s"));
}

template <backend_kind Kind>
void dav_test::test_without_chunking()
{
	client c(Kind);
	CPPUNIT_ASSERT_EQUAL(201u, c.mkcol("/docs", {}, false));

	// Without the chunking header, everything below the uploads root is ordinary content.
	CPPUNIT_ASSERT_EQUAL(201u, c.mkcol("/uploads/p", "/docs/a.txt", false));
	CPPUNIT_ASSERT(!upload::session::load(*c.env.store, "/uploads/p"));

	CPPUNIT_ASSERT_EQUAL(201u, c.put("/uploads/p/1", "data", false));
	CPPUNIT_ASSERT_EQUAL(std::string("data"), c.get("/uploads/p/1").body);

	CPPUNIT_ASSERT_EQUAL(201u, c.move("/uploads/p/1", "/docs/one.txt", false));
	CPPUNIT_ASSERT_EQUAL(std::string("data"), c.get("/docs/one.txt").body);
	CPPUNIT_ASSERT_EQUAL(404u, c.get("/uploads/p/1").status);

	auto listing = c.get("/uploads/p");
	CPPUNIT_ASSERT_EQUAL(200u, listing.status);
	CPPUNIT_ASSERT(listing.body.empty());

	std::vector<std::string> expected = {
		"move /uploads/p/1 -> /docs/one.txt",
		"unbind /uploads/p/1",
		"bind /docs/one.txt"
	};

	CPPUNIT_ASSERT(expected == c.env.events.events);
}

void dav_test::test_staging_area_unreachable()
{
	client c(backend_kind::local_filesys);
	CPPUNIT_ASSERT_EQUAL(201u, c.mkcol("/docs", {}, false));
	CPPUNIT_ASSERT_EQUAL(201u, c.mkcol("/uploads/s", "/docs/a.txt"));
	CPPUNIT_ASSERT_EQUAL(201u, c.put("/uploads/s/1", "hello"));

	auto s = upload::session::load(*c.env.store, "/uploads/s");
	CPPUNIT_ASSERT(s);

	auto staged = "/.chunkup/" + s.token();

	auto root = c.get("/");
	CPPUNIT_ASSERT_EQUAL(200u, root.status);
	CPPUNIT_ASSERT(root.body.find(".chunkup") == std::string::npos);
	CPPUNIT_ASSERT(root.body.find(s.token()) == std::string::npos);

	CPPUNIT_ASSERT_EQUAL(404u, c.get("/.chunkup").status);
	CPPUNIT_ASSERT_EQUAL(404u, c.get(staged).status);
	CPPUNIT_ASSERT_EQUAL(404u, c.get(staged + "/target").status);
	CPPUNIT_ASSERT_EQUAL(404u, c.get(staged + "/1.part").status);

	CPPUNIT_ASSERT_EQUAL(403u, c.put(staged + "/2.part", "intruder", false));
	CPPUNIT_ASSERT_EQUAL(403u, c.put(staged + "/2.part", "intruder"));
	CPPUNIT_ASSERT_EQUAL(403u, c.mkcol(staged + "/more", {}, false));
	CPPUNIT_ASSERT_EQUAL(404u, c.move(staged, "/docs/stolen", false));
	CPPUNIT_ASSERT_EQUAL(403u, c.move("/docs", "/.chunkup/docs", false));
	CPPUNIT_ASSERT_EQUAL(404u, c.del(staged + "/1.part", false));
	CPPUNIT_ASSERT_EQUAL(404u, c.del("/.chunkup", false));

	// The session went through all of the above untouched.
	CPPUNIT_ASSERT_EQUAL(201u, c.move("/uploads/s/1", "/docs/a.txt"));
	CPPUNIT_ASSERT_EQUAL(std::string("hello"), c.env.read("/docs/a.txt"));
}

void dav_test::test_plain_requests()
{
	dav::server::options opts;
	opts.can_delete = false;

	client c(backend_kind::object_store, opts);

	CPPUNIT_ASSERT_EQUAL(201u, c.mkcol("/docs", {}, false));
	CPPUNIT_ASSERT_EQUAL(405u, c.mkcol("/docs", {}, false));
	CPPUNIT_ASSERT_EQUAL(409u, c.mkcol("/missing/docs", {}, false));

	CPPUNIT_ASSERT_EQUAL(201u, c.put("/docs/a.txt", "1", false));
	CPPUNIT_ASSERT_EQUAL(204u, c.put("/docs/a.txt", "2", false));
	CPPUNIT_ASSERT_EQUAL(409u, c.put("/docs", "3", false));

	CPPUNIT_ASSERT_EQUAL(201u, c.put("/docs/b.txt", "b", false));
	CPPUNIT_ASSERT_EQUAL(412u, c.move("/docs/b.txt", "/docs/a.txt", false, false));
	CPPUNIT_ASSERT_EQUAL(204u, c.move("/docs/b.txt", "/docs/a.txt", false, true));
	CPPUNIT_ASSERT_EQUAL(std::string("b"), c.get("/docs/a.txt").body);
	CPPUNIT_ASSERT_EQUAL(404u, c.move("/docs/nothing", "/docs/c.txt", false));

	auto no_destination = c.send("MOVE", "/docs/a.txt");
	CPPUNIT_ASSERT_EQUAL(400u, no_destination.status);

	auto listing = c.get("/docs");
	CPPUNIT_ASSERT_EQUAL(200u, listing.status);
	CPPUNIT_ASSERT_EQUAL(std::string("a.txt\n"), listing.body);

	auto not_allowed = c.send("DELETE", "/docs/a.txt");
	CPPUNIT_ASSERT_EQUAL(405u, not_allowed.status);
	CPPUNIT_ASSERT_EQUAL(std::string("GET, PUT, MKCOL, MOVE"), not_allowed.headers["Allow"]);

	CPPUNIT_ASSERT_EQUAL(405u, c.send("PROPFIND", "/docs").status);
	CPPUNIT_ASSERT_EQUAL(400u, c.send("GET", "docs").status);
}

void dav_test::test_status_from_error()
{
	using e = upload::error;

	CPPUNIT_ASSERT_EQUAL(400u, dav::chunking_plugin::status_from_error(e::invalid_part_number));
	CPPUNIT_ASSERT_EQUAL(400u, dav::chunking_plugin::status_from_error(e::incomplete_upload));
	CPPUNIT_ASSERT_EQUAL(404u, dav::chunking_plugin::status_from_error(e::session_not_found));
	CPPUNIT_ASSERT_EQUAL(413u, dav::chunking_plugin::status_from_error(e::part_rejected));
	CPPUNIT_ASSERT_EQUAL(501u, dav::chunking_plugin::status_from_error(e::storage_unsupported));
	CPPUNIT_ASSERT_EQUAL(501u, dav::chunking_plugin::status_from_error(e::backend_unsupported));
	CPPUNIT_ASSERT_EQUAL(500u, dav::chunking_plugin::status_from_error(e::backend_failure));
	CPPUNIT_ASSERT_EQUAL(500u, dav::chunking_plugin::status_from_error(e::assembly_failure));
}

void dav_test::test_headers()
{
	dav::headers h = {
		{ "content-length", " 42 " },
		{ "OVERWRITE", "f" },
	};

	CPPUNIT_ASSERT(h.has("Content-Length"));
	CPPUNIT_ASSERT_EQUAL(std::int64_t(42), h.get_content_length());
	CPPUNIT_ASSERT(!h.get_overwrite());
	CPPUNIT_ASSERT_EQUAL(std::string("none"), std::string(h.get("Destination", "none")));

	CPPUNIT_ASSERT_EQUAL(std::int64_t(-1), dav::headers{}.get_content_length());
	CPPUNIT_ASSERT_EQUAL(std::int64_t(-1), dav::headers{ { "Content-Length", "abc" } }.get_content_length());
	CPPUNIT_ASSERT(dav::headers{}.get_overwrite());
	CPPUNIT_ASSERT(dav::headers{ { "Overwrite", "T" } }.get_overwrite());

	CPPUNIT_ASSERT_EQUAL(std::string("/docs/a b.txt"), dav::path_from_header_value("http://host:8080/docs/a%20b.txt?x=1#frag"));
	CPPUNIT_ASSERT_EQUAL(std::string("/docs/a.txt"), dav::path_from_header_value("/docs/a.txt"));
	CPPUNIT_ASSERT_EQUAL(std::string("/"), dav::path_from_header_value("https://host"));
	CPPUNIT_ASSERT(dav::path_from_header_value("").empty());
	CPPUNIT_ASSERT(dav::path_from_header_value("/bad%zz").empty());
}
