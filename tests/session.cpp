#include "../src/chunkup/upload/session.hpp"

#include "test_utils.hpp"

/*
 * This testsuite asserts the correctness of the upload session persistence and of the part number parsing.
 */

using namespace chunkup;

class session_test final : public CppUnit::TestFixture
{
	CPPUNIT_TEST_SUITE(session_test);
	CPPUNIT_TEST(test_parse_part_number);
	CPPUNIT_TEST(test_save_and_load);
	CPPUNIT_TEST(test_load_missing);
	CPPUNIT_TEST(test_forget);
	CPPUNIT_TEST(test_invalid_session_is_not_saved);
	CPPUNIT_TEST_SUITE_END();

public:
	void setUp() override;
	void tearDown() override;

	void test_parse_part_number();
	void test_save_and_load();
	void test_load_missing();
	void test_forget();
	void test_invalid_session_is_not_saved();

private:
	std::unique_ptr<test::temp_dir> dir_;
	std::unique_ptr<props::sqlite_property_store> store_;
};

CPPUNIT_TEST_SUITE_REGISTRATION(session_test);

void session_test::setUp()
{
	dir_ = std::make_unique<test::temp_dir>();
	store_ = std::make_unique<props::sqlite_property_store>(*dir_ / "properties.db");
	CPPUNIT_ASSERT(*store_);
}

void session_test::tearDown()
{
	store_.reset();
	dir_.reset();
}

void session_test::test_parse_part_number()
{
	CPPUNIT_ASSERT_EQUAL(std::uint32_t(1), upload::parse_part_number("1"));
	CPPUNIT_ASSERT_EQUAL(std::uint32_t(42), upload::parse_part_number("42"));
	CPPUNIT_ASSERT_EQUAL(std::uint32_t(7), upload::parse_part_number("007"));
	CPPUNIT_ASSERT_EQUAL(std::uint32_t(10000), upload::parse_part_number("10000"));
	CPPUNIT_ASSERT_EQUAL(std::uint32_t(10), upload::parse_part_number("0000000010"));

	CPPUNIT_ASSERT_EQUAL(std::uint32_t(0), upload::parse_part_number(""));
	CPPUNIT_ASSERT_EQUAL(std::uint32_t(0), upload::parse_part_number("0"));
	CPPUNIT_ASSERT_EQUAL(std::uint32_t(0), upload::parse_part_number("10001"));
	CPPUNIT_ASSERT_EQUAL(std::uint32_t(0), upload::parse_part_number("-1"));
	CPPUNIT_ASSERT_EQUAL(std::uint32_t(0), upload::parse_part_number("+1"));
	CPPUNIT_ASSERT_EQUAL(std::uint32_t(0), upload::parse_part_number("1a"));
	CPPUNIT_ASSERT_EQUAL(std::uint32_t(0), upload::parse_part_number(" 1"));
	CPPUNIT_ASSERT_EQUAL(std::uint32_t(0), upload::parse_part_number(".target"));
	CPPUNIT_ASSERT_EQUAL(std::uint32_t(0), upload::parse_part_number("00000000001"));
	CPPUNIT_ASSERT_EQUAL(std::uint32_t(0), upload::parse_part_number("99999999999999999999"));

	CPPUNIT_ASSERT_EQUAL(std::uint32_t(0), upload::parse_part_number("6", 5));
	CPPUNIT_ASSERT_EQUAL(std::uint32_t(5), upload::parse_part_number("5", 5));
}

void session_test::test_save_and_load()
{
	upload::session s("/uploads/s", "/docs/a.txt", "0123456789abcdef");
	CPPUNIT_ASSERT(s);
	CPPUNIT_ASSERT(s.get_state() == upload::session::state::created);
	CPPUNIT_ASSERT(s.save(*store_));

	auto loaded = upload::session::load(*store_, "/uploads/s");
	CPPUNIT_ASSERT(loaded);
	CPPUNIT_ASSERT_EQUAL(std::string("/uploads/s"), loaded.id().str());
	CPPUNIT_ASSERT_EQUAL(std::string("/docs/a.txt"), loaded.target_path().str());
	CPPUNIT_ASSERT_EQUAL(std::string("0123456789abcdef"), loaded.token());
	CPPUNIT_ASSERT(loaded.get_state() == upload::session::state::parts_receiving);

	auto props = store_->get("/uploads/s", { std::string(upload::session::token_property) });
	CPPUNIT_ASSERT_EQUAL(std::size_t(1), props.size());
	CPPUNIT_ASSERT_EQUAL(std::string("0123456789abcdef"), props.begin()->second);
}

void session_test::test_load_missing()
{
	CPPUNIT_ASSERT(!upload::session::load(*store_, "/uploads/nothing"));
	CPPUNIT_ASSERT(!upload::session::load(*store_, util::fs::absolute_unix_path()));

	// A collection with only one of the two properties is no session.
	CPPUNIT_ASSERT(store_->set("/uploads/half", { { std::string(upload::session::token_property), "abc" } }));
	CPPUNIT_ASSERT(!upload::session::load(*store_, "/uploads/half"));
}

void session_test::test_forget()
{
	CPPUNIT_ASSERT(upload::session("/uploads/s", "/a", "t").save(*store_));
	CPPUNIT_ASSERT(upload::session("/uploads/t", "/b", "u").save(*store_));

	CPPUNIT_ASSERT(upload::session::forget(*store_, "/uploads/s"));
	CPPUNIT_ASSERT(!upload::session::load(*store_, "/uploads/s"));
	CPPUNIT_ASSERT(upload::session::load(*store_, "/uploads/t"));

	// Forgetting twice is harmless.
	CPPUNIT_ASSERT(upload::session::forget(*store_, "/uploads/s"));
}

void session_test::test_invalid_session_is_not_saved()
{
	CPPUNIT_ASSERT(!upload::session("/uploads/s", "/a", "").save(*store_));
	CPPUNIT_ASSERT(!upload::session("uploads/s", "/a", "t").save(*store_));
	CPPUNIT_ASSERT(!upload::session().save(*store_));
	CPPUNIT_ASSERT(!upload::session::load(*store_, "/uploads/s"));

	CPPUNIT_ASSERT_EQUAL(std::string("committing"), upload::toString<std::string>(upload::session::state::committing));
}
