#include "../logger/type.hpp"
#include "sqlite_property_store.hpp"

namespace chunkup::props {

namespace {

const fz::datetime datetime_0(0, fz::datetime::milliseconds);

std::int64_t to_ms(const fz::datetime &dt)
{
	return (dt - datetime_0).get_milliseconds();
}

void bind_text(sqlite3_stmt *stmt, int index, std::string_view s)
{
	sqlite3_bind_text(stmt, index, s.data(), int(s.size()), SQLITE_TRANSIENT);
}

std::string column_text(sqlite3_stmt *stmt, int index)
{
	auto data = reinterpret_cast<const char *>(sqlite3_column_text(stmt, index));
	return data ? std::string(data, std::size_t(sqlite3_column_bytes(stmt, index))) : std::string();
}

}

sqlite_property_store::sqlite_property_store(const fz::native_string &db_path, fz::logger_interface &logger)
	: logger_(logger, "SQLite Property Store")
	, db_path_(db_path)
{
	initialize_db();
	prepare_statements();
}

sqlite_property_store::~sqlite_property_store()
{
	finalize_statements();
	deinitialize_db();
}

void sqlite_property_store::initialize_db()
{
	if (sqlite3_open(fz::to_utf8(db_path_).c_str(), &db_) != SQLITE_OK) {
		logger_.log_u(logmsg::error, L"Could not open the SQLite DB [%s]: %s", db_path_, db_ ? sqlite3_errmsg(db_) : "out of memory");
		return deinitialize_db();
	}
	else {
		logger_.log_u(logmsg::debug_info, L"Successfully opened SQLite DB [%s]", db_path_);
	}

	// Each request of an upload may be served by a different process.
	sqlite3_busy_timeout(db_, 5000);

	const char *sql = R"(
		CREATE TABLE IF NOT EXISTS properties (
			path TEXT NOT NULL,
			name TEXT NOT NULL,
			value TEXT NOT NULL,
			modified_at INTEGER NOT NULL,
			PRIMARY KEY (path, name)
		);

		CREATE INDEX IF NOT EXISTS properties_by_name ON properties (name, modified_at);
	)";

	if (!exec(sql))
		return deinitialize_db();
}

void sqlite_property_store::deinitialize_db()
{
	if (db_) {
		sqlite3_close(db_);
		db_ = {};
	}
}

bool sqlite_property_store::exec(const char *sql)
{
	char *err_msg = nullptr;

	if (sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
		logger_.log_u(logmsg::error, L"SQLite error: %s.", err_msg ? err_msg : "unknown");
		sqlite3_free(err_msg);
		return false;
	}

	return true;
}

void sqlite_property_store::prepare_statements()
{
	static const char select_sql[]     = "SELECT value FROM properties WHERE path = ? AND name = ?";
	static const char upsert_sql[]     = "INSERT OR REPLACE INTO properties (path, name, value, modified_at) VALUES (?, ?, ?, ?)";
	static const char delete_sql[]     = "DELETE FROM properties WHERE path = ?";
	static const char older_than_sql[] = "SELECT path FROM properties WHERE name = ? AND modified_at < ? ORDER BY modified_at";

	if (!db_)
		return;

	bool ok =
		sqlite3_prepare_v2(db_, select_sql, -1, &select_stmt_, nullptr) == SQLITE_OK &&
		sqlite3_prepare_v2(db_, upsert_sql, -1, &upsert_stmt_, nullptr) == SQLITE_OK &&
		sqlite3_prepare_v2(db_, delete_sql, -1, &delete_stmt_, nullptr) == SQLITE_OK &&
		sqlite3_prepare_v2(db_, older_than_sql, -1, &older_than_stmt_, nullptr) == SQLITE_OK;

	if (!ok) {
		logger_.log_u(logmsg::error, L"Could not prepare the statements: %s.", sqlite3_errmsg(db_));
		finalize_statements();
		deinitialize_db();
	}
}

void sqlite_property_store::finalize_statements()
{
	sqlite3_finalize(select_stmt_);
	sqlite3_finalize(upsert_stmt_);
	sqlite3_finalize(delete_stmt_);
	sqlite3_finalize(older_than_stmt_);

	select_stmt_ = upsert_stmt_ = delete_stmt_ = older_than_stmt_ = nullptr;
}

bool sqlite_property_store::set(std::string_view path, const property_map &props)
{
	fz::scoped_lock lock(mutex_);

	if (!db_)
		return false;

	if (!exec("BEGIN IMMEDIATE"))
		return false;

	auto now = to_ms(fz::datetime::now());

	for (auto &[name, value]: props) {
		bind_text(upsert_stmt_, 1, path);
		bind_text(upsert_stmt_, 2, name);
		bind_text(upsert_stmt_, 3, value);
		sqlite3_bind_int64(upsert_stmt_, 4, now);

		int res = sqlite3_step(upsert_stmt_);

		sqlite3_reset(upsert_stmt_);

		if (res != SQLITE_DONE) {
			logger_.log_u(logmsg::warning, L"Was not able to set property '%s' of '%s'. Error: %d.", name, path, res);
			exec("ROLLBACK");
			return false;
		}
	}

	if (!exec("COMMIT")) {
		exec("ROLLBACK");
		return false;
	}

	logger_.log_u(logmsg::debug_debug, L"Set %d properties of '%s'.", props.size(), path);

	return true;
}

property_map sqlite_property_store::get(std::string_view path, const std::vector<std::string> &names)
{
	fz::scoped_lock lock(mutex_);

	property_map props;

	if (!db_)
		return props;

	for (auto &name: names) {
		bind_text(select_stmt_, 1, path);
		bind_text(select_stmt_, 2, name);

		int res = sqlite3_step(select_stmt_);

		if (res == SQLITE_ROW)
			props.emplace(name, column_text(select_stmt_, 0));
		else
		if (res != SQLITE_DONE)
			logger_.log_u(logmsg::error, L"Could not select property '%s' of '%s'. Error: %d.", name, path, res);

		sqlite3_reset(select_stmt_);
	}

	return props;
}

bool sqlite_property_store::remove(std::string_view path)
{
	fz::scoped_lock lock(mutex_);

	if (!db_)
		return false;

	bind_text(delete_stmt_, 1, path);

	int res = sqlite3_step(delete_stmt_);

	sqlite3_reset(delete_stmt_);

	if (res != SQLITE_DONE) {
		logger_.log_u(logmsg::warning, L"Was not able to delete the properties of '%s'. Error: %d.", path, res);
		return false;
	}

	return true;
}

std::vector<std::string> sqlite_property_store::find_older_than(std::string_view name, const fz::datetime &cutoff)
{
	fz::scoped_lock lock(mutex_);

	std::vector<std::string> paths;

	if (!db_)
		return paths;

	bind_text(older_than_stmt_, 1, name);
	sqlite3_bind_int64(older_than_stmt_, 2, to_ms(cutoff));

	int res;
	while ((res = sqlite3_step(older_than_stmt_)) == SQLITE_ROW)
		paths.push_back(column_text(older_than_stmt_, 0));

	sqlite3_reset(older_than_stmt_);

	if (res != SQLITE_DONE)
		logger_.log_u(logmsg::error, L"Could not look for properties '%s' older than %s. Error: %d.", name, cutoff.format("%Y-%m-%d %H:%M:%S", fz::datetime::utc), res);

	return paths;
}

}
