#ifndef CHUNKUP_PROPS_SQLITE_PROPERTY_STORE_HPP
#define CHUNKUP_PROPS_SQLITE_PROPERTY_STORE_HPP

#include <sqlite3.h>

#include <libfilezilla/mutex.hpp>

#include "../logger/modularized.hpp"
#include "property_store.hpp"

namespace chunkup::props {

class sqlite_property_store: public property_store
{
public:
	sqlite_property_store(const fz::native_string &db_path, fz::logger_interface &logger = fz::get_null_logger());
	~sqlite_property_store() override;

	explicit operator bool() const
	{
		return bool(db_);
	}

	bool set(std::string_view path, const property_map &props) override;
	property_map get(std::string_view path, const std::vector<std::string> &names) override;
	bool remove(std::string_view path) override;
	std::vector<std::string> find_older_than(std::string_view name, const fz::datetime &cutoff) override;

private:
	logger::modularized logger_;

	void initialize_db();
	void deinitialize_db();
	void prepare_statements();
	void finalize_statements();
	bool exec(const char *sql);

	fz::mutex mutex_;

	sqlite3 *db_{};
	fz::native_string db_path_;

	sqlite3_stmt *select_stmt_{};
	sqlite3_stmt *upsert_stmt_{};
	sqlite3_stmt *delete_stmt_{};
	sqlite3_stmt *older_than_stmt_{};
};

}

#endif // CHUNKUP_PROPS_SQLITE_PROPERTY_STORE_HPP
