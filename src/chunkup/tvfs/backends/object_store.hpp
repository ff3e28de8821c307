#ifndef CHUNKUP_TVFS_BACKENDS_OBJECT_STORE_HPP
#define CHUNKUP_TVFS_BACKENDS_OBJECT_STORE_HPP

#include <map>

#include <libfilezilla/mutex.hpp>
#include <libfilezilla/time.hpp>

#include "../../logger/modularized.hpp"
#include "../../upload/chunked_file_write.hpp"
#include "../backend.hpp"

namespace chunkup::tvfs::backends {

/// \brief An in-memory object store: a flat map of keys to objects, with directories emulated by keys ending in '/'.
///
/// Besides the backend operations, it speaks the multipart vocabulary of object stores,
/// onto which it maps the chunked-write contract.
class object_store final: public backend, private upload::chunked_file_write
{
public:
	struct options
	{
		options(){}

		/// Parts bigger than this are rejected. Negative means no limit.
		std::int64_t max_part_size{-1};
	};

	struct completed_part
	{
		std::uint32_t number{};
		std::string etag;
	};

	static constexpr std::uint32_t max_part_number = 10000;

	object_store(std::string name, fz::logger_interface &logger, options opts = {});

	std::string_view name() const override;

	fz::result info(const util::fs::absolute_unix_path &path, entry &out) override;
	fz::result list(const util::fs::absolute_unix_path &path, std::vector<entry> &out) override;
	fz::result mkdir(const util::fs::absolute_unix_path &path) override;
	fz::result open_reader(const util::fs::absolute_unix_path &path, std::unique_ptr<reader> &out) override;
	fz::result write(const util::fs::absolute_unix_path &path, reader &data, std::int64_t &written) override;
	fz::result rename(const util::fs::absolute_unix_path &from, const util::fs::absolute_unix_path &to) override;
	fz::result remove_file(const util::fs::absolute_unix_path &path) override;
	fz::result remove_directory(const util::fs::absolute_unix_path &path, bool recursive) override;

	upload::chunked_file_write *chunked_file_write() override;

	/// \returns the id of a new multipart upload for \c key.
	std::string create_multipart_upload(const std::string &key);

	/// \returns the etag of the uploaded part. An upload of an already uploaded part number replaces it.
	std::pair<fz::result, std::string /*etag*/> upload_part(const std::string &upload_id, std::uint32_t part_number, std::string data);

	/// Concatenates the listed parts, in the order they're given, into the object at the upload's key.
	/// All parts must have been uploaded with the given etags.
	fz::result complete_multipart_upload(const std::string &upload_id, const std::vector<completed_part> &parts, std::int64_t &size);

	void abort_multipart_upload(const std::string &upload_id);

	/// The number of multipart uploads neither completed nor aborted yet.
	std::size_t pending_uploads() const;

private:
	std::pair<upload::error, std::string> begin_chunked_file(const util::fs::absolute_unix_path &target_path) override;
	upload::error put_chunked_file_part(const util::fs::absolute_unix_path &target_path, std::string_view token, std::string_view part_id, reader &data, std::int64_t size_hint) override;
	std::pair<upload::error, std::int64_t> write_chunked_file(const util::fs::absolute_unix_path &target_path, std::string_view token) override;
	void cancel_chunked_file(const util::fs::absolute_unix_path &target_path, std::string_view token) override;

	struct object
	{
		std::string data;
		fz::datetime mtime;
	};

	struct multipart_upload
	{
		std::string key;
		std::map<std::uint32_t, std::pair<std::string /*etag*/, std::string /*data*/>> parts;
	};

	struct chunked_write
	{
		util::fs::absolute_unix_path target;
		std::map<std::uint32_t, std::string /*etag*/> etags;
	};

	enum class kind { none, file, dir };

	kind kind_of(const std::string &key) const;
	bool has_children(const std::string &dir_key) const;

	logger::modularized logger_;
	std::string name_;
	options opts_;

	mutable fz::mutex mutex_;
	std::map<std::string, object> objects_;
	std::map<std::string, multipart_upload> uploads_;

	// Taken before mutex_ whenever both are held.
	fz::mutex chunked_mutex_;
	std::map<std::string, chunked_write, std::less<>> chunked_writes_;
};

}

#endif // CHUNKUP_TVFS_BACKENDS_OBJECT_STORE_HPP
