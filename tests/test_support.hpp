#pragma once

#include <boost/asio/io_context.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <tubefetch/job_id.hpp>

namespace tubefetch::test {

namespace fs = std::filesystem;

// Scratch directory removed on destruction.
class TempDir {
   public:
	TempDir()
		: path_(fs::temp_directory_path() /
				("tubefetch-test-" + allocate_job_id())) {
		fs::create_directories(path_);
	}
	~TempDir() {
		std::error_code ec;
		fs::remove_all(path_, ec);
	}

	TempDir(const TempDir &) = delete;
	TempDir &operator=(const TempDir &) = delete;

	[[nodiscard]] const fs::path &path() const { return path_; }
	fs::path operator/(const std::string &name) const { return path_ / name; }

   private:
	fs::path path_;
};

/// Behavior of a generated stand-in for yt-dlp. The script honours -o,
/// --merge-output-format and --audio-format the way yt-dlp does (including
/// its vorbis -> .ogg and aac -> .m4a extensions), so the planned artifact
/// appears where the runner expects it.
struct FakeExtractor {
	std::string stdout_text =
		"[youtube] Extracting URL\n"
		"[download]  42.5% of 10.00MiB at  1.23MiB/s ETA 00:10\n";
	std::string stderr_text;
	int exit_code = 0;
	bool write_artifact = true;
	std::string sleep_seconds = "0";
	fs::path log;  // "start"/"end" lines appended when set
};

inline fs::path write_script(const fs::path &path, const std::string &body) {
	{
		std::ofstream out(path);
		out << "#!/bin/sh\n" << body;
	}
	fs::permissions(path,
					fs::perms::owner_all | fs::perms::group_read |
						fs::perms::group_exec | fs::perms::others_read |
						fs::perms::others_exec);
	return path;
}

inline fs::path write_fake_extractor(const fs::path &path,
									 const FakeExtractor &fake) {
	std::string body = R"(out=""
fmt=""
url="$1"
while [ $# -gt 0 ]; do
	case "$1" in
		-o) out="$2"; shift ;;
		--merge-output-format|--audio-format) fmt="$2"; shift ;;
	esac
	shift
done
case "$fmt" in
	vorbis) fmt=ogg ;;
	aac) fmt=m4a ;;
esac
)";
	if (!fake.log.empty()) body += "echo start >> '" + fake.log.string() + "'\n";
	body += "cat <<'__OUT__'\n" + fake.stdout_text + "__OUT__\n";
	if (!fake.stderr_text.empty()) {
		body += "cat >&2 <<'__ERR__'\n" + fake.stderr_text + "\n__ERR__\n";
	}
	if (fake.sleep_seconds != "0") body += "sleep " + fake.sleep_seconds + "\n";
	if (fake.write_artifact) {
		body += R"(case "$out" in
	*"%(playlist_index)s"*)
		dir=$(dirname "$out")
		mkdir -p "$dir"
		: > "$dir/1-aaaaaaaaaaa.$fmt"
		: > "$dir/2-bbbbbbbbbbb.$fmt"
		;;
	*)
		ext_field='%(ext)s'
		: > "${out%$ext_field}$fmt"
		;;
esac
)";
	}
	if (!fake.log.empty()) body += "echo end >> '" + fake.log.string() + "'\n";
	body += "exit " + std::to_string(fake.exit_code) + "\n";
	return write_script(path, body);
}

/// Runs `ioc` until `done` holds or `limit` elapses. Returns `done()`.
inline bool run_until(boost::asio::io_context &ioc,
					  const std::function<bool()> &done,
					  std::chrono::milliseconds limit = std::chrono::seconds(10)) {
	auto deadline = std::chrono::steady_clock::now() + limit;
	while (!done() && std::chrono::steady_clock::now() < deadline) {
		ioc.run_for(std::chrono::milliseconds(20));
		if (ioc.stopped()) ioc.restart();
	}
	return done();
}

}  // namespace tubefetch::test
