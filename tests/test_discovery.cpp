#include "mcpws.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

#include <catch2/catch_test_macros.hpp>

using namespace mcpws;
namespace fs = std::filesystem;

namespace {

// Per-test scratch directory, removed on scope exit.
struct TempDir {
  fs::path path;
  TempDir() {
    static std::atomic<int> counter{0};
    path = fs::temp_directory_path() /
           ("mcpws-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter.fetch_add(1)));
    fs::remove_all(path);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
  std::string str() const { return path.string(); }
};

void write_file(const fs::path& p, const std::string& text) {
  fs::create_directories(p.parent_path());
  std::ofstream out(p);
  out << text;
}

std::string read_file(const std::string& p) {
  std::ifstream in(p);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

}  // namespace

TEST_CASE("Discovery - auth token is a random UUID-shaped string", "[discovery]") {
  auto a = generate_auth_token();
  auto b = generate_auth_token();
  REQUIRE(a);
  REQUIRE(b);
  std::regex shape("^[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}$");
  REQUIRE(std::regex_match(a.value(), shape));
  REQUIRE(a.value() != b.value());
}

TEST_CASE("Discovery - loopback hosts", "[discovery]") {
  REQUIRE(is_loopback_host("127.0.0.1"));
  REQUIRE(is_loopback_host("127.8.9.10"));
  REQUIRE(is_loopback_host("localhost"));
  REQUIRE(is_loopback_host("::1"));
  REQUIRE_FALSE(is_loopback_host("0.0.0.0"));
  REQUIRE_FALSE(is_loopback_host("192.168.1.4"));
  REQUIRE_FALSE(is_loopback_host("example.com"));
}

TEST_CASE("Discovery - start writes a private lock file, stop removes it", "[discovery]") {
  TempDir dir;
  std::string path;
  {
    Discovery discovery(dir.str());
    auto started = discovery.start(45123, {"/home/dev/project"}, "TestIDE", "127.0.0.1");
    REQUIRE(started);
    REQUIRE(discovery.active());
    path = discovery.lock_path();
    REQUIRE(path == dir.str() + "/45123.lock");
    REQUIRE(fs::exists(path));

    struct stat st {};
    REQUIRE(::stat(path.c_str(), &st) == 0);
    REQUIRE((st.st_mode & 0777) == 0600);

    auto record = Discovery::read_record(path);
    REQUIRE(record);
    REQUIRE(record.value().pid == static_cast<int>(::getpid()));
    REQUIRE(record.value().auth_token == discovery.token());
    REQUIRE(record.value().ide_name == "TestIDE");
    REQUIRE(record.value().transport == "ws");
    REQUIRE(record.value().port == 45123);
    REQUIRE(record.value().workspace_folders == std::vector<std::string>{"/home/dev/project"});

    auto raw = parse_json(read_file(path));
    REQUIRE(raw);
    REQUIRE(raw.value()["authToken"].isString());
    REQUIRE(raw.value()["runningInWindows"].isBool());

    discovery.stop();
    REQUIRE_FALSE(fs::exists(path));
    REQUIRE_FALSE(discovery.active());

    // Restart, then let the destructor clean up.
    REQUIRE(discovery.start(45123, {}, "TestIDE", "127.0.0.1"));
    REQUIRE(fs::exists(path));
  }
  REQUIRE_FALSE(fs::exists(path));
}

TEST_CASE("Discovery - non-loopback host is refused", "[discovery]") {
  TempDir dir;
  Discovery discovery(dir.str());
  auto started = discovery.start(45124, {}, "TestIDE", "0.0.0.0");
  REQUIRE_FALSE(started);
  REQUIRE(started.get_error() == ErrorCode::kConfigError);
  REQUIRE_FALSE(fs::exists(dir.path / "45124.lock"));
}

TEST_CASE("Discovery - list, workspace lookup and stale cleanup", "[discovery]") {
  TempDir dir;
  int me = static_cast<int>(::getpid());
  write_file(dir.path / "1001.lock",
             R"({"pid":)" + std::to_string(me) +
                 R"(,"workspaceFolders":["/src"],"ideName":"A","transport":"ws","authToken":"t1"})");
  write_file(dir.path / "1002.lock",
             R"({"pid":)" + std::to_string(me) +
                 R"(,"workspaceFolders":["/src/app"],"ideName":"B","transport":"ws","authToken":"t2"})");
  write_file(dir.path / "1003.lock",
             R"({"pid":2147483000,"workspaceFolders":["/gone"],"ideName":"C","transport":"ws","authToken":"t3"})");
  write_file(dir.path / "broken.lock", "{not json");
  write_file(dir.path / "notes.txt", "ignored");

  auto records = Discovery::list(dir.str());
  REQUIRE(records.size() == 3);
  REQUIRE(records[0].port == 1001);
  REQUIRE(records[2].port == 1003);

  auto best = Discovery::find_for_workspace(dir.str(), "/src/app/main.cpp");
  REQUIRE(best);
  REQUIRE(best->ide_name == "B");
  REQUIRE(Discovery::find_for_workspace(dir.str(), "/src/lib.cpp")->ide_name == "A");
  REQUIRE_FALSE(Discovery::find_for_workspace(dir.str(), "/srcfoo/x"));

  REQUIRE(Discovery::clean_stale(dir.str()) == 1);
  REQUIRE_FALSE(fs::exists(dir.path / "1003.lock"));
  REQUIRE(fs::exists(dir.path / "1001.lock"));
}
