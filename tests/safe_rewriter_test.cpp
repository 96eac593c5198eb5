#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include "corpusflux/jsonl_io.hpp"
#include "corpusflux/safe_rewriter.hpp"
#include "test_support.hpp"

namespace {

using namespace corpusflux;

void test_removes_listed_urls() {
  corpusflux_test::TempDir dir("rewrite");
  auto path = dir.path() / "batch_x.jsonl";
  corpusflux_test::write_lines(path, {
                                         R"({"url":"u1","content_text":"a"})",
                                         R"({"url":"u2","content_text":"b"})",
                                         R"({"url": "u3", "content_text": "c"})",
                                     });
  RewriteResult result;
  std::string err;
  assert(rewrite_excluding(path.string(), {"u1", "u2"}, false, result, err));
  assert(result.removed == 2);
  assert(result.kept == 1);
  assert(result.replaced);

  auto lines = corpusflux_test::read_lines(path);
  assert(lines.size() == 1);
  // Kept records are written back byte for byte.
  assert(lines[0] == R"({"url": "u3", "content_text": "c"})");
  assert(Record::parse(lines[0])["url"] == "u3");
  assert(!std::filesystem::exists(path.string() + ".tmp"));
}

void test_untouched_when_nothing_matches() {
  corpusflux_test::TempDir dir("rewrite_none");
  auto path = dir.path() / "batch_x.jsonl";
  corpusflux_test::write_lines(path, {R"({"url":"u1"})", "", R"({"url":"u2"})"});
  const std::string before = corpusflux_test::read_all(path);
  auto mtime = std::filesystem::last_write_time(path);

  RewriteResult result;
  std::string err;
  assert(rewrite_excluding(path.string(), {"zzz"}, false, result, err));
  assert(result.removed == 0);
  assert(!result.replaced);
  assert(corpusflux_test::read_all(path) == before);
  assert(std::filesystem::last_write_time(path) == mtime);
  assert(!std::filesystem::exists(path.string() + ".tmp"));
}

void test_dry_run() {
  corpusflux_test::TempDir dir("rewrite_dry");
  auto path = dir.path() / "batch_x.jsonl";
  corpusflux_test::write_lines(path, {R"({"url":"u1"})", R"({"url":"u2"})"});
  const std::string before = corpusflux_test::read_all(path);

  RewriteResult result;
  std::string err;
  assert(rewrite_excluding(path.string(), {"u1"}, true, result, err));
  assert(result.removed == 1);
  assert(!result.replaced);
  assert(corpusflux_test::read_all(path) == before);
}

void test_malformed_lines_kept() {
  corpusflux_test::TempDir dir("rewrite_bad");
  auto path = dir.path() / "batch_x.jsonl";
  corpusflux_test::write_lines(path, {"{broken", R"({"url":"u1"})", R"(["u1"])", R"({"url":1})"});

  RewriteResult result;
  std::string err;
  assert(rewrite_excluding(path.string(), {"u1"}, false, result, err));
  assert(result.removed == 1);
  assert(result.malformed == 1);
  auto lines = corpusflux_test::read_lines(path);
  assert(lines.size() == 3);
  assert(lines[0] == "{broken");
  assert(lines[1] == R"(["u1"])");
  assert(lines[2] == R"({"url":1})");
}

void test_manifest_lookup() {
  corpusflux_test::TempDir dir("rewrite_manifest");
  auto path = dir.path() / "partition=01" / "batch_x.jsonl";
  auto other = dir.path() / "partition=01" / "batch_y.jsonl";
  corpusflux_test::write_lines(path, {R"({"url":"u1"})", R"({"url":"u2"})", R"({"url":"u3"})"});
  corpusflux_test::write_lines(other, {R"({"url":"u1"})"});

  RemovalManifest manifest;
  manifest.add("batch_x.jsonl", "u1");
  manifest.add("some/where/batch_x.jsonl", "u2");

  RewriteResult result;
  std::string err;
  assert(rewrite_from_manifest(path.string(), manifest, false, result, err));
  assert(result.manifest_hit);
  assert(result.removed == 2);
  auto lines = corpusflux_test::read_lines(path);
  assert(lines.size() == 1 && lines[0] == R"({"url":"u3"})");

  assert(rewrite_from_manifest(other.string(), manifest, false, result, err));
  assert(!result.manifest_hit);
  assert(result.removed == 0);
  assert(corpusflux_test::read_lines(other).size() == 1);
}

void test_missing_file() {
  corpusflux_test::TempDir dir("rewrite_missing");
  auto path = dir.path() / "batch_x.jsonl";
  RewriteResult result;
  std::string err;
  assert(!rewrite_excluding(path.string(), {"u1"}, false, result, err));
  assert(!err.empty());
  assert(!std::filesystem::exists(path));
  assert(!std::filesystem::exists(path.string() + ".tmp"));
}

// A write error partway through leaves the original untouched and removes the
// staged output. The staged path points at /dev/full, which rejects every write.
void test_write_failure_keeps_original() {
  if (!std::filesystem::exists("/dev/full")) {
    return;
  }
  corpusflux_test::TempDir dir("rewrite_full");
  auto path = dir.path() / "batch_x.jsonl";
  std::vector<std::string> lines = {R"({"url":"drop","content_text":"x"})"};
  const std::string filler(200, 'k');
  for (int i = 0; i < 2000; ++i) {
    lines.push_back(R"({"url":"keep)" + std::to_string(i) + R"(","content_text":")" + filler + R"("})");
  }
  corpusflux_test::write_lines(path, lines);
  const std::string before = corpusflux_test::read_all(path);
  assert(before.size() > 256 * 1024);

  const std::filesystem::path staged = path.string() + ".tmp";
  std::filesystem::create_symlink("/dev/full", staged);

  RewriteResult result;
  std::string err;
  assert(!rewrite_excluding(path.string(), {"drop"}, false, result, err));
  assert(!err.empty());
  assert(!result.replaced);
  assert(corpusflux_test::read_all(path) == before);
  assert(!std::filesystem::exists(std::filesystem::symlink_status(staged)));
}

void test_copy_replace_file() {
  corpusflux_test::TempDir dir("copy_replace");
  auto from = dir.path() / "staged.tmp";
  auto to = dir.path() / "batch_x.jsonl";
  corpusflux_test::write_lines(from, {"new"});
  corpusflux_test::write_lines(to, {"old", "older"});

  std::string err;
  assert(copy_replace_file(from.string(), to.string(), err));
  assert(corpusflux_test::read_lines(to) == std::vector<std::string>{"new"});
  assert(!std::filesystem::exists(from));
}

// When neither rename nor copy can replace the target, the staged output is
// kept and its path is reported.
void test_failed_replace_keeps_staged_output() {
  corpusflux_test::TempDir dir("replace_blocked");
  auto from = dir.path() / "staged.tmp";
  auto blocked = dir.path() / "blocked";
  corpusflux_test::write_lines(from, {"payload"});
  corpusflux_test::write_lines(blocked / "inside.txt", {"x"});

  std::string err;
  assert(!replace_file(from.string(), blocked.string(), err));
  assert(err.find(from.string()) != std::string::npos);
  assert(corpusflux_test::read_lines(from) == std::vector<std::string>{"payload"});
  assert(std::filesystem::is_directory(blocked));

  err.clear();
  assert(!copy_replace_file(from.string(), blocked.string(), err));
  assert(err.find(from.string()) != std::string::npos);
  assert(std::filesystem::exists(from));

  StagedFile staged(blocked.string());
  err.clear();
  assert(staged.open(err));
  assert(staged.write_line("row"));
  assert(!staged.commit(err));
  assert(err.find(staged.temp_path()) != std::string::npos);
  assert(corpusflux_test::read_lines(staged.temp_path()) == std::vector<std::string>{"row"});
}

}  // namespace

int main() {
  test_removes_listed_urls();
  test_untouched_when_nothing_matches();
  test_dry_run();
  test_malformed_lines_kept();
  test_manifest_lookup();
  test_missing_file();
  test_write_failure_keeps_original();
  test_copy_replace_file();
  test_failed_replace_keeps_staged_output();
  return 0;
}
