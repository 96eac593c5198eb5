#undef NDEBUG
#include <algorithm>
#include <cassert>
#include <filesystem>
#include <string>
#include <vector>

#include "corpusflux/jsonl_io.hpp"
#include "corpusflux/stages.hpp"
#include "test_support.hpp"

namespace {

using namespace corpusflux;
namespace fs = std::filesystem;

std::string record(const std::string &url, const std::string &text) {
  Record r = Record::object();
  r["url"] = url;
  r["content_text"] = text;
  return dump_record(r);
}

// Two partitions, three files, distinct text lengths.
void make_corpus(const fs::path &root) {
  corpusflux_test::write_lines(root / "partition=00" / "batch_a.jsonl",
                               {record("a1", "<p>Hello   world</p>"), record("a2", std::string(40, 'x')),
                                R"({"url":"a3","content_text":"","meta_tags":[]})", "not json"});
  corpusflux_test::write_lines(root / "partition=00" / "batch_b.jsonl",
                               {record("b1", "see [link](https://e.x/?q=1) &amp; more"), record("b2", std::string(25, 'y'))});
  corpusflux_test::write_lines(root / "partition=0f" / "batch_c.jsonl",
                               {record("c1", std::string(33, 'z')), record("c2", "tiny"), "",
                                R"({"url":"c3","meta_tags":["kept"]})"});
  for (const auto &f : {"partition=00/batch_a.jsonl", "partition=00/batch_b.jsonl", "partition=0f/batch_c.jsonl"}) {
    corpusflux_test::age_file(root / f);
  }
}

Config base_config(const fs::path &input) {
  Config cfg;
  cfg.input_dir = input.string();
  cfg.progress_interval_ms = 60000;
  return cfg;
}

void test_clean_is_idempotent() {
  corpusflux_test::TempDir dir("stage_clean");
  make_corpus(dir.path() / "analyses");
  Config cfg = base_config(dir.path() / "analyses");
  cfg.output_dir = (dir.path() / "analyses_cleaned").string();
  cfg.threads = 2;

  CleanReport first;
  std::string err;
  assert(run_clean(cfg, first, err));
  assert(first.failed_files.empty());
  assert(first.stats.processed_files == 3);
  assert(first.stats.skipped_files == 0);
  assert(first.stats.records_dropped == 1);
  assert(first.stats.parse_errors == 1);

  auto out_a = dir.path() / "analyses_cleaned" / "partition=00" / "batch_a.jsonl";
  auto lines = corpusflux_test::read_lines(out_a);
  assert(lines.size() == 3);
  assert(lines[0] == record("a1", "Hello world"));
  assert(lines[2] == "not json");
  auto out_b = corpusflux_test::read_lines(dir.path() / "analyses_cleaned" / "partition=00" / "batch_b.jsonl");
  assert(out_b[0] == record("b1", "see link  more"));
  auto out_c = corpusflux_test::read_lines(dir.path() / "analyses_cleaned" / "partition=0f" / "batch_c.jsonl");
  assert(out_c.size() == 3);
  assert(out_c[2] == R"({"url":"c3","meta_tags":["kept"]})");

  const std::string snapshot = corpusflux_test::read_all(out_a);
  CleanReport second;
  assert(run_clean(cfg, second, err));
  assert(second.stats.processed_files == 0);
  assert(second.stats.skipped_files == 3);
  assert(second.skipped_files.size() == 3);
  assert(second.stats.skipped_bytes_after > 0);
  assert(corpusflux_test::read_all(out_a) == snapshot);

  cfg.resume = false;
  CleanReport forced;
  assert(run_clean(cfg, forced, err));
  assert(forced.stats.processed_files == 3);
  assert(corpusflux_test::read_all(out_a) == snapshot);
}

void test_clean_same_output_for_any_thread_count() {
  corpusflux_test::TempDir dir("stage_clean_threads");
  make_corpus(dir.path() / "in");
  Config cfg = base_config(dir.path() / "in");
  cfg.resume = false;

  cfg.threads = 1;
  cfg.output_dir = (dir.path() / "out1").string();
  CleanReport one;
  std::string err;
  assert(run_clean(cfg, one, err));

  cfg.threads = 4;
  cfg.output_dir = (dir.path() / "out4").string();
  CleanReport four;
  assert(run_clean(cfg, four, err));

  for (const auto &f : {"partition=00/batch_a.jsonl", "partition=00/batch_b.jsonl", "partition=0f/batch_c.jsonl"}) {
    assert(corpusflux_test::read_all(dir.path() / "out1" / f) == corpusflux_test::read_all(dir.path() / "out4" / f));
  }
  assert(one.stats.rule_bytes_reduced == four.stats.rule_bytes_reduced);
  assert(one.stats.size_before == four.stats.size_before);
  assert(one.stats.size_after == four.stats.size_after);
}

void test_clean_output_inside_input() {
  corpusflux_test::TempDir dir("stage_clean_nested");
  make_corpus(dir.path());
  Config cfg = base_config(dir.path());
  cfg.output_dir = (dir.path() / "cleaned").string();
  cfg.threads = 1;

  CleanReport report;
  std::string err;
  assert(run_clean(cfg, report, err));
  assert(report.stats.processed_files == 3);
  assert(run_clean(cfg, report, err));
  assert(report.stats.processed_files + report.stats.skipped_files == 3);
  assert(!fs::exists(dir.path() / "cleaned" / "cleaned"));
}

void test_clean_rejects_bad_input() {
  corpusflux_test::TempDir dir("stage_clean_bad");
  Config cfg = base_config(dir.path() / "missing");
  cfg.output_dir = (dir.path() / "out").string();
  CleanReport report;
  std::string err;
  assert(!run_clean(cfg, report, err));
  assert(err.find("not found") != std::string::npos);

  corpusflux_test::write_lines(dir.path() / "file.txt", {"x"});
  cfg.input_dir = (dir.path() / "file.txt").string();
  err.clear();
  assert(!run_clean(cfg, report, err));
  assert(err.find("not a directory") != std::string::npos);

  fs::create_directories(dir.path() / "empty");
  cfg.input_dir = (dir.path() / "empty").string();
  err.clear();
  assert(!run_clean(cfg, report, err));
  assert(err.find("No .jsonl files") != std::string::npos);
}

void test_select_then_remove() {
  corpusflux_test::TempDir dir("stage_select");
  make_corpus(dir.path() / "analyses");
  Config cfg = base_config(dir.path() / "analyses");
  cfg.manifest_path = (dir.path() / "largest_content.jsonl").string();
  cfg.top_n = 2;
  cfg.threads = 3;
  cfg.wave_files = 1;

  SelectReport selected;
  std::string err;
  assert(run_select(cfg, selected, err));
  assert(selected.files == 3);
  assert(selected.waves == 3);
  assert(selected.parse_errors == 1);
  assert(selected.entries.size() == 2);
  assert(selected.entries[0].url == "a2");
  assert(selected.entries[1].url == "b1");

  auto manifest_lines = corpusflux_test::read_lines(cfg.manifest_path);
  assert(manifest_lines.size() == 2);
  auto top = Record::parse(manifest_lines[0]);
  assert(top["content_length"] == 40);
  assert(top["url"] == "a2");
  assert(top["source_file"] == "batch_a.jsonl");

  // Same manifest regardless of thread count and wave size.
  Config single = cfg;
  single.threads = 1;
  single.wave_files = 0;
  single.manifest_path = (dir.path() / "single.jsonl").string();
  SelectReport single_report;
  assert(run_select(single, single_report, err));
  assert(corpusflux_test::read_all(single.manifest_path) == corpusflux_test::read_all(cfg.manifest_path));

  Config dry = cfg;
  dry.dry_run = true;
  RemoveReport dry_report;
  const std::string batch_a_before = corpusflux_test::read_all(dir.path() / "analyses" / "partition=00" / "batch_a.jsonl");
  assert(run_remove(dry, dry_report, err));
  assert(dry_report.removed == 2);
  assert(dry_report.files_rewritten == 0);
  assert(corpusflux_test::read_all(dir.path() / "analyses" / "partition=00" / "batch_a.jsonl") == batch_a_before);

  RemoveReport removed;
  assert(run_remove(cfg, removed, err));
  assert(removed.failed_files.empty());
  assert(removed.expected_removals == 2);
  assert(removed.removed == 2);
  assert(removed.files_matched == 2);
  assert(removed.files_rewritten == 2);
  assert(removed.per_file.size() == 2);
  assert(std::is_sorted(removed.per_file.begin(), removed.per_file.end(),
                        [](const RemoveFileReport &a, const RemoveFileReport &b) { return a.path < b.path; }));
  assert(removed.missing_files.empty());

  auto batch_a = corpusflux_test::read_lines(dir.path() / "analyses" / "partition=00" / "batch_a.jsonl");
  assert(batch_a.size() == 3);
  for (const auto &line : batch_a) {
    assert(line.find("\"a2\"") == std::string::npos);
  }
  auto batch_b = corpusflux_test::read_lines(dir.path() / "analyses" / "partition=00" / "batch_b.jsonl");
  assert(batch_b.size() == 1);
  assert(batch_b[0] == record("b2", std::string(25, 'y')));

  // Running again removes nothing more.
  RemoveReport again;
  assert(run_remove(cfg, again, err));
  assert(again.removed == 0);
  assert(again.files_rewritten == 0);
}

void test_remove_reports_missing_and_collisions() {
  corpusflux_test::TempDir dir("stage_remove");
  auto root = dir.path() / "analyses";
  corpusflux_test::write_lines(root / "partition=00" / "batch_a.jsonl", {R"({"url":"u1"})", R"({"url":"u2"})"});
  corpusflux_test::write_lines(root / "partition=01" / "batch_a.jsonl", {R"({"url":"u1"})", R"({"url":"u3"})"});
  auto manifest = dir.path() / "largest_content.jsonl";
  corpusflux_test::write_lines(manifest, {R"({"content_length":9,"url":"u1","source_file":"batch_a.jsonl"})",
                                          R"({"content_length":8,"url":"u9","source_file":"batch_gone.jsonl"})"});

  Config cfg = base_config(root);
  cfg.manifest_path = manifest.string();
  cfg.threads = 2;
  RemoveReport report;
  std::string err;
  assert(run_remove(cfg, report, err));
  assert(report.collisions == std::vector<std::string>{"batch_a.jsonl"});
  assert(report.missing_files == std::vector<std::string>{"batch_gone.jsonl"});
  assert(report.removed == 2);
  assert(corpusflux_test::read_lines(root / "partition=00" / "batch_a.jsonl") ==
         std::vector<std::string>{R"({"url":"u2"})"});
  assert(corpusflux_test::read_lines(root / "partition=01" / "batch_a.jsonl") ==
         std::vector<std::string>{R"({"url":"u3"})"});

  Config no_manifest = cfg;
  no_manifest.manifest_path = (dir.path() / "absent.jsonl").string();
  err.clear();
  assert(!run_remove(no_manifest, report, err));
  assert(!err.empty());
}

void test_select_empty_tree() {
  corpusflux_test::TempDir dir("stage_select_empty");
  fs::create_directories(dir.path() / "in");
  Config cfg = base_config(dir.path() / "in");
  cfg.manifest_path = (dir.path() / "m.jsonl").string();
  SelectReport report;
  std::string err;
  assert(run_select(cfg, report, err));
  assert(report.entries.empty());
  assert(fs::exists(cfg.manifest_path));
  assert(fs::file_size(cfg.manifest_path) == 0);
  assert(report.directory_errors == 0);

  cfg.input_dir = (dir.path() / "missing").string();
  assert(!run_select(cfg, report, err));
}

// A directory that cannot be listed is counted in the report; its siblings
// are still scanned. Skipped where permissions are not enforced (root).
void test_select_counts_unlisted_directories() {
  corpusflux_test::TempDir dir("stage_select_locked");
  const fs::path root = dir.path() / "in";
  corpusflux_test::write_lines(root / "partition=00" / "batch_a.jsonl", {record("a1", "open")});
  corpusflux_test::write_lines(root / "partition=01" / "batch_b.jsonl", {record("b1", "locked")});
  const fs::path locked = root / "partition=01";
  fs::permissions(locked, fs::perms::none);
  std::error_code ec;
  fs::directory_iterator listing(locked, ec);
  if (!ec) {
    fs::permissions(locked, fs::perms::owner_all);
    return;
  }

  Config cfg = base_config(root);
  cfg.manifest_path = (dir.path() / "m.jsonl").string();
  SelectReport report;
  std::string err;
  const bool ok = run_select(cfg, report, err);
  fs::permissions(locked, fs::perms::owner_all);
  assert(ok);
  assert(report.directory_errors == 1);
  assert(report.files == 1);
  assert(report.entries.size() == 1 && report.entries[0].url == "a1");
}

}  // namespace

int main() {
  test_clean_is_idempotent();
  test_clean_same_output_for_any_thread_count();
  test_clean_output_inside_input();
  test_clean_rejects_bad_input();
  test_select_then_remove();
  test_remove_reports_missing_and_collisions();
  test_select_empty_tree();
  test_select_counts_unlisted_directories();
  return 0;
}
