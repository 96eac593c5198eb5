#include <iostream>
#include <vector>

#include "corpusflux/cleaning_stats.hpp"
#include "corpusflux/record_transformer.hpp"
#include "corpusflux/top_k.hpp"

int main() {
  using namespace corpusflux;

  std::vector<std::string> lines = {
      R"j({"url":"https://a.example/1","content_text":"<p>Hello&nbsp;world</p>   see [docs](https://d.example)"})j",
      R"({"url":"https://a.example/2","content_text":"<br/>","meta_tags":[]})",
      R"({"url":"https://a.example/3","content_text":"short","language":"en"})",
      R"(not json at all)",
  };

  RecordTransformer transformer;
  CleaningStats stats;
  TopKSelector selector(2);
  for (const auto &line : lines) {
    std::string out;
    if (transformer.transform_line(line, "demo", out, stats) == LineAction::drop) {
      std::cout << "dropped: " << line << '\n';
      continue;
    }
    std::cout << "kept:    " << out << '\n';

    ParsedLine parsed = parse_record_line(out, "content_text");
    if (parsed.kind != LineKind::parsed) {
      continue;
    }
    TopKEntry entry;
    entry.url = parsed.record.value("url", "");
    entry.content_length = parsed.record["content_text"].get<std::string>().size();
    entry.source_file = "demo.jsonl";
    selector.admit(entry);
  }

  std::cout << "\nBytes removed per rule:\n";
  for (const auto &[name, bytes] : stats.rule_bytes_reduced) {
    std::cout << "  " << name << ": " << bytes << '\n';
  }
  std::cout << "\nLongest records:\n";
  for (const auto &e : selector.entries()) {
    std::cout << "  " << e.content_length << " " << e.url << '\n';
  }
  return 0;
}
