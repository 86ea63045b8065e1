#include "annolog/console_note.hpp"

#include <simdjson.h>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static std::string env_or(const char* k, const char* defv) {
  const char* v = std::getenv(k);
  return (v && *v) ? std::string(v) : std::string(defv);
}

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

static void spit(const fs::path& p, const std::string& s) {
  std::ofstream out(p, std::ios::binary);
  out.write(s.data(), static_cast<std::streamsize>(s.size()));
}

static int run(const std::string& bin, const std::string& args, const fs::path& out) {
  std::string cmd = "\"" + bin + "\" " + args + " > \"" + out.string() + "\"";
  return std::system(cmd.c_str());
}

static std::vector<std::string> lines_of(const std::string& s) {
  std::vector<std::string> v; std::istringstream in(s); std::string l;
  while (std::getline(in, l)) v.push_back(l);
  return v;
}

int main() {
  std::string bin = env_or("AL_BIN", "annolog");
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  fs::path work = fs::temp_directory_path() / ("annolog-it-" + std::to_string(stamp));
  fs::create_directories(work);

  bool ok = true;

  // --- decode to JSON
  const fs::path log = work / "build.log";
  spit(log,
       al::encode_timestamp_note(1700000001000, 1000) + "Started by user\n" +
       "plain line\n" +
       "A" + al::encode_note("{\"type\":\"mystery\"}") + "B" + al::encode_timestamp_note(1700000002500) + "\n");

  const fs::path json_out = work / "decoded.jsonl";
  int rc = run(bin, "--format=json --build-start=2023-11-14T22:13:20Z \"" + log.string() + "\"", json_out);
  if (rc != 0) { std::cerr << "[FAIL] decode returned " << rc << "\n"; return 1; }

  const auto rows = lines_of(slurp(json_out));
  if (rows.size() != 3) { std::cerr << "[FAIL] expected 3 rows, got " << rows.size() << "\n"; return 1; }

  simdjson::ondemand::parser p;
  const char* texts[] = {"Started by user", "plain line", "AB"};
  const std::int64_t elapsed[] = {1000, -1, 2500};
  for (size_t i = 0; i < rows.size(); ++i) {
    simdjson::padded_string js(rows[i]);
    auto doc = p.iterate(js);
    std::string_view text = doc["text"].get_string().value_or("");
    if (text != texts[i]) {
      std::cerr << "[FAIL] row " << i << " text=" << text << "\n"; ok = false;
    }
    int64_t e = -1;
    auto ev = doc["elapsed"];
    if (!ev.is_null().value_or(true)) e = ev.get_int64().value_or(-2);
    if (e != elapsed[i]) {
      std::cerr << "[FAIL] row " << i << " elapsed=" << e << " expected " << elapsed[i] << "\n"; ok = false;
    }
  }

  // --- count
  const fs::path count_out = work / "count.txt";
  rc = run(bin, "--count \"" + log.string() + "\"", count_out);
  if (rc != 0 || lines_of(slurp(count_out)) != std::vector<std::string>{"3"}) {
    std::cerr << "[FAIL] --count\n"; ok = false;
  }

  // --- missing log: no lines, count 0
  rc = run(bin, "--count \"" + (work / "absent.log").string() + "\" 2>/dev/null", count_out);
  if (rc != 0 || lines_of(slurp(count_out)) != std::vector<std::string>{"0"}) {
    std::cerr << "[FAIL] --count on missing log\n"; ok = false;
  }

  // --- stamp then decode returns the original text
  const fs::path plain = work / "plain.txt";
  const std::string original = "alpha\nbeta\n\ngamma\n";
  spit(plain, original);
  const fs::path stamped = work / "stamped.log";
  rc = run(bin, "--stamp \"" + plain.string() + "\"", stamped);
  const std::string stamped_text = slurp(stamped);
  if (rc != 0 || stamped_text.find(std::string(al::kNotePreamble)) == std::string::npos) {
    std::cerr << "[FAIL] --stamp produced no notes\n"; ok = false;
  }
  const fs::path back = work / "back.txt";
  rc = run(bin, "--format=plain \"" + stamped.string() + "\"", back);
  if (rc != 0 || slurp(back) != original) {
    std::cerr << "[FAIL] stamped log does not decode back to the original\n"; ok = false;
  }

  // --- usage errors
  rc = run(bin, "--format=fancy x 2>/dev/null", work / "usage.txt");
  if (rc == 0) { std::cerr << "[FAIL] bad --format accepted\n"; ok = false; }

  rc = run(bin, "--charset=UTF-16 \"" + log.string() + "\" 2>/dev/null", work / "usage.txt");
  if (rc == 0 || !slurp(work / "usage.txt").empty()) {
    std::cerr << "[FAIL] --charset=UTF-16 accepted\n"; ok = false;
  }
  rc = run(bin, "--charset=ISO-8859-1 --count \"" + log.string() + "\"", count_out);
  if (rc != 0 || lines_of(slurp(count_out)) != std::vector<std::string>{"3"}) {
    std::cerr << "[FAIL] --charset=ISO-8859-1 rejected\n"; ok = false;
  }

  std::error_code ec;
  fs::remove_all(work, ec);

  if (!ok) return 1;
  std::cout << "[PASS] end-to-end CLI: decode/count/stamp\n";
  return 0;
}
