#include "annolog/console_note.hpp"
#include "annolog/line_decoder.hpp"
#include "annolog/line_json.hpp"
#include "annolog/line_reader.hpp"
#include "annolog/log_record.hpp"
#include "annolog/time_format.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

namespace {

enum class Format { Plain, System, Elapsed, Json };

struct Cli {
  Format format = Format::System;
  std::string build_start;       // epoch millis or ISO-8601; empty -> 0 / now (--stamp)
  std::string charset = "UTF-8";
  bool utc = false;
  bool count = false;
  bool stamp = false;
  bool verbose = false;
  std::string path;
};

void usage(std::ostream& os) {
  os <<
    "Usage: annolog [--format=plain|system|elapsed|json] [--build-start=<ms|ISO-8601>]\n"
    "               [--charset=NAME] [--time-zone=utc|local] [--count] [--stamp] [-v] <log>\n"
    "  --count   print the number of lines in <log>\n"
    "  --stamp   copy <log> (or stdin for '-') to stdout, adding a timestamp note per line\n";
}

bool parse_cli(int argc, char** argv, Cli& c, std::string* err_out) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    std::string v;
    if (eat("--format=", &v)) {
      if (v == "plain") c.format = Format::Plain;
      else if (v == "system") c.format = Format::System;
      else if (v == "elapsed") c.format = Format::Elapsed;
      else if (v == "json") c.format = Format::Json;
      else { if (err_out) *err_out = "unknown format: " + v; return false; }
      continue;
    }
    if (eat("--time-zone=", &v)) {
      if (v == "utc") c.utc = true;
      else if (v == "local") c.utc = false;
      else { if (err_out) *err_out = "unknown time zone: " + v; return false; }
      continue;
    }
    if (eat("--build-start=", &c.build_start)) continue;
    if (eat("--charset=", &c.charset)) continue;
    if (a == "--count")   { c.count = true; continue; }
    if (a == "--stamp")   { c.stamp = true; continue; }
    if (a == "-v" || a == "--verbose") { c.verbose = true; continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(0); }
    if (a.size() > 1 && a[0] == '-') { if (err_out) *err_out = "unknown option: " + a; return false; }
    if (!c.path.empty()) { if (err_out) *err_out = "more than one log given"; return false; }
    c.path = a;
  }
  if (c.path.empty()) { if (err_out) *err_out = "no log given"; return false; }
  if (!al::is_ascii_compatible(c.charset)) { if (err_out) *err_out = "unsupported charset: " + c.charset; return false; }
  return true;
}

std::int64_t now_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

int stamp_stream(const Cli& cli, std::int64_t start_ms) {
  std::unique_ptr<al::ByteSource> src;
  if (cli.path == "-") src = std::make_unique<al::FileByteSource>(stdin);
  else src = std::make_unique<al::FileByteSource>(cli.path);

  al::LineReader reader(std::move(src));
  std::string line;
  std::uint64_t n = 0;
  while (reader.read_line(line)) {
    const std::int64_t t = now_ms();
    std::cout << al::encode_timestamp_note(t, t - start_ms) << line << "\n";
    ++n;
  }
  std::cout.flush();
  if (cli.verbose) std::cerr << "[stamp] lines=" << n << " bytes=" << reader.bytes_read() << "\n";
  return 0;
}

int decode_log(const Cli& cli, std::int64_t start_ms) {
  al::FileLogRecord::Config rcfg;
  rcfg.charset = cli.charset;
  rcfg.start_millis = start_ms;
  auto record = std::make_shared<al::FileLogRecord>(cli.path, rcfg);

  al::LineDecoder::Config dcfg;
  dcfg.log_dropped_notes = cli.verbose;
  al::LineDecoder decoder(record, al::NoteRegistry::with_defaults(), dcfg);

  if (!record->exists()) {
    std::cerr << "[cli] no log at " << cli.path << "\n";
  }

  if (cli.count) {
    std::cout << decoder.line_count() << "\n";
    return 0;
  }

  if (cli.verbose) std::cerr << "[cli] decoding " << cli.path << " charset=" << decoder.charset() << "\n";

  std::uint64_t n = 0, stamped = 0;
  while (auto line = decoder.next_line()) {
    ++n;
    if (line->timestamp()) ++stamped;
    switch (cli.format) {
      case Format::Plain:
        std::cout << line->text() << "\n";
        break;
      case Format::Json:
        std::cout << al::LineJsonWriter::to_json(*line, n) << "\n";
        break;
      case Format::System:
        if (line->timestamp()) std::cout << "[" << al::format_clock_time(line->timestamp()->millis_since_epoch, cli.utc) << "] ";
        else std::cout << std::string(11, ' ');
        std::cout << line->text() << "\n";
        break;
      case Format::Elapsed:
        if (line->timestamp()) std::cout << "[" << al::format_elapsed(line->timestamp()->elapsed_millis) << "] ";
        else std::cout << std::string(15, ' ');
        std::cout << line->text() << "\n";
        break;
    }
  }
  decoder.close();
  if (cli.verbose) std::cerr << "[cli] lines=" << n << " stamped=" << stamped << "\n";
  return 0;
}

}

int main(int argc, char** argv) {
  Cli cli;
  std::string err;
  if (!parse_cli(argc, argv, cli, &err)) {
    std::cerr << "[cli] " << err << "\n";
    usage(std::cerr);
    return 2;
  }

  std::int64_t start_ms = cli.stamp ? now_ms() : 0;
  if (!cli.build_start.empty()) {
    auto v = al::parse_time_ms(cli.build_start);
    if (!v) {
      std::cerr << "[cli] bad --build-start: " << cli.build_start << "\n";
      return 2;
    }
    start_ms = *v;
  }

  try {
    return cli.stamp ? stamp_stream(cli, start_ms) : decode_log(cli, start_ms);
  } catch (const std::system_error& e) {
    std::cerr << "[cli] I/O failure: " << e.what() << "\n";
    return 3;
  }
}
