#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "annolog/console_note.hpp"
#include "annolog/line_decoder.hpp"
#include "annolog/log_record.hpp"

namespace fs = std::filesystem;
using clk = std::chrono::steady_clock;

// Every line gets a timestamp note; every `link_every`-th also a hyperlink.
static std::string make_synth_log(std::size_t lines, std::size_t link_every) {
  fs::path p = fs::temp_directory_path() / "al_bench_synth.log";
  std::ofstream out(p, std::ios::binary);
  const std::int64_t start = 1700000000000;
  for (size_t i = 0; i < lines; ++i) {
    out << al::encode_timestamp_note(start + static_cast<std::int64_t>(i), static_cast<std::int64_t>(i));
    out << "[INFO] compiling unit " << i << " of " << lines;
    if (link_every && (i % link_every) == 0) out << " see " << al::encode_hyperlink_note("http://ci/job/1", 4) << "logs";
    out << "\n";
  }
  out.flush();
  return p.string();
}

struct Args {
  std::string log_path;        // if empty -> synth
  std::size_t lines = 200'000; // for synth
  std::size_t link_every = 10; // for synth
  int iters = 3;
};

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i=1;i<argc;++i){
    std::string s(argv[i]);
    auto eq = s.find('=');
    auto key = s.substr(0, eq);
    auto val = (eq==std::string::npos) ? "" : s.substr(eq+1);
    if (key=="--log") a.log_path = val;
    else if (key=="--lines") a.lines = std::stoull(val);
    else if (key=="--link-every") a.link_every = std::stoull(val);
    else if (key=="--iters") a.iters = std::stoi(val);
    else if (key=="--help" || key=="-h") {
      std::cout <<
        "Usage: al_bench_decoder [--log=path] [--lines=N] [--link-every=K] [--iters=I]\n"
        "If --log is omitted, a synthetic annotated log is generated.\n";
      std::exit(0);
    }
  }
  return a;
}

static void bench_decode(const std::string& path, int iters) {
  std::cout << "\n[decode] file=" << path << " iters=" << iters << "\n";
  auto record = std::make_shared<al::FileLogRecord>(path);
  const double mib = fs::file_size(path) / (1024.0*1024.0);
  for (int k=1;k<=iters;++k) {
    al::LineDecoder dec(record);
    std::uint64_t n=0, stamped=0;

    auto t0 = clk::now();
    while (auto line = dec.next_line()) { ++n; if (line->timestamp()) ++stamped; }
    auto t1 = clk::now();
    dec.close();

    const double sec = std::chrono::duration<double>(t1-t0).count();
    std::cout << "  iter " << k
              << ": lines=" << n
              << " stamped=" << stamped
              << " time=" << sec << "s"
              << "  throughput=" << (mib/sec) << " MiB/s"
              << "  lines/s=" << (n/sec) << "\n";
  }

  auto t0 = clk::now();
  const std::uint64_t count = al::LineDecoder(record).line_count();
  auto t1 = clk::now();
  const double sec = std::chrono::duration<double>(t1-t0).count();
  std::cout << "[count] lines=" << count << " time=" << sec << "s  throughput=" << (mib/sec) << " MiB/s\n";
}

int main(int argc, char** argv){
  Args a = parse_args(argc, argv);
  std::string log = a.log_path;
  if (log.empty() || !fs::exists(log)) log = make_synth_log(a.lines, a.link_every);
  bench_decode(log, a.iters);
  return 0;
}
