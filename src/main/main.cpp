#include "credstream/counting.hpp"
#include "credstream/credential_iterator.hpp"
#include "credstream/engine_config.hpp"
#include "credstream/log.hpp"
#include "credstream/metrics.hpp"
#include "credstream/wordlists.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

struct Cli {
  std::string host = "127.0.0.1";
  int port = 0;
  std::string service;
  std::string user;
  std::string pass;
  std::string combo;
  std::string version = "default";
  std::string config_path;
  std::string wordlists_path;
  bool password_only = false;
  bool empty_password = false;
  bool no_chunking = false;
  bool count_only = false;
  std::uint64_t limit = 0; // 0 = unlimited
};

Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_i = [&](const char* pfx, int* out){
      if (a.rfind(pfx, 0) == 0) { *out = std::stoi(a.substr(std::string(pfx).size())); return true; }
      return false;
    };
    std::string limit;
    if (eat("--host=", &c.host)) continue;
    if (eat_i("--port=", &c.port)) continue;
    if (eat("--service=", &c.service)) continue;
    if (eat("--user=", &c.user)) continue;
    if (eat("--pass=", &c.pass)) continue;
    if (eat("--combo=", &c.combo)) continue;
    if (eat("--version=", &c.version)) continue;
    if (eat("--config=", &c.config_path)) continue;
    if (eat("--wordlists=", &c.wordlists_path)) continue;
    if (eat("--limit=", &limit)) { c.limit = std::stoull(limit); continue; }
    if (a == "--password-only")  { c.password_only  = true; continue; }
    if (a == "--empty-password") { c.empty_password = true; continue; }
    if (a == "--no-chunking")    { c.no_chunking    = true; continue; }
    if (a == "--count-only")     { c.count_only     = true; continue; }
    if (a == "-h" || a == "--help") {
      std::cout <<
        "Usage: credstream-enum [--service=NAME] [--host=ADDR] [--port=N]\n"
        "                       [--user=VALUE|FILE] [--pass=VALUE|FILE] [--combo=USER:PASS|FILE]\n"
        "                       [--version=WORDLIST_VERSION] [--wordlists=FILE.json] [--config=FILE.json]\n"
        "                       [--password-only] [--empty-password] [--no-chunking]\n"
        "                       [--count-only] [--limit=N]\n";
      std::exit(0);
    }
    std::cerr << "[enum] ignoring unknown argument: " << a << "\n";
  }
  return c;
}

}

int main(int argc, char** argv) {
  Cli cli;
  try {
    cli = parse_cli(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "[enum] bad argument: " << e.what() << "\n";
    return 2;
  }

  cs::EngineConfig ecfg;
  std::string err;
  if (!cli.config_path.empty() && !cs::load_engine_config(cli.config_path, ecfg, &err)) {
    std::cerr << "[enum] " << err << "\n";
    return 2;
  }
  if (!cli.wordlists_path.empty()) ecfg.wordlists_path = cli.wordlists_path;
  if (cli.no_chunking) ecfg.chunking.disable_chunking = true;
  if (cli.empty_password) ecfg.use_empty_password = true;

  cs::JsonWordlistProvider wordlists;
  if (!ecfg.wordlists_path.empty() && !wordlists.load_file(ecfg.wordlists_path, &err)) {
    std::cerr << "[enum] " << err << "\n";
    return 2;
  }

  cs::MetricsRegistry metrics;
  cs::CredentialIterator::Config icfg;
  icfg.host = cs::Host{cli.host, cli.port, cli.service};
  icfg.user = cli.user;
  icfg.password = cli.pass;
  icfg.combo = cli.combo;
  icfg.version = cli.version;
  icfg.password_only = cli.password_only;
  icfg.use_empty_password = ecfg.use_empty_password;
  icfg.chunking = ecfg.chunking;
  icfg.wordlists = &wordlists;
  icfg.metrics = &metrics;

  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  metrics.start_stage("count");
  auto total = cs::count_credentials(icfg, &err);
  metrics.end_stage("count");
  if (!total) {
    std::cerr << "[enum] count failed: " << err << "\n";
    return 3;
  }
  metrics.set_expected(*total);
  std::cerr << "[enum] total=" << *total << "\n";
  if (cli.count_only) return 0;

  cs::CredentialIterator it(icfg);
  cs::Credential cred;
  cs::PullStatus st;
  while ((st = it.next(cred)) == cs::PullStatus::Value) {
    std::cout << cred.user << ':' << cred.password << '\n';
    if (cli.limit && it.emitted() >= cli.limit) break;
  }

  bool closed = it.close(&err);
  if (!closed) std::cerr << "[enum] close: " << err << "\n";

  const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();
  cs::RunStats rs = metrics.snapshot(wall_ms);
  std::cerr << "[enum] emitted=" << rs.emitted
            << " skipped=" << rs.skipped_lines
            << " bytes=" << rs.bytes
            << " chunks=" << rs.chunk_files
            << " pairs/s=" << rs.pairs_per_sec << "\n";

  if (st == cs::PullStatus::Failed) return 1;
  return closed ? 0 : 1;
}
