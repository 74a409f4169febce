#include "credstream/credential_iterator.hpp"
#include "credstream/metrics.hpp"
#include "credstream/wordlists.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using Pairs = std::vector<std::pair<std::string, std::string>>;

static int failures = 0;

static void expect(bool ok, const std::string& what) {
  if (ok) { std::cout << "[PASS] " << what << "\n"; return; }
  std::cerr << "[FAIL] " << what << "\n";
  ++failures;
}

static fs::path g_work;

static std::string write_lines(const std::string& name, const std::vector<std::string>& lines) {
  fs::path p = g_work / name;
  std::ofstream out(p, std::ios::binary);
  for (auto& l : lines) out << l << "\n";
  return p.string();
}

struct Run {
  Pairs pairs;
  cs::PullStatus last = cs::PullStatus::Exhausted;
  std::vector<std::string> infos;
  std::vector<std::string> warnings;
  std::vector<std::string> errors;
};

static Run run(cs::CredentialIterator::Config cfg) {
  Run r;
  cfg.log = [&](cs::LogLevel lvl, std::string_view msg){
    if (lvl == cs::LogLevel::Info)  r.infos.emplace_back(msg);
    if (lvl == cs::LogLevel::Warn)  r.warnings.emplace_back(msg);
    if (lvl == cs::LogLevel::Error) r.errors.emplace_back(msg);
  };
  cs::CredentialIterator it(std::move(cfg));
  cs::Credential c;
  while ((r.last = it.next(c)) == cs::PullStatus::Value) r.pairs.emplace_back(c.user, c.password);
  std::string err;
  if (!it.close(&err)) r.errors.push_back("close: " + err);
  return r;
}

static Pairs cross(const std::vector<std::string>& users, const std::vector<std::string>& passwords) {
  Pairs out;
  for (auto& u : users) for (auto& p : passwords) out.emplace_back(u, p);
  return out;
}

static cs::CredentialIterator::Config base(const std::string& service = "ssh") {
  cs::CredentialIterator::Config cfg;
  cfg.host = cs::Host{"127.0.0.1", 22, service};
  cfg.version = "1.0";
  return cfg;
}

int main() {
  g_work = fs::temp_directory_path() / "cs_credential_iterator_test";
  fs::remove_all(g_work);
  fs::create_directories(g_work / "tmp");

  cs::StaticWordlistProvider defaults;
  defaults.add("default", "ssh", {{"root", "admin", "test"}, {"toor", "123456"}});
  defaults.add("default", "vnc", {{}, {"vncpass", "secret"}});

  const std::vector<std::string> users = {"alice", "bob"};
  const std::vector<std::string> passwords = {"p1", "p2", "p3"};
  const std::string user_file = write_lines("users.txt", users);
  const std::string pass_file = write_lines("passwords.txt", passwords);

  // construction does no I/O and never fails, even for missing paths
  {
    cs::CredentialIterator it(cs::Host{"10.0.0.1", 22, "ssh"}, "", "", (g_work / "nope").string(), "1.0", false);
    expect(!it.done() && it.emitted() == 0, "constructed lazily");
  }

  // file x file: reset reproduces the inner order
  {
    auto cfg = base();
    cfg.user = user_file;
    cfg.password = pass_file;
    Run r = run(cfg);
    expect(r.pairs == cross(users, passwords), "2 file users x 3 file passwords, user-major");
    expect(r.last == cs::PullStatus::Exhausted && r.errors.empty(), "clean exhaustion");
    std::vector<std::string> seq;
    for (auto& p : r.pairs) seq.push_back(p.second);
    expect(seq == std::vector<std::string>{"p1", "p2", "p3", "p1", "p2", "p3"}, "password sequence repeats exactly");
  }

  // literal x file, file x literal, literal x literal
  {
    auto cfg = base();
    cfg.user = "admin";
    cfg.password = pass_file;
    expect(run(cfg).pairs == cross({"admin"}, passwords), "literal user x file passwords");

    cfg.user = user_file;
    cfg.password = "hunter2";
    expect(run(cfg).pairs == cross(users, {"hunter2"}), "file users x literal password");

    cfg.user = "root";
    cfg.password = "toor";
    expect(run(cfg).pairs == cross({"root"}, {"toor"}), "literal x literal");
  }

  // default wordlists
  {
    auto cfg = base();
    cfg.wordlists = &defaults;
    Run r = run(cfg);
    expect(r.pairs == cross({"root", "admin", "test"}, {"toor", "123456"}), "defaults x defaults");

    cfg.password = pass_file;
    expect(run(cfg).pairs == cross({"root", "admin", "test"}, passwords), "default users x file passwords");

    cfg.password.clear();
    cfg.use_empty_password = true;
    expect(run(cfg).pairs == cross({"root", "admin", "test"}, {""}), "empty-password policy yields one blank password");
  }

  // empty factors
  {
    const std::string empty = write_lines("empty.txt", {});
    auto cfg = base();
    cfg.user = user_file;
    cfg.password = empty;
    Run r = run(cfg);
    expect(r.pairs.empty() && r.last == cs::PullStatus::Exhausted, "empty password file -> no pairs");

    cfg.user = empty;
    cfg.password = pass_file;
    r = run(cfg);
    expect(r.pairs.empty() && r.last == cs::PullStatus::Exhausted, "empty user file -> no pairs");

    cfg = base("unknown-service");
    cfg.wordlists = &defaults;
    cfg.password = "x";
    expect(run(cfg).pairs.empty(), "no default users -> no pairs");
  }

  // password-only
  {
    auto cfg = base("vnc");
    cfg.password_only = true;
    cfg.user = user_file;  // ignored
    cfg.password = pass_file;
    Run r = run(cfg);
    expect(r.pairs == cross({""}, passwords), "password-only over file: empty users, every password");

    cfg.password.clear();
    cfg.wordlists = &defaults;
    expect(run(cfg).pairs == cross({""}, {"vncpass", "secret"}), "password-only over defaults");

    cfg.password = "single";
    expect(run(cfg).pairs == cross({""}, {"single"}), "password-only literal");
  }

  // combo file with a malformed line; first colon splits
  {
    const std::string combos = write_lines("combos.txt", {"a:b", "malformed", "c:d", "e:pa:ss", ":blankuser", "nopass:"});
    auto cfg = base();
    cfg.combo = combos;
    cfg.user = "ignored";
    Run r = run(cfg);
    Pairs want = {{"a", "b"}, {"c", "d"}, {"e", "pa:ss"}, {"", "blankuser"}, {"nopass", ""}};
    expect(r.pairs == want, "combo file pairs in order, malformed skipped");
    expect(r.warnings.size() == 1 && r.warnings[0].find("malformed") != std::string::npos, "one warning for the malformed line");
    expect(r.last == cs::PullStatus::Exhausted, "malformed line is not fatal");
  }

  // combo literal
  {
    auto cfg = base();
    cfg.combo = "admin:s3cr:et";
    expect(run(cfg).pairs == Pairs{{"admin", "s3cr:et"}}, "combo literal emitted once");

    cfg.combo = "nocolon";
    Run r = run(cfg);
    expect(r.pairs.empty() && r.last == cs::PullStatus::Failed, "combo literal without colon fails");
    expect(!r.errors.empty() && r.errors[0].find("user:password") != std::string::npos, "config error reported");
  }

  // failure is distinguishable and sticky
  {
    auto cfg = base();
    cfg.user = user_file;
    cfg.password = pass_file;
    cfg.chunking.reader.max_line_bytes = 4;  // "alice" is too long
    cfg.log = [](cs::LogLevel, std::string_view){};
    cs::CredentialIterator it(cfg);
    cs::Credential c;
    expect(it.next(c) == cs::PullStatus::Failed, "over-long user line fails the pull");
    expect(it.failed() && it.done() && !it.error().empty(), "error kept: " + it.error());
    expect(it.next(c) == cs::PullStatus::Failed, "failure is sticky");
    expect(it.close(), "close after failure");
  }

  // password file unlinked mid-run: the reset seeks the still-open handle
  {
    const std::string unlinked = write_lines("unlinked.txt", {"x", "y"});
    auto cfg = base();
    cfg.user = user_file;
    cfg.password = unlinked;
    cfg.chunking.disable_chunking = true;
    cs::CredentialIterator it(cfg);
    cs::Credential c;
    Pairs got;
    cs::PullStatus st = it.next(c);
    if (st == cs::PullStatus::Value) got.emplace_back(c.user, c.password);
    fs::remove(unlinked);
    while ((st = it.next(c)) == cs::PullStatus::Value) got.emplace_back(c.user, c.password);
    expect(got == cross(users, {"x", "y"}), "full cross product from the unlinked file");
    expect(st == cs::PullStatus::Exhausted && !it.failed(), "rewind seeks before reopening: " + it.error());
    expect(it.close(), "close after unlink");
  }

  // chunked password file losing chunk 0: the reset has to reopen it and fails
  {
    std::vector<std::string> pws;
    for (int i = 0; i < 40; ++i) pws.push_back("pw" + std::to_string(i));
    const fs::path root = g_work / "tmp_reopen";
    fs::create_directories(root);
    auto cfg = base();
    cfg.user = "alice";
    cfg.password = write_lines("reopen.txt", pws);
    cfg.chunking.large_file_threshold = 1;
    cfg.chunking.chunk_bytes = 32;
    cfg.chunking.temp_root = root.string();
    cs::MetricsRegistry metrics;
    cfg.metrics = &metrics;
    cfg.log = [](cs::LogLevel, std::string_view){};
    cs::CredentialIterator it(cfg);
    cs::Credential c;
    Pairs got;
    cs::PullStatus st = it.next(c);
    if (st == cs::PullStatus::Value) got.emplace_back(c.user, c.password);
    for (auto& dir : fs::directory_iterator(root)) fs::remove(dir.path() / "chunk_0000.txt");
    while ((st = it.next(c)) == cs::PullStatus::Value) got.emplace_back(c.user, c.password);
    expect(got == cross({"alice"}, pws), "first user's pass completes");
    expect(st == cs::PullStatus::Failed && it.error().find("password") != std::string::npos, "reopen failure surfaces: " + it.error());
    auto stats = metrics.snapshot(1.0);
    expect(stats.errors_by_source.count("password") == 1, "error attributed to the password source");
    expect(it.close() && fs::is_empty(root), "close after failed reset removes chunks");
  }

  // chunked password file: reset across chunk boundaries keeps order
  {
    std::vector<std::string> many;
    for (int i = 0; i < 500; ++i) many.push_back("pw" + std::to_string(i));
    const std::string big = write_lines("big.txt", many);
    auto cfg = base();
    cfg.user = user_file;
    cfg.password = big;
    cfg.chunking.large_file_threshold = 1;
    cfg.chunking.chunk_bytes = 256;
    cfg.chunking.temp_root = (g_work / "tmp").string();
    cs::MetricsRegistry metrics;
    cfg.metrics = &metrics;
    Run r = run(cfg);
    expect(r.pairs == cross(users, many), "chunked passwords: full cross product in order");
    auto stats = metrics.snapshot(1.0);
    expect(stats.emitted == r.pairs.size(), "metrics count emitted pairs");
    expect(stats.chunk_files > 1, "metrics count chunk files: " + std::to_string(stats.chunk_files));
    expect(stats.bytes > 0, "metrics count bytes");
    expect(fs::is_empty(g_work / "tmp"), "close removed chunk directories");
    bool saw_created = false;
    for (auto& m : r.infos) if (m.find("created") != std::string::npos && m.find("chunks") != std::string::npos) saw_created = true;
    expect(saw_created, "chunk creation reported through the iterator's sink");
  }

  // chunked combo file
  {
    std::vector<std::string> lines;
    Pairs want;
    for (int i = 0; i < 300; ++i) {
      if (i % 50 == 7) { lines.push_back("garbage" + std::to_string(i)); continue; }
      lines.push_back("user" + std::to_string(i) + ":pass" + std::to_string(i));
      want.emplace_back("user" + std::to_string(i), "pass" + std::to_string(i));
    }
    auto cfg = base();
    cfg.combo = write_lines("bigcombo.txt", lines);
    cfg.chunking.large_file_threshold = 1;
    cfg.chunking.chunk_bytes = 128;
    cfg.chunking.temp_root = (g_work / "tmp").string();
    cs::MetricsRegistry metrics;
    cfg.metrics = &metrics;
    Run r = run(cfg);
    expect(r.pairs == want, "chunked combo file in order");
    expect(metrics.snapshot(1.0).skipped_lines == 6, "six malformed combo lines skipped");
  }

  // close semantics
  {
    auto cfg = base();
    cfg.user = user_file;
    cfg.password = pass_file;
    cs::CredentialIterator it(cfg);
    cs::Credential c;
    expect(it.next(c) == cs::PullStatus::Value && c.user == "alice" && c.password == "p1", "first pair");
    std::string err;
    expect(it.close(&err), "close mid-iteration");
    expect(it.close(&err), "close twice");
    expect(it.next(c) == cs::PullStatus::Exhausted, "pull after close reports exhausted");

    cs::CredentialIterator never(cfg);
    expect(never.close() && never.close(), "close before first pull");
  }

  // every ordered pair exactly once for a larger grid
  {
    std::vector<std::string> us, ps;
    for (int i = 0; i < 13; ++i) us.push_back("u" + std::to_string(i));
    for (int i = 0; i < 17; ++i) ps.push_back("p" + std::to_string(i));
    auto cfg = base();
    cfg.user = write_lines("u13.txt", us);
    cfg.password = write_lines("p17.txt", ps);
    Run r = run(cfg);
    std::set<std::pair<std::string, std::string>> uniq(r.pairs.begin(), r.pairs.end());
    expect(r.pairs.size() == 13 * 17 && uniq.size() == r.pairs.size(), "13 x 17 distinct pairs");
    expect(r.pairs == cross(us, ps), "user-major order");
  }

  fs::remove_all(g_work);
  if (failures) { std::cerr << "[FAIL] " << failures << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] credential_iterator\n";
  return 0;
}
