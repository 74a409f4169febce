#pragma once
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cs {

// Target descriptor; only `service` matters for wordlist lookup.
struct Host {
  std::string address;
  int port = 0;
  std::string service;
};

// Built-in candidates keyed on (wordlist version, service).
class WordlistProvider {
public:
  virtual ~WordlistProvider() = default;
  virtual std::vector<std::string> users(std::string_view version,
                                         std::string_view service) const = 0;
  virtual std::vector<std::string> passwords(std::string_view version,
                                             std::string_view service) const = 0;
};

struct WordlistEntry {
  std::vector<std::string> users;
  std::vector<std::string> passwords;
};

// In-memory table. Unknown versions fall back to "default".
class StaticWordlistProvider : public WordlistProvider {
public:
  void add(std::string version, std::string service, WordlistEntry entry);
  bool empty() const noexcept { return table_.empty(); }

  std::vector<std::string> users(std::string_view version,
                                 std::string_view service) const override;
  std::vector<std::string> passwords(std::string_view version,
                                     std::string_view service) const override;

private:
  const WordlistEntry* find(std::string_view version, std::string_view service) const;
  std::map<std::pair<std::string, std::string>, WordlistEntry> table_;
};

// Loads { "<version>": { "<service>": { "users": [...], "passwords": [...] } } }.
class JsonWordlistProvider : public StaticWordlistProvider {
public:
  bool load_file(const std::string& path, std::string* err_out = nullptr);
  bool load_string(std::string_view json, std::string* err_out = nullptr);
};

}
