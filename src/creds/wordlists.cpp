#include "credstream/wordlists.hpp"

#include <simdjson.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cs {

void StaticWordlistProvider::add(std::string version, std::string service, WordlistEntry entry) {
  table_[{std::move(version), std::move(service)}] = std::move(entry);
}

const WordlistEntry* StaticWordlistProvider::find(std::string_view version,
                                                  std::string_view service) const {
  auto it = table_.find({std::string(version), std::string(service)});
  if (it != table_.end()) return &it->second;
  it = table_.find({std::string("default"), std::string(service)});
  if (it != table_.end()) return &it->second;
  return nullptr;
}

std::vector<std::string> StaticWordlistProvider::users(std::string_view version,
                                                       std::string_view service) const {
  const WordlistEntry* e = find(version, service);
  return e ? e->users : std::vector<std::string>{};
}

std::vector<std::string> StaticWordlistProvider::passwords(std::string_view version,
                                                           std::string_view service) const {
  const WordlistEntry* e = find(version, service);
  return e ? e->passwords : std::vector<std::string>{};
}

static std::vector<std::string> string_array(simdjson::ondemand::value v) {
  std::vector<std::string> out;
  simdjson::ondemand::array arr = v.get_array();
  for (auto item : arr) {
    std::string_view s = item.get_string();
    out.emplace_back(s);
  }
  return out;
}

static bool parse_wordlists(StaticWordlistProvider& into,
                            simdjson::padded_string& json,
                            std::string* err_out) {
  thread_local simdjson::ondemand::parser parser;
  try {
    auto doc = parser.iterate(json);
    simdjson::ondemand::object root = doc.get_object();
    for (auto vfield : root) {
      std::string version(std::string_view(vfield.unescaped_key()));
      simdjson::ondemand::object services = vfield.value().get_object();
      for (auto sfield : services) {
        std::string service(std::string_view(sfield.unescaped_key()));
        WordlistEntry entry;
        simdjson::ondemand::object lists = sfield.value().get_object();
        for (auto lfield : lists) {
          std::string_view key = lfield.unescaped_key();
          if (key == "users")          entry.users = string_array(lfield.value());
          else if (key == "passwords") entry.passwords = string_array(lfield.value());
        }
        into.add(version, std::move(service), std::move(entry));
      }
    }
  } catch (const simdjson::simdjson_error& e) {
    if (err_out) *err_out = std::string("wordlist json: ") + e.what();
    return false;
  }
  return true;
}

bool JsonWordlistProvider::load_file(const std::string& path, std::string* err_out) {
  simdjson::padded_string json;
  auto err = simdjson::padded_string::load(path).get(json);
  if (err) {
    if (err_out) *err_out = "failed to load " + path + ": " + simdjson::error_message(err);
    return false;
  }
  return parse_wordlists(*this, json, err_out);
}

bool JsonWordlistProvider::load_string(std::string_view json, std::string* err_out) {
  simdjson::padded_string padded(json);
  return parse_wordlists(*this, padded, err_out);
}

}
