#pragma once
#include "credstream/credential_iterator.hpp"
#include "credstream/line_reader.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace cs {

// Lines in `path` under the same discipline the iterator reads with.
std::optional<std::uint64_t> count_lines(const std::string& path,
                                         const LineReader::Config& cfg,
                                         std::string* err_out = nullptr);

// Lines of `path` for which `keep` returns true.
std::optional<std::uint64_t> count_matching_lines(const std::string& path,
                                                  const LineReader::Config& cfg,
                                                  const std::function<bool(std::string_view)>& keep,
                                                  std::string* err_out = nullptr);

// Number of pairs a full iteration over `cfg` produces, computed without
// keeping any line content. Read-only; safe to run alongside an iterator
// over the same files. nullopt on I/O failure.
std::optional<std::uint64_t> count_credentials(const CredentialIterator::Config& cfg,
                                               std::string* err_out = nullptr);

}
