#include "store/file_history.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>

namespace sleep_agent::store {

FileHistoryStore::FileHistoryStore(std::string path) : path_(std::move(path)) {}

const std::string& FileHistoryStore::path() const noexcept { return path_; }

bool FileHistoryStore::save(const model::quick_action& action) {
  std::ofstream output(path_, std::ios::app);
  if (!output.is_open()) {
    std::cerr << "[history] unable to open " << path_ << " for append\n";
    return false;
  }

  output << model::to_json_line(action) << '\n';
  output.flush();
  return output.good();
}

bool FileHistoryStore::load_all(std::vector<model::quick_action>& out) {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return !ec;
  }

  std::ifstream input(path_);
  if (!input.is_open()) {
    std::cerr << "[history] unable to open " << path_ << '\n';
    return false;
  }

  std::size_t skipped = 0;
  std::string line;
  while (std::getline(input, line)) {
    if (line.empty()) {
      continue;
    }
    auto record = model::parse_quick_action(line);
    if (!record.has_value()) {
      ++skipped;
      continue;
    }
    out.push_back(std::move(*record));
  }

  if (skipped > 0) {
    std::cerr << "[history] skipped " << skipped << " malformed record(s) in " << path_ << '\n';
  }
  return !input.bad();
}

}  // namespace sleep_agent::store
