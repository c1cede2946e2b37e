#include "sensors/csv_feed.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <utility>

namespace sleep_agent::sensors {
namespace {

const char* skip_space(const char* cursor) noexcept {
  while (*cursor != '\0' && std::isspace(static_cast<unsigned char>(*cursor)) != 0) {
    ++cursor;
  }
  return cursor;
}

}  // namespace

CsvFeed::CsvFeed(std::string path) : path_(std::move(path)), owns_file_(true) {
  file_ = std::fopen(path_.c_str(), "r");
}

CsvFeed::CsvFeed(std::FILE* file, const bool owns_file) : file_(file), owns_file_(owns_file) {}

CsvFeed::~CsvFeed() {
  if (owns_file_ && file_ != nullptr) {
    std::fclose(file_);
  }
  file_ = nullptr;
}

const std::string& CsvFeed::path() const noexcept { return path_; }

bool CsvFeed::ensure_open() noexcept {
  if (file_ != nullptr) {
    return true;
  }
  if (path_.empty()) {
    return false;
  }
  file_ = std::fopen(path_.c_str(), "r");
  return file_ != nullptr;
}

bool CsvFeed::next(std::vector<double>& fields) noexcept {
  if (!ensure_open()) {
    return false;
  }

  char buffer[kReadBufferSize]{};
  while (true) {
    const long line_start = std::ftell(file_);
    if (std::fgets(buffer, static_cast<int>(sizeof(buffer)), file_) == nullptr) {
      std::clearerr(file_);
      return false;
    }

    const std::size_t length = std::strlen(buffer);
    if (length == 0U || buffer[length - 1] != '\n') {
      if (std::feof(file_) != 0 && line_start >= 0) {
        std::clearerr(file_);
        std::fseek(file_, line_start, SEEK_SET);
        return false;
      }
    }

    const char* content = skip_space(buffer);
    if (*content == '\0' || *content == '#') {
      continue;
    }

    return parse_fields(content, fields);
  }
}

bool CsvFeed::parse_fields(const char* line, std::vector<double>& fields) noexcept {
  fields.clear();
  const char* cursor = line;
  while (true) {
    cursor = skip_space(cursor);
    char* end = nullptr;
    errno = 0;
    const double value = std::strtod(cursor, &end);
    if (errno != 0 || end == cursor || !std::isfinite(value)) {
      fields.clear();
      return false;
    }
    fields.push_back(value);

    cursor = skip_space(end);
    if (*cursor == ',') {
      ++cursor;
      continue;
    }
    if (*cursor == '\0') {
      return true;
    }
    fields.clear();
    return false;
  }
}

}  // namespace sleep_agent::sensors
