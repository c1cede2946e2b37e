#pragma once

#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

namespace sleep_agent::sensors {

// Tails a comma-separated numeric feed one record per call. A writer may keep
// appending; a partially written last line is left for the next call.
class CsvFeed {
 public:
  explicit CsvFeed(std::string path);
  CsvFeed(std::FILE* file, bool owns_file = false);
  ~CsvFeed();

  CsvFeed(const CsvFeed&) = delete;
  CsvFeed& operator=(const CsvFeed&) = delete;
  CsvFeed(CsvFeed&&) = delete;
  CsvFeed& operator=(CsvFeed&&) = delete;

  // False when no complete record is available or the next record does not
  // parse; a bad record is consumed so the feed can move past it.
  bool next(std::vector<double>& fields) noexcept;

  [[nodiscard]] const std::string& path() const noexcept;

 private:
  static constexpr std::size_t kReadBufferSize = 512;

  bool ensure_open() noexcept;
  static bool parse_fields(const char* line, std::vector<double>& fields) noexcept;

  std::string path_{};
  std::FILE* file_{nullptr};
  bool owns_file_{true};
};

}  // namespace sleep_agent::sensors
