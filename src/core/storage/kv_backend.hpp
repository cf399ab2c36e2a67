#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "core/model/types.hpp"

namespace veg21 {

class IKeyValueBackend {
public:
  virtual ~IKeyValueBackend() = default;

  // nullopt when the key has never been written or was erased.
  [[nodiscard]] virtual std::optional<std::string> get(std::string_view key) const = 0;
  virtual Result put(std::string_view key, std::string_view value) = 0;
  virtual Result erase(std::string_view key) = 0;
};

// One file per key under a data directory. Writes go to "<key>.dat.tmp"
// first and are renamed over "<key>.dat".
class FileKeyValueBackend final : public IKeyValueBackend {
public:
  explicit FileKeyValueBackend(std::string data_dir);

  [[nodiscard]] std::optional<std::string> get(std::string_view key) const override;
  Result put(std::string_view key, std::string_view value) override;
  Result erase(std::string_view key) override;

  [[nodiscard]] const std::string& data_dir() const { return data_dir_; }

private:
  [[nodiscard]] std::string path_for(std::string_view key) const;

  std::string data_dir_;
};

class MemoryKeyValueBackend final : public IKeyValueBackend {
public:
  [[nodiscard]] std::optional<std::string> get(std::string_view key) const override;
  Result put(std::string_view key, std::string_view value) override;
  Result erase(std::string_view key) override;

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string, std::less<>> values_;
};

std::shared_ptr<IKeyValueBackend> make_file_backend(std::string data_dir);

}  // namespace veg21
