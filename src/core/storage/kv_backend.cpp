#include "core/storage/kv_backend.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace veg21 {

FileKeyValueBackend::FileKeyValueBackend(std::string data_dir) : data_dir_(std::move(data_dir)) {}

std::string FileKeyValueBackend::path_for(std::string_view key) const {
  return (std::filesystem::path(data_dir_) / (std::string{key} + ".dat")).string();
}

std::optional<std::string> FileKeyValueBackend::get(std::string_view key) const {
  std::ifstream in(path_for(key), std::ios::in | std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  return std::string{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

Result FileKeyValueBackend::put(std::string_view key, std::string_view value) {
  std::error_code ec;
  std::filesystem::create_directories(data_dir_, ec);
  if (ec) {
    return Result::failure(ErrorKind::PersistenceFailure,
                           "Unable to create data directory " + data_dir_ + ": " + ec.message());
  }

  const std::string final_path = path_for(key);
  const std::string temp_path = final_path + ".tmp";
  {
    std::ofstream out(temp_path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out) {
      return Result::failure(ErrorKind::PersistenceFailure, "Unable to open " + temp_path);
    }
    out.write(value.data(), static_cast<std::streamsize>(value.size()));
    out.flush();
    if (!out) {
      return Result::failure(ErrorKind::PersistenceFailure, "Unable to write " + temp_path);
    }
  }

  std::filesystem::rename(temp_path, final_path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    return Result::failure(ErrorKind::PersistenceFailure,
                           "Unable to replace " + final_path + ": " + ec.message());
  }
  return Result::success();
}

Result FileKeyValueBackend::erase(std::string_view key) {
  std::error_code ec;
  std::filesystem::remove(path_for(key), ec);
  if (ec) {
    return Result::failure(ErrorKind::PersistenceFailure,
                           "Unable to remove " + path_for(key) + ": " + ec.message());
  }
  return Result::success();
}

std::optional<std::string> MemoryKeyValueBackend::get(std::string_view key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = values_.find(key);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

Result MemoryKeyValueBackend::put(std::string_view key, std::string_view value) {
  std::lock_guard<std::mutex> lock(mutex_);
  values_.insert_or_assign(std::string{key}, std::string{value});
  return Result::success();
}

Result MemoryKeyValueBackend::erase(std::string_view key) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = values_.find(key);
  if (it != values_.end()) {
    values_.erase(it);
  }
  return Result::success();
}

std::shared_ptr<IKeyValueBackend> make_file_backend(std::string data_dir) {
  return std::make_shared<FileKeyValueBackend>(std::move(data_dir));
}

}  // namespace veg21
