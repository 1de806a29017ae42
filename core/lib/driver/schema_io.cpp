// authzgen/driver/schema_io.cpp
#include "authzgen/driver/schema_io.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace authzgen
{

namespace fs = std::filesystem;

namespace
{

std::vector<fs::path> schema_files_in(const fs::path & dir)
{
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    throw IoError(fmt::format("cannot list directory '{}': {}", dir.string(), ec.message()));
  }

  std::vector<fs::path> files;
  for (const auto & entry : it) {
    if (entry.is_regular_file(ec) && entry.path().extension() == k_schema_file_extension) {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

}  // namespace

std::string read_text_file(const fs::path & path)
{
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw IoError(fmt::format("cannot open '{}' for reading", path.string()));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    throw IoError(fmt::format("failed to read '{}'", path.string()));
  }
  return buffer.str();
}

SchemaInput read_schema_input(const fs::path & path)
{
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    throw IoError(fmt::format("schema path not found: '{}'", path.string()));
  }

  SchemaInput input;
  if (!fs::is_directory(path, ec)) {
    input.files.push_back(SourceText{path, read_text_file(path)});
    return input;
  }

  const std::vector<fs::path> files = schema_files_in(path);
  if (files.empty()) {
    throw IoError(fmt::format(
      "no '*{}' schema files in directory '{}'", k_schema_file_extension, path.string()));
  }
  for (const auto & file : files) {
    input.files.push_back(SourceText{file, read_text_file(file)});
  }
  return input;
}

void FileSystemWriter::write(const fs::path & path, std::string_view content)
{
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      throw IoError(fmt::format(
        "cannot create directory '{}': {}", path.parent_path().string(), ec.message()));
    }
  }

  fs::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw IoError(fmt::format("cannot open '{}' for writing", tmp.string()));
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
      fs::remove(tmp, ec);
      throw IoError(fmt::format("failed to write '{}'", tmp.string()));
    }
  }

  fs::rename(tmp, path, ec);
  if (ec) {
    const std::string reason = ec.message();
    fs::remove(tmp, ec);
    throw IoError(
      fmt::format("cannot move '{}' to '{}': {}", tmp.string(), path.string(), reason));
  }
}

void MemoryWriter::write(const fs::path & path, std::string_view content)
{
  files_[path] = std::string(content);
}

}  // namespace authzgen
