// authzgen/driver/schema_io.hpp - Schema input reading and generated output writing
#pragma once

#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "authzgen/basic/source_manager.hpp"

namespace authzgen
{

/// Filesystem failure. The message names the path and the operation.
class IoError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

// ============================================================================
// Input
// ============================================================================

struct SchemaInput
{
  /// Files read, in order. Together they form one schema document.
  std::vector<SourceText> files;
};

/// @throws IoError if the file cannot be opened or read
[[nodiscard]] std::string read_text_file(const std::filesystem::path & path);

/// Extension of schema files picked up from a directory input.
inline constexpr std::string_view k_schema_file_extension = ".zed";

/**
 * Read a schema document.
 *
 * A file path reads that file. A directory reads every regular `*.zed` file
 * directly inside it, in lexicographic order. Each file keeps its own path
 * so positions stay file-relative.
 *
 * @throws IoError if the path does not exist, cannot be read, or is a
 *         directory without schema files
 */
[[nodiscard]] SchemaInput read_schema_input(const std::filesystem::path & path);

// ============================================================================
// Output
// ============================================================================

class OutputWriter
{
public:
  virtual ~OutputWriter() = default;

  /// @throws IoError
  virtual void write(const std::filesystem::path & path, std::string_view content) = 0;
};

/**
 * Writes to disk. Parent directories are created; content goes to
 * `<path>.tmp` first and is renamed into place.
 */
class FileSystemWriter : public OutputWriter
{
public:
  void write(const std::filesystem::path & path, std::string_view content) override;
};

/// Keeps written files in memory, keyed by path.
class MemoryWriter : public OutputWriter
{
public:
  void write(const std::filesystem::path & path, std::string_view content) override;

  [[nodiscard]] const std::map<std::filesystem::path, std::string> & files() const noexcept
  {
    return files_;
  }

private:
  std::map<std::filesystem::path, std::string> files_;
};

}  // namespace authzgen
