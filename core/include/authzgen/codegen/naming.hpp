// authzgen/codegen/naming.hpp - Identifier helpers shared by the generator and templates
#pragma once

#include <string>
#include <string_view>

namespace authzgen::codegen
{

/**
 * Split on '-', '_' and ' ', uppercase the first letter of each word and
 * lowercase the rest, then concatenate.
 *
 *   "document_viewer" -> "DocumentViewer"
 *   "can-EDIT"        -> "CanEdit"
 */
[[nodiscard]] std::string to_pascal_case(std::string_view s);

[[nodiscard]] std::string to_lower(std::string_view s);

/// `prefix/Name#frag` -> `Name`; `user` -> `user`.
[[nodiscard]] std::string extract_type(std::string_view subject);

/// `prefix/Name#frag` -> `prefix/Name`.
[[nodiscard]] std::string object_type(std::string_view subject);

/// `group#member` -> `member`; no fragment -> "".
[[nodiscard]] std::string subject_relation(std::string_view subject);

/// `[A-Za-z_][A-Za-z0-9_]*`. Packages must match since they name the output file.
[[nodiscard]] bool is_identifier(std::string_view s);

/// Non-empty and free of path separators.
[[nodiscard]] bool is_file_extension(std::string_view s);

/// True for C++ keywords that cannot be used as plain identifiers.
[[nodiscard]] bool is_cpp_keyword(std::string_view s);

/**
 * A usable C++ identifier: characters outside [A-Za-z0-9_] become '_',
 * a leading digit gets a '_' prefix, keywords get a '_' suffix.
 */
[[nodiscard]] std::string to_cpp_identifier(std::string_view s);

}  // namespace authzgen::codegen
