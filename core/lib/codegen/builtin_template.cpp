// authzgen/codegen/builtin_template.cpp - Default client header template
#include <array>
#include <string_view>

#include "authzgen/codegen/code_generator.hpp"

namespace authzgen::codegen
{

namespace
{

constexpr std::string_view k_builtin_template = R"tmpl({{! Typed client header for one authorization schema. }}
// Code generated by authzgen. DO NOT EDIT.
// package: {{package}}
#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {{namespace}}
{

struct ObjectRef
{
  std::string type;
  std::string id;
};

struct SubjectRef
{
  ObjectRef object;
  /// Empty unless the subject is a userset such as `group#member`.
  std::string relation;
};

struct Relationship
{
  ObjectRef resource;
  std::string relation;
  SubjectRef subject;
};

inline bool operator==(const ObjectRef & a, const ObjectRef & b)
{
  return a.type == b.type && a.id == b.id;
}

inline bool operator==(const SubjectRef & a, const SubjectRef & b)
{
  return a.object == b.object && a.relation == b.relation;
}

/// Transport used by the generated accessors.
class Client
{
public:
  virtual ~Client() = default;

  virtual void write_relationship(const Relationship & relationship) = 0;
  virtual void delete_relationship(const Relationship & relationship) = 0;
  virtual std::vector<SubjectRef> read_subjects(
    const ObjectRef & resource, std::string_view relation) = 0;
  virtual bool check_permission(
    const ObjectRef & resource, std::string_view permission, const SubjectRef & subject) = 0;
  /// Ids of resources of `resource_type` on which `subject` has `permission`.
  virtual std::vector<std::string> lookup_resources(
    std::string_view resource_type, std::string_view permission, const SubjectRef & subject) = 0;
};
{{#each definitions}}

/// {{full_type}}
class {{definition | camelcase}}
{
public:
  static constexpr std::string_view k_type = "{{full_type}}";

  explicit {{definition | camelcase}}(std::string id) : id_(std::move(id)) {}

  [[nodiscard]] const std::string & id() const { return id_; }
  [[nodiscard]] ObjectRef ref() const { return ObjectRef{std::string(k_type), id_}; }
  [[nodiscard]] SubjectRef as_subject() const { return SubjectRef{ref(), std::string()}; }
{{#each relations}}

  // relation {{relation}}: {{#each types}}{{subject}}{{#unless @last}} | {{/unless}}{{/each}}
  static constexpr std::string_view k_{{relation}}_subject_types[] = {
{{#each types}}
    "{{subject}}",
{{/each}}
  };

  void Add{{relation | camelcase}}(Client & client, const SubjectRef & subject) const
  {
    client.write_relationship(Relationship{ref(), "{{relation}}", subject});
  }

  void Remove{{relation | camelcase}}(Client & client, const SubjectRef & subject) const
  {
    client.delete_relationship(Relationship{ref(), "{{relation}}", subject});
  }

  [[nodiscard]] std::vector<SubjectRef> Read{{relation | camelcase}}(Client & client) const
  {
    return client.read_subjects(ref(), "{{relation}}");
  }

  [[nodiscard]] bool Has{{relation | camelcase}}(Client & client, const SubjectRef & subject) const
  {
    const auto subjects = client.read_subjects(ref(), "{{relation}}");
    return std::find(subjects.begin(), subjects.end(), subject) != subjects.end();
  }
{{#each types}}

  static SubjectRef {{relation | camelcase}}From{{subject | extract_type | camelcase}}{{subject_relation | camelcase}}(std::string id)
  {
    return SubjectRef{ObjectRef{"{{object_type}}", std::move(id)}, "{{subject_relation}}"};
  }
{{/each}}
{{/each}}
{{#each permissions}}

  // permission {{permission}} = {{expression}}
  [[nodiscard]] bool Check{{permission | camelcase}}(Client & client, const SubjectRef & subject) const
  {
    return client.check_permission(ref(), "{{permission}}", subject);
  }

  [[nodiscard]] static std::vector<{{definition | camelcase}}> Lookup{{permission | camelcase}}(
    Client & client, const SubjectRef & subject)
  {
    std::vector<{{definition | camelcase}}> out;
    for (auto & id : client.lookup_resources(k_type, "{{permission}}", subject)) {
      out.emplace_back(std::move(id));
    }
    return out;
  }
{{/each}}

private:
  std::string id_;
};
{{/each}}

}  // namespace {{namespace}}
)tmpl";

constexpr std::array<std::string_view, 4> k_builtin_types = {
  "ObjectRef", "SubjectRef", "Relationship", "Client"};

}  // namespace

std::string_view builtin_template() { return k_builtin_template; }

gsl::span<const std::string_view> builtin_template_types() { return k_builtin_types; }

}  // namespace authzgen::codegen
