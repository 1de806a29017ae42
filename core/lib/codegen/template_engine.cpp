// authzgen/codegen/template_engine.cpp
#include "authzgen/codegen/template_engine.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <optional>
#include <utility>

namespace authzgen::codegen
{

TemplateError::TemplateError(const std::string & message, size_t line)
: std::runtime_error(fmt::format("template line {}: {}", line, message)),
  message_(message),
  line_(line)
{
}

namespace
{

bool is_blank(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

std::string_view trim(std::string_view s)
{
  while (!s.empty() && is_blank(s.front())) {
    s.remove_prefix(1);
  }
  while (!s.empty() && is_blank(s.back())) {
    s.remove_suffix(1);
  }
  return s;
}

size_t count_newlines(std::string_view s, size_t from, size_t to)
{
  return static_cast<size_t>(std::count(s.begin() + from, s.begin() + to, '\n'));
}

bool is_block_tag(std::string_view inner)
{
  return inner.front() == '#' || inner.front() == '/' || inner.front() == '!' || inner == "else";
}

std::string_view block_name(TemplateNodeKind kind)
{
  switch (kind) {
    case TemplateNodeKind::Each:
      return "each";
    case TemplateNodeKind::If:
      return "if";
    case TemplateNodeKind::Unless:
      return "unless";
    case TemplateNodeKind::Text:
    case TemplateNodeKind::Value:
      break;
  }
  return "";
}

// ----------------------------------------------------------------------------
// Compilation
// ----------------------------------------------------------------------------

class TemplateParser
{
public:
  TemplateParser(std::string_view src, const HelperTable & helpers) : src_(src), helpers_(helpers)
  {
  }

  std::vector<TemplateNode> parse()
  {
    size_t pos = 0;
    size_t line = 1;
    std::string pending;

    while (pos < src_.size()) {
      const size_t open = src_.find("{{", pos);
      if (open == std::string_view::npos) {
        pending += src_.substr(pos);
        break;
      }
      const size_t tag_line = line + count_newlines(src_, pos, open);
      const size_t close = src_.find("}}", open + 2);
      if (close == std::string_view::npos) {
        throw TemplateError("unterminated tag, missing '}}'", tag_line);
      }
      const std::string_view inner = trim(src_.substr(open + 2, close - open - 2));
      if (inner.empty()) {
        throw TemplateError("empty tag", tag_line);
      }

      pending += src_.substr(pos, open - pos);
      size_t tag_end = close + 2;
      if (is_block_tag(inner)) {
        if (const auto resume = standalone_end(open, tag_end)) {
          while (!pending.empty() && (pending.back() == ' ' || pending.back() == '\t')) {
            pending.pop_back();
          }
          tag_end = *resume;
        }
      }

      flush_text(pending, line);
      handle_tag(inner, tag_line);

      line = tag_line + count_newlines(src_, open, tag_end);
      pos = tag_end;
    }
    flush_text(pending, line);

    if (!open_.empty()) {
      const auto & block = open_.back();
      throw TemplateError(
        fmt::format("unclosed '#{}' block", block_name(block.kind)), block.line);
    }
    return std::move(root_);
  }

private:
  // End of the line when the tag at [begin, end) is alone on it, else nullopt.
  std::optional<size_t> standalone_end(size_t begin, size_t end) const
  {
    const size_t line_start = src_.rfind('\n', begin == 0 ? 0 : begin - 1);
    size_t i = (line_start == std::string_view::npos || begin == 0) ? 0 : line_start + 1;
    for (; i < begin; ++i) {
      if (src_[i] != ' ' && src_[i] != '\t') {
        return std::nullopt;
      }
    }
    size_t j = end;
    while (j < src_.size() && (src_[j] == ' ' || src_[j] == '\t' || src_[j] == '\r')) {
      ++j;
    }
    if (j == src_.size()) {
      return j;
    }
    if (src_[j] == '\n') {
      return j + 1;
    }
    return std::nullopt;
  }

  std::vector<TemplateNode> & target()
  {
    if (open_.empty()) {
      return root_;
    }
    auto & block = open_.back();
    return block.has_else ? block.else_body : block.body;
  }

  void flush_text(std::string & pending, size_t line)
  {
    if (pending.empty()) {
      return;
    }
    TemplateNode node;
    node.kind = TemplateNodeKind::Text;
    node.line = line;
    node.text = std::move(pending);
    target().push_back(std::move(node));
    pending.clear();
  }

  void handle_tag(std::string_view inner, size_t line)
  {
    switch (inner.front()) {
      case '!':
        return;
      case '#':
        open_block(trim(inner.substr(1)), line);
        return;
      case '/':
        close_block(trim(inner.substr(1)), line);
        return;
      default:
        break;
    }

    if (inner == "else") {
      if (
        open_.empty() || (open_.back().kind != TemplateNodeKind::If &&
                          open_.back().kind != TemplateNodeKind::Unless)) {
        throw TemplateError("'else' outside of '#if' or '#unless'", line);
      }
      if (open_.back().has_else) {
        throw TemplateError("duplicate 'else' in block", line);
      }
      open_.back().has_else = true;
      return;
    }

    target().push_back(parse_value(inner, line));
  }

  void open_block(std::string_view rest, size_t line)
  {
    const size_t space = rest.find_first_of(" \t");
    const std::string_view name = rest.substr(0, space);
    const std::string_view arg =
      space == std::string_view::npos ? std::string_view{} : trim(rest.substr(space));

    TemplateNode node;
    node.line = line;
    if (name == "each") {
      node.kind = TemplateNodeKind::Each;
    } else if (name == "if") {
      node.kind = TemplateNodeKind::If;
    } else if (name == "unless") {
      node.kind = TemplateNodeKind::Unless;
    } else {
      throw TemplateError(fmt::format("unknown block '#{}'", name), line);
    }
    if (arg.empty()) {
      throw TemplateError(fmt::format("'#{}' requires a path", name), line);
    }
    if (arg.find_first_of(" \t|\"") != std::string_view::npos) {
      throw TemplateError(fmt::format("malformed path '{}' in '#{}'", arg, name), line);
    }
    node.text = std::string(arg);
    open_.push_back(std::move(node));
  }

  void close_block(std::string_view name, size_t line)
  {
    if (open_.empty()) {
      throw TemplateError(fmt::format("'/{}' without an open block", name), line);
    }
    if (name != block_name(open_.back().kind)) {
      throw TemplateError(
        fmt::format(
          "'/{}' does not close '#{}' opened at line {}", name, block_name(open_.back().kind),
          open_.back().line),
        line);
    }
    TemplateNode node = std::move(open_.back());
    open_.pop_back();
    target().push_back(std::move(node));
  }

  TemplateNode parse_value(std::string_view inner, size_t line)
  {
    TemplateNode node;
    node.kind = TemplateNodeKind::Value;
    node.line = line;

    std::string_view rest;
    if (inner.front() == '"') {
      const size_t end_quote = inner.find('"', 1);
      if (end_quote == std::string_view::npos) {
        throw TemplateError("unterminated string literal in tag", line);
      }
      node.text = std::string(inner.substr(1, end_quote - 1));
      node.is_literal = true;
      rest = trim(inner.substr(end_quote + 1));
      if (!rest.empty() && rest.front() != '|') {
        throw TemplateError(fmt::format("malformed tag '{}'", inner), line);
      }
    } else {
      const size_t bar = inner.find('|');
      const std::string_view path = trim(inner.substr(0, bar));
      if (path.empty() || path.find_first_of(" \t\"") != std::string_view::npos) {
        throw TemplateError(fmt::format("malformed tag '{}'", inner), line);
      }
      node.text = std::string(path);
      rest = bar == std::string_view::npos ? std::string_view{} : inner.substr(bar);
    }

    while (!rest.empty()) {
      rest.remove_prefix(1);  // '|'
      const size_t bar = rest.find('|');
      const std::string_view helper = trim(rest.substr(0, bar));
      if (helper.empty()) {
        throw TemplateError("empty helper name after '|'", line);
      }
      if (helpers_.find(helper) == helpers_.end()) {
        throw TemplateError(fmt::format("unknown helper '{}'", helper), line);
      }
      node.helpers.emplace_back(helper);
      rest = bar == std::string_view::npos ? std::string_view{} : rest.substr(bar);
    }
    return node;
  }

  std::string_view src_;
  const HelperTable & helpers_;
  std::vector<TemplateNode> root_;
  std::vector<TemplateNode> open_;
};

// ----------------------------------------------------------------------------
// Rendering
// ----------------------------------------------------------------------------

class Renderer
{
public:
  Renderer(const HelperTable & helpers, const nlohmann::json & root) : helpers_(helpers)
  {
    frames_.push_back(Frame{&root, false, 0, 0});
  }

  void render(const std::vector<TemplateNode> & nodes, std::string & out)
  {
    for (const auto & node : nodes) {
      switch (node.kind) {
        case TemplateNodeKind::Text:
          out += node.text;
          break;
        case TemplateNodeKind::Value:
          out += render_value(node);
          break;
        case TemplateNodeKind::Each:
          render_each(node, out);
          break;
        case TemplateNodeKind::If:
          render(is_truthy(node) ? node.body : node.else_body, out);
          break;
        case TemplateNodeKind::Unless:
          render(is_truthy(node) ? node.else_body : node.body, out);
          break;
      }
    }
  }

private:
  struct Frame
  {
    const nlohmann::json * value;
    bool is_loop;
    size_t index;
    size_t size;
  };

  std::optional<nlohmann::json> resolve(std::string_view path) const
  {
    if (path == "." || path == "this") {
      return *frames_.back().value;
    }

    if (path.front() == '@') {
      const auto loop = std::find_if(
        frames_.rbegin(), frames_.rend(), [](const Frame & f) { return f.is_loop; });
      if (loop == frames_.rend()) {
        return std::nullopt;
      }
      if (path == "@index") {
        return nlohmann::json(loop->index);
      }
      if (path == "@first") {
        return nlohmann::json(loop->index == 0);
      }
      if (path == "@last") {
        return nlohmann::json(loop->index + 1 == loop->size);
      }
      return std::nullopt;
    }

    size_t dot = path.find('.');
    std::string_view head = path.substr(0, dot);
    const nlohmann::json * current = nullptr;

    if (head == "this") {
      current = frames_.back().value;
    } else {
      for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
        const auto & scope = *it->value;
        if (scope.is_object()) {
          if (const auto found = scope.find(std::string(head)); found != scope.end()) {
            current = &*found;
            break;
          }
        }
      }
    }
    if (current == nullptr) {
      return std::nullopt;
    }

    while (dot != std::string_view::npos) {
      path.remove_prefix(dot + 1);
      dot = path.find('.');
      const std::string_view key = path.substr(0, dot);
      if (!current->is_object()) {
        return std::nullopt;
      }
      const auto found = current->find(std::string(key));
      if (found == current->end()) {
        return std::nullopt;
      }
      current = &*found;
    }
    return *current;
  }

  static std::string to_text(const nlohmann::json & value, const TemplateNode & node)
  {
    switch (value.type()) {
      case nlohmann::json::value_t::string:
        return value.get<std::string>();
      case nlohmann::json::value_t::boolean:
        return value.get<bool>() ? "true" : "false";
      case nlohmann::json::value_t::number_integer:
      case nlohmann::json::value_t::number_unsigned:
      case nlohmann::json::value_t::number_float:
        return value.dump();
      case nlohmann::json::value_t::null:
      case nlohmann::json::value_t::discarded:
        return "";
      case nlohmann::json::value_t::object:
      case nlohmann::json::value_t::array:
      case nlohmann::json::value_t::binary:
        break;
    }
    throw TemplateError(
      fmt::format("'{}' is {} and cannot be rendered as text", node.text, value.type_name()),
      node.line);
  }

  std::string render_value(const TemplateNode & node) const
  {
    std::string text;
    if (node.is_literal) {
      text = node.text;
    } else {
      const auto value = resolve(node.text);
      if (!value) {
        throw TemplateError(fmt::format("undefined variable '{}'", node.text), node.line);
      }
      text = to_text(*value, node);
    }
    for (const auto & name : node.helpers) {
      text = helpers_.find(name)->second(text);
    }
    return text;
  }

  // Missing names are falsy in conditionals.
  bool is_truthy(const TemplateNode & node) const
  {
    const auto value = resolve(node.text);
    if (!value) {
      return false;
    }
    switch (value->type()) {
      case nlohmann::json::value_t::null:
      case nlohmann::json::value_t::discarded:
        return false;
      case nlohmann::json::value_t::boolean:
        return value->get<bool>();
      case nlohmann::json::value_t::number_integer:
      case nlohmann::json::value_t::number_unsigned:
      case nlohmann::json::value_t::number_float:
        return value->get<double>() != 0.0;
      case nlohmann::json::value_t::string:
        return !value->get_ref<const std::string &>().empty();
      case nlohmann::json::value_t::array:
      case nlohmann::json::value_t::object:
      case nlohmann::json::value_t::binary:
        return !value->empty();
    }
    return false;
  }

  void render_each(const TemplateNode & node, std::string & out)
  {
    const auto items = resolve(node.text);
    if (!items) {
      throw TemplateError(fmt::format("undefined variable '{}'", node.text), node.line);
    }
    if (!items->is_array()) {
      throw TemplateError(
        fmt::format("'#each' expects an array, '{}' is {}", node.text, items->type_name()),
        node.line);
    }
    for (size_t i = 0; i < items->size(); ++i) {
      frames_.push_back(Frame{&(*items)[i], true, i, items->size()});
      render(node.body, out);
      frames_.pop_back();
    }
  }

  const HelperTable & helpers_;
  std::vector<Frame> frames_;
};

}  // namespace

Template Template::compile(std::string_view source, HelperTable helpers)
{
  Template tmpl;
  tmpl.helpers_ = std::move(helpers);
  tmpl.nodes_ = TemplateParser(source, tmpl.helpers_).parse();
  return tmpl;
}

std::string Template::render(const nlohmann::json & data) const
{
  std::string out;
  Renderer(helpers_, data).render(nodes_, out);
  return out;
}

}  // namespace authzgen::codegen
