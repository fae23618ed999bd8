// rs_outline/outline/json_serializer.cpp - JSON serialization implementation
//
#include "rs_outline/outline/json_serializer.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace rs_outline
{
namespace
{

using json = nlohmann::ordered_json;

// ============================================================================
// Writing
// ============================================================================

json j_point(HumanPoint p) { return json::array({p.line, p.column}); }

json j_location(const HumanSpan & s)
{
  return json{{"start", j_point(s.start)}, {"end", j_point(s.end)}};
}

json j_bytes(const ByteSpan & s) { return json::array({s.start, s.end}); }

json j_children(const std::vector<OutlineNode> & children)
{
  json arr = json::array();
  for (const auto & c : children) {
    arr.push_back(to_json(c));
  }
  return arr;
}

// ============================================================================
// Reading
// ============================================================================

const json & require(const json & j, const char * key)
{
  if (!j.is_object()) {
    throw OutlineFormatError(std::string("expected an object holding '") + key + "'");
  }
  const auto it = j.find(key);
  if (it == j.end()) {
    throw OutlineFormatError(std::string("missing field '") + key + "'");
  }
  return *it;
}

std::string read_string(const json & j, const char * key)
{
  const json & v = require(j, key);
  if (!v.is_string()) {
    throw OutlineFormatError(std::string("field '") + key + "' must be a string");
  }
  return v.get<std::string>();
}

int32_t read_int(const json & v, const char * key)
{
  if (!v.is_number_integer()) {
    throw OutlineFormatError(std::string("field '") + key + "' must hold integers");
  }
  const auto n = v.get<int64_t>();
  if (n < std::numeric_limits<int32_t>::min() || n > std::numeric_limits<int32_t>::max()) {
    throw OutlineFormatError(std::string("field '") + key + "' is out of range");
  }
  return static_cast<int32_t>(n);
}

std::pair<int32_t, int32_t> read_pair(const json & v, const char * key)
{
  if (!v.is_array() || v.size() != 2) {
    throw OutlineFormatError(std::string("field '") + key + "' must be a two-element array");
  }
  return {read_int(v[0], key), read_int(v[1], key)};
}

ByteSpan read_bytes(const json & j, const char * key)
{
  const auto [start, end] = read_pair(require(j, key), key);
  return {start, end};
}

HumanSpan read_location(const json & j, const char * key)
{
  const json & loc = require(j, key);
  const auto [sl, sc] = read_pair(require(loc, "start"), "start");
  const auto [el, ec] = read_pair(require(loc, "end"), "end");
  return {{sl, sc}, {el, ec}};
}

std::vector<OutlineNode> read_children(const json & j)
{
  const json & arr = require(j, "children");
  if (!arr.is_array()) {
    throw OutlineFormatError("field 'children' must be an array");
  }
  std::vector<OutlineNode> out;
  out.reserve(arr.size());
  for (const auto & c : arr) {
    out.push_back(outline_node_from_json(c));
  }
  return out;
}

}  // namespace

json to_json(const OutlineNode & node)
{
  if (const auto * c = node.as_container()) {
    return json{
      {"type", c->kind},
      {"name", c->name},
      {"locationSpan", j_location(c->location_span)},
      {"headerSpan", j_bytes(c->header_span)},
      {"footerSpan", j_bytes(c->footer_span)},
      {"children", j_children(c->children)}};
  }

  const auto * t = node.as_terminal();
  return json{
    {"type", t->kind},
    {"name", t->name},
    {"locationSpan", j_location(t->location_span)},
    {"span", j_bytes(t->span)}};
}

json to_json(const OutlineFile & file)
{
  json j{
    {"type", file.kind},
    {"name", file.name},
    {"locationSpan", j_location(file.location_span)},
    {"footerSpan", j_bytes(file.footer_span)},
    {"parsingErrorsDetected", file.parsing_errors_detected},
    {"children", j_children(file.children)},
    {"parsingError", nullptr}};

  if (file.parsing_error) {
    j["parsingError"] = json{
      {"location", j_location(file.parsing_error->location)},
      {"message", file.parsing_error->message}};
  }
  return j;
}

std::string serialize_outline(const OutlineFile & file, int indent)
{
  return to_json(file).dump(indent, ' ', false, json::error_handler_t::replace);
}

OutlineNode outline_node_from_json(const json & j)
{
  if (!j.is_object()) {
    throw OutlineFormatError("outline node must be an object");
  }

  if (j.contains("children")) {
    Container c;
    c.kind = read_string(j, "type");
    c.name = read_string(j, "name");
    c.location_span = read_location(j, "locationSpan");
    c.header_span = read_bytes(j, "headerSpan");
    c.footer_span = read_bytes(j, "footerSpan");
    c.children = read_children(j);
    return c;
  }

  Terminal t;
  t.kind = read_string(j, "type");
  t.name = read_string(j, "name");
  t.location_span = read_location(j, "locationSpan");
  t.span = read_bytes(j, "span");
  return t;
}

OutlineFile outline_file_from_json(const json & j)
{
  OutlineFile f;
  f.kind = read_string(j, "type");
  f.name = read_string(j, "name");
  f.location_span = read_location(j, "locationSpan");
  f.footer_span = read_bytes(j, "footerSpan");

  const json & flag = require(j, "parsingErrorsDetected");
  if (!flag.is_boolean()) {
    throw OutlineFormatError("field 'parsingErrorsDetected' must be a boolean");
  }
  f.parsing_errors_detected = flag.get<bool>();

  f.children = read_children(j);

  const json & err = require(j, "parsingError");
  if (!err.is_null()) {
    f.parsing_error = ParsingError{read_location(err, "location"), read_string(err, "message")};
  }
  return f;
}

OutlineFile parse_outline(std::string_view text)
{
  json j;
  try {
    j = json::parse(text.begin(), text.end());
  } catch (const nlohmann::json::parse_error & e) {
    throw OutlineFormatError(std::string("invalid JSON: ") + e.what());
  }
  return outline_file_from_json(j);
}

}  // namespace rs_outline
