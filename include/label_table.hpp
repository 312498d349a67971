#pragma once

#include <source_range.hpp>

#include <tsl/robin_map.h>

#include <string_view>
#include <optional>
#include <cstdint>
#include <vector>

namespace nibasm
{

using label_id = std::size_t;

/// Labels of one source unit. Records live in an arena indexed by a stable
/// id, the name index maps into it. Names are views into the source text and
/// must not outlive it.
///
/// The parser inserts labels and fills in definition spans, the assembler
/// fills in resolved values afterwards.
class label_table
{
public:
  struct record
  {
    std::string_view name;
    std::optional<span> definition;
    std::optional<std::int8_t> value;
  };

  std::optional<label_id> get_id_of(std::string_view name) const;

  // fails if the name is already present
  std::optional<label_id> insert_unique(std::string_view name, span definition);

  label_id get_or_insert_reference(std::string_view name);

  std::optional<span> get_span_of(label_id id) const;
  bool set_span_of(label_id id, span definition);

  std::optional<std::int8_t> get_value_of(label_id id) const;
  bool set_value_of(label_id id, std::int8_t value);

  std::string_view name_of(label_id id) const
  { return records.at(id).name; }

  std::size_t size() const
  { return records.size(); }

  bool empty() const
  { return records.empty(); }
private:
  label_id push(std::string_view name, std::optional<span> definition);
private:
  std::vector<record> records;
  tsl::robin_map<std::string_view, label_id> index;
};

}

