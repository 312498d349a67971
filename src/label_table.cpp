#include <label_table.hpp>

namespace nibasm
{

std::optional<label_id> label_table::get_id_of(std::string_view name) const
{
  if(auto it = index.find(name); it != index.end())
    return it->second;
  return std::nullopt;
}

std::optional<label_id> label_table::insert_unique(std::string_view name, span definition)
{
  if(index.count(name))
    return std::nullopt;

  return push(name, definition);
}

label_id label_table::get_or_insert_reference(std::string_view name)
{
  if(auto id = get_id_of(name))
    return *id;

  return push(name, std::nullopt);
}

std::optional<span> label_table::get_span_of(label_id id) const
{
  if(id >= records.size())
    return std::nullopt;
  return records[id].definition;
}

bool label_table::set_span_of(label_id id, span definition)
{
  if(id >= records.size())
    return false;

  records[id].definition = definition;
  return true;
}

std::optional<std::int8_t> label_table::get_value_of(label_id id) const
{
  if(id >= records.size())
    return std::nullopt;
  return records[id].value;
}

bool label_table::set_value_of(label_id id, std::int8_t value)
{
  if(id >= records.size())
    return false;

  records[id].value = value;
  return true;
}

label_id label_table::push(std::string_view name, std::optional<span> definition)
{
  records.push_back(record { name, definition, std::nullopt });

  const label_id id = records.size() - 1;
  index.emplace(name, id);

  return id;
}

}

