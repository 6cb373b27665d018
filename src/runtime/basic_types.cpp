#include "runtime/basic_types.hpp"

#include "runtime/container_kinds.hpp"
#include "runtime/error.hpp"

#include <memory>

namespace isomer {

ptr<>
vector::ref(std::size_t i) const {
  if (i >= elements_.size())
    throw make_error<std::out_of_range>(
      "Vector access out of bounds: index = {}, size = {}", i, elements_.size()
    );

  return elements_[i];
}

void
vector::set(std::size_t i, ptr<> value) {
  if (i >= elements_.size())
    throw make_error<std::out_of_range>(
      "Vector access out of bounds: index = {}, size = {}", i, elements_.size()
    );

  elements_[i] = value;
}

table::table(std::vector<entry> const& entries) {
  for (auto const& [key, value] : entries)
    set(key, value);
}

ptr<>
table::get(std::string const& key) const {
  if (auto it = index_.find(key); it != index_.end())
    return entries_[it->second].second;
  else
    return {};
}

void
table::set(std::string const& key, ptr<> value) {
  if (auto it = index_.find(key); it != index_.end())
    entries_[it->second].second = value;
  else {
    entries_.emplace_back(key, value);
    index_.emplace(key, entries_.size() - 1);
  }
}

bool
table::erase(std::string const& key) {
  auto it = index_.find(key);
  if (it == index_.end())
    return false;

  std::size_t position = it->second;
  index_.erase(it);
  entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(position));

  for (std::size_t i = position; i < entries_.size(); ++i)
    index_[entries_[i].first] = i;

  return true;
}

std::vector<std::string>
table::keys() const {
  std::vector<std::string> result;
  result.reserve(entries_.size());
  for (auto const& [key, value] : entries_)
    result.push_back(key);
  return result;
}

namespace {
  class vector_kind final : public sequence_kind {
  public:
    vector_kind() : sequence_kind{"vector"} { }

    bool
    recognizes(ptr<> x) const override { return is<vector>(x); }

    std::size_t
    size(ptr<> x) const override { return ptr_cast<vector>(x)->size(); }

    ptr<>
    ref(ptr<> x, std::size_t i) const override {
      return ptr_cast<vector>(x)->ref(i);
    }
  };

  class table_kind final : public map_kind {
  public:
    table_kind() : map_kind{"table"} { }

    bool
    recognizes(ptr<> x) const override { return is<table>(x); }

    std::size_t
    size(ptr<> x) const override { return ptr_cast<table>(x)->size(); }

    std::vector<std::string>
    keys(ptr<> x) const override { return ptr_cast<table>(x)->keys(); }

    bool
    contains(ptr<> x, std::string const& key) const override {
      return ptr_cast<table>(x)->contains(key);
    }

    ptr<>
    get(ptr<> x, std::string const& key) const override {
      return ptr_cast<table>(x)->get(key);
    }
  };
}

void
add_native_container_kinds(container_kinds& kinds) {
  kinds.add(std::make_unique<vector_kind>());
  kinds.add(std::make_unique<table_kind>());
}

} // namespace isomer
