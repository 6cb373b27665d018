#ifndef ISOMER_RUNTIME_CONTAINER_KINDS_HPP
#define ISOMER_RUNTIME_CONTAINER_KINDS_HPP

#include "object.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace isomer {

// Structural access to a family of ordered, indexable containers. Kinds are
// matched by capability rather than by concrete type, so containers defined
// outside of the runtime take part in classification and comparison the same
// way as the native vector.
class sequence_kind {
public:
  explicit
  sequence_kind(std::string name) : name_{std::move(name)} { }

  virtual
  ~sequence_kind() = default;

  std::string const&
  name() const { return name_; }

  virtual bool
  recognizes(ptr<>) const = 0;

  virtual std::size_t
  size(ptr<>) const = 0;

  virtual ptr<>
  ref(ptr<>, std::size_t) const = 0;

private:
  std::string name_;
};

// Structural access to a family of key/value containers.
class map_kind {
public:
  explicit
  map_kind(std::string name) : name_{std::move(name)} { }

  virtual
  ~map_kind() = default;

  std::string const&
  name() const { return name_; }

  virtual bool
  recognizes(ptr<>) const = 0;

  virtual std::size_t
  size(ptr<>) const = 0;

  // Keys in the container's own iteration order.
  virtual std::vector<std::string>
  keys(ptr<>) const = 0;

  virtual bool
  contains(ptr<>, std::string const& key) const = 0;

  // Returns an empty ptr<>, which reads as undefined, for a missing key.
  virtual ptr<>
  get(ptr<>, std::string const& key) const = 0;

private:
  std::string name_;
};

// Registered container kinds, queried in registration order.
class container_kinds {
public:
  void
  add(std::unique_ptr<sequence_kind>);

  void
  add(std::unique_ptr<map_kind>);

  sequence_kind const*
  find_sequence_kind(ptr<>) const;

  map_kind const*
  find_map_kind(ptr<>) const;

  std::size_t
  sequence_kind_count() const { return sequence_kinds_.size(); }

  std::size_t
  map_kind_count() const { return map_kinds_.size(); }

private:
  std::vector<std::unique_ptr<sequence_kind>> sequence_kinds_;
  std::vector<std::unique_ptr<map_kind>>      map_kinds_;
};

} // namespace isomer

#endif
