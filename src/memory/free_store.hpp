#ifndef ISOMER_MEMORY_FREE_STORE_HPP
#define ISOMER_MEMORY_FREE_STORE_HPP

#include "object.hpp"

#include <cstddef>
#include <memory>
#include <type_traits>
#include <vector>

namespace isomer {

using object_list = std::vector<object_header*>;

// Owning storage for runtime objects. Objects are never moved or reclaimed
// individually; everything allocated by a store is destroyed together with it.
class free_store {
public:
  free_store() = default;
  free_store(free_store const&) = delete;
  void operator = (free_store const&) = delete;
  ~free_store();

  template <typename T, typename... Args>
  ptr<T>
  make(Args&&... args) {
    static_assert(std::is_standard_layout_v<object_storage<T>>);

    if (objects_.size() == objects_.capacity())
      objects_.reserve(2 * objects_.capacity() + 1);
    auto storage = allocate_storage<T>();
    ptr<T> result{
      new (&storage->payload_storage) T(std::forward<Args>(args)...)
    };

    objects_.push_back(&storage.release()->header);
    return result;
  }

  std::size_t
  size() const { return objects_.size(); }

private:
  object_list objects_;

  // Allocate storage for the given payload type and initialise its header.
  template <typename T>
  std::unique_ptr<object_storage<T>>
  allocate_storage() {
    auto storage = std::make_unique<object_storage<T>>();
    storage->header = make_header(T::type_index);
    return storage;
  }
};

} // namespace isomer

#endif
