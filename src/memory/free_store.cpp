#include "memory/free_store.hpp"

namespace isomer {

free_store::~free_store() {
  for (auto it = objects_.rbegin(); it != objects_.rend(); ++it)
    object_type(*it).destroy(*it);
}

} // namespace isomer
