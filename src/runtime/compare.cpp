#include "runtime/compare.hpp"

#include "context.hpp"
#include "runtime/basic_types.hpp"
#include "runtime/classify.hpp"
#include "runtime/container_kinds.hpp"
#include "runtime/records.hpp"
#include "util/object_conversions.hpp"

#include <cmath>
#include <string>
#include <unordered_set>
#include <vector>

namespace isomer {

bool
eqv(ptr<> x, ptr<> y) {
  if (x == y)
    return true;

  if (is_undefined(x) || is_undefined(y))
    return is_undefined(x) && is_undefined(y);

  if (object_type_index(x) != object_type_index(y))
    return false;

  if (is<null_type>(x))
    return true;

  if (auto lhs = match<number>(x))
    return lhs->value() == assume<number>(y)->value();

  if (auto lhs = match<string>(x))
    return lhs->value() == assume<string>(y)->value();

  if (auto lhs = match<boolean>(x))
    return lhs->value() == assume<boolean>(y)->value();

  return false;
}

bool
both_nan(ptr<> x, ptr<> y) {
  auto lhs = match<number>(x);
  auto rhs = match<number>(y);
  return lhs && rhs && std::isnan(lhs->value()) && std::isnan(rhs->value());
}

bool
equal(context& ctx, ptr<> x, ptr<> y) {
  struct comparison {
    ptr<> left;
    ptr<> right;
  };
  std::vector<comparison> stack{{x, y}};
  container_kinds const& kinds = ctx.container_kinds();

  auto check_sequence_members = [&] (sequence_kind const& lk, ptr<> l,
                                     sequence_kind const& rk, ptr<> r) {
    std::size_t size = lk.size(l);
    if (size != rk.size(r))
      return false;

    for (std::size_t i = size; i > 0; --i)
      stack.push_back({lk.ref(l, i - 1), rk.ref(r, i - 1)});

    return true;
  };

  auto check_map_members = [&] (map_kind const& lk, ptr<> l,
                                map_kind const& rk, ptr<> r) {
    if (lk.size(l) != rk.size(r))
      return false;

    for (std::string const& key : lk.keys(l)) {
      if (ctx.config.map_keys == map_key_policy::require_presence
          && !rk.contains(r, key))
        return false;

      stack.push_back({lk.get(l, key), rk.get(r, key)});
    }

    return true;
  };

  auto check_record_members = [&] (ptr<> l, ptr<> r) {
    std::vector<std::string> l_keys = own_keys(l);
    std::vector<std::string> r_keys = own_keys(r);
    if (l_keys.size() != r_keys.size())
      return false;

    std::unordered_set<std::string> r_key_set{r_keys.begin(), r_keys.end()};
    for (std::string const& key : l_keys) {
      if (!r_key_set.contains(key))
        return false;

      stack.push_back({get_own_field(l, key), get_own_field(r, key)});
    }

    return true;
  };

  auto check_members = [&] (comparison current) {
    ptr<> l = current.left;
    ptr<> r = current.right;

    if (eqv(l, r) || both_nan(l, r))
      return true;

    if (!is_object(l) || !is_object(r))
      return false;

    sequence_kind const* l_sequence = kinds.find_sequence_kind(l);
    sequence_kind const* r_sequence = kinds.find_sequence_kind(r);
    if ((l_sequence == nullptr) != (r_sequence == nullptr))
      return false;

    map_kind const* l_map = kinds.find_map_kind(l);
    map_kind const* r_map = kinds.find_map_kind(r);
    if ((l_map == nullptr) != (r_map == nullptr))
      return false;

    if (l_sequence)
      return check_sequence_members(*l_sequence, l, *r_sequence, r);
    else if (l_map)
      return check_map_members(*l_map, l, *r_map, r);
    else
      return check_record_members(l, r);
  };

  while (!stack.empty()) {
    comparison current = stack.back();
    stack.pop_back();

    if (!check_members(current))
      return false;
  }

  return true;
}

} // namespace isomer
