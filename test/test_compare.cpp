#include "isomer_fixture.hpp"
#include "observable_containers.hpp"

#include "runtime/compare.hpp"

#include <cmath>
#include <limits>

using namespace isomer;

struct compare : isomer_fixture {
  ptr<>
  nan() { return num(std::numeric_limits<double>::quiet_NaN()); }

  testing::AssertionResult
  symmetric_equal(ptr<> x, ptr<> y) {
    bool forward = isomer::equal(ctx, x, y);
    bool backward = isomer::equal(ctx, y, x);
    if (forward != backward)
      return testing::AssertionFailure() << "equal isn't symmetric";
    else if (forward)
      return testing::AssertionSuccess();
    else
      return testing::AssertionFailure() << "values aren't equal";
  }
};

TEST_F(compare, eqv_primitives) {
  EXPECT_TRUE(eqv(num(1), num(1)));
  EXPECT_TRUE(eqv(num(0.0), num(-0.0)));
  EXPECT_FALSE(eqv(num(1), num(2)));
  EXPECT_FALSE(eqv(nan(), nan()));
  EXPECT_TRUE(eqv(str("a"), str("a")));
  EXPECT_FALSE(eqv(str("a"), str("b")));
  EXPECT_FALSE(eqv(str("1"), num(1)));
  EXPECT_TRUE(eqv(make<boolean>(ctx, true), ctx.constants->t));
  EXPECT_TRUE(eqv(null(), null()));
  EXPECT_TRUE(eqv(undefined(), ptr<>{}));
  EXPECT_FALSE(eqv(undefined(), null()));
  EXPECT_FALSE(eqv(ptr<>{}, num(0)));
}

TEST_F(compare, eqv_is_identity_for_everything_else) {
  EXPECT_FALSE(eqv(make<symbol>(ctx, "s"), make<symbol>(ctx, "s")));
  EXPECT_TRUE(eqv(ctx.intern("s"), ctx.intern("s")));
  EXPECT_FALSE(eqv(vec({}), vec({})));
  EXPECT_FALSE(eqv(rec({}), rec({})));

  auto r = rec({});
  EXPECT_TRUE(eqv(r, r));
}

TEST_F(compare, both_nan) {
  EXPECT_TRUE(both_nan(nan(), nan()));
  EXPECT_FALSE(both_nan(nan(), num(1)));
  EXPECT_FALSE(both_nan(nan(), str("NaN")));
}

TEST_F(compare, reflexive) {
  EXPECT_TRUE(equal(nan(), nan()));
  EXPECT_TRUE(equal(null(), null()));
  EXPECT_TRUE(equal(undefined(), undefined()));
  EXPECT_TRUE(equal(ptr<>{}, undefined()));

  ptr<> values[] = {
    num(1), str("x"), ctx.intern("s"),
    vec({num(1), nan(), rec({{"a", vec({})}})}),
    tab({{"k", vec({nan()})}}),
    rec({{"a", num(1)}, {"b", null()}}),
    make_instance(ctx, make_record_type(ctx, "Point"), {{"x", num(1)}})
  };

  for (ptr<> v : values)
    EXPECT_TRUE(equal(v, v));
}

TEST_F(compare, primitives) {
  EXPECT_TRUE(symmetric_equal(num(1), num(1)));
  EXPECT_FALSE(symmetric_equal(num(1), str("1")));
  EXPECT_FALSE(symmetric_equal(num(0), ctx.constants->f));
  EXPECT_FALSE(symmetric_equal(null(), undefined()));
  EXPECT_FALSE(symmetric_equal(null(), rec({})));
  EXPECT_FALSE(symmetric_equal(num(1), vec({num(1)})));
  EXPECT_FALSE(symmetric_equal(str("a"), rec({})));
}

TEST_F(compare, callables_compare_by_identity) {
  auto f = make<procedure>(ctx, "f");
  EXPECT_TRUE(equal(f, f));
  EXPECT_FALSE(symmetric_equal(f, make<procedure>(ctx, "f")));
  EXPECT_FALSE(symmetric_equal(make_record_type(ctx, "T"),
                               make_record_type(ctx, "T")));
}

TEST_F(compare, sequence_and_record_never_equal) {
  EXPECT_FALSE(symmetric_equal(vec({num(1), num(2)}),
                               rec({{"0", num(1)}, {"1", num(2)}})));
}

TEST_F(compare, sequence_and_map_never_equal) {
  EXPECT_FALSE(symmetric_equal(vec({}), tab({})));
  EXPECT_FALSE(symmetric_equal(tab({{"a", num(1)}}), rec({{"a", num(1)}})));
}

TEST_F(compare, sequences) {
  EXPECT_TRUE(symmetric_equal(vec({num(1), str("a")}), vec({num(1), str("a")})));
  EXPECT_FALSE(symmetric_equal(vec({num(1), num(2), num(3)}),
                               vec({num(1), num(2)})));
  EXPECT_FALSE(symmetric_equal(vec({num(1), num(2)}), vec({num(2), num(1)})));
  EXPECT_TRUE(symmetric_equal(vec({nan()}), vec({nan()})));
}

TEST_F(compare, maps) {
  EXPECT_TRUE(symmetric_equal(tab({{"a", num(1)}, {"b", num(2)}}),
                              tab({{"b", num(2)}, {"a", num(1)}})));
  EXPECT_FALSE(symmetric_equal(tab({{"a", num(1)}}),
                               tab({{"a", num(1)}, {"b", num(2)}})));
  EXPECT_FALSE(symmetric_equal(tab({{"a", num(1)}}), tab({{"a", num(2)}})));
}

TEST_F(compare, map_with_missing_key_is_unequal) {
  EXPECT_FALSE(symmetric_equal(tab({{"a", undefined()}}),
                               tab({{"b", undefined()}})));
  EXPECT_FALSE(symmetric_equal(tab({{"a", ptr<>{}}}), tab({{"b", num(1)}})));
}

TEST_F(compare, map_lookup_policy_reads_missing_keys_as_undefined) {
  context compat{runtime_config::compatibility_config(
    std::make_unique<null_diagnostic_sink>()
  )};

  auto a = make_table(compat, {{"a", compat.constants->undefined}});
  auto b = make_table(compat, {{"b", make_number(compat, 1)}});
  EXPECT_TRUE(isomer::equal(compat, a, b));
  EXPECT_FALSE(isomer::equal(compat, b, a));

  auto c = make_table(compat, {{"a", make_number(compat, 1)}});
  auto d = make_table(compat, {{"b", make_number(compat, 1)}});
  EXPECT_FALSE(isomer::equal(compat, c, d));
}

TEST_F(compare, records) {
  EXPECT_TRUE(symmetric_equal(rec({{"a", num(1)}, {"b", num(2)}}),
                              rec({{"b", num(2)}, {"a", num(1)}})));
  EXPECT_FALSE(symmetric_equal(rec({{"a", num(1)}}),
                               rec({{"a", num(1)}, {"b", num(2)}})));
  EXPECT_FALSE(symmetric_equal(rec({{"a", num(1)}}), rec({{"b", num(1)}})));
  EXPECT_TRUE(symmetric_equal(rec({}), make_bare_record(ctx)));
}

TEST_F(compare, inherited_fields_do_not_count) {
  auto type = make_record_type(ctx, "Defaults");
  set_field(ctx, type, "b", num(2));

  EXPECT_FALSE(symmetric_equal(rec({{"b", num(2)}}),
                               make_instance(ctx, type, {{"a", num(1)}})));
  EXPECT_TRUE(symmetric_equal(rec({{"b", num(3)}}),
                              make_instance(ctx, type, {{"b", num(3)}})));
}

TEST_F(compare, hidden_field_does_not_match_visible_one) {
  auto visible = rec({{"y", num(1)}});
  auto r = rec({{"x", num(5)}});
  hide(ctx, r, "y", num(1));

  EXPECT_FALSE(symmetric_equal(visible, r));
}

TEST_F(compare, hidden_fields_are_ignored) {
  auto r = rec({{"x", num(1)}});
  hide(ctx, r, "y", num(42));

  EXPECT_EQ(own_keys(r), std::vector<std::string>{"x"});
  EXPECT_TRUE(symmetric_equal(r, rec({{"x", get_field(r, "x")}})));

  set_field(ctx, r, "y", str("changed"));
  EXPECT_TRUE(symmetric_equal(r, rec({{"x", num(1)}})));
}

TEST_F(compare, opaque_objects_compare_fieldwise) {
  auto point = make_record_type(ctx, "Point");
  EXPECT_TRUE(symmetric_equal(make_instance(ctx, point, {{"x", num(1)}}),
                              make_instance(ctx, point, {{"x", num(1)}})));
  EXPECT_FALSE(symmetric_equal(make_instance(ctx, point, {{"x", num(1)}}),
                               make_instance(ctx, point, {{"x", num(2)}})));
}

TEST_F(compare, nested) {
  auto make_value = [&] (double b) {
    return rec({{"a", vec({num(1), rec({{"b", num(b)}})})}});
  };

  EXPECT_TRUE(symmetric_equal(make_value(2), make_value(2)));
  EXPECT_FALSE(symmetric_equal(make_value(2), make_value(3)));
}

TEST_F(compare, mixed_nesting) {
  auto make_value = [&] (ptr<> leaf) {
    return tab({{"list", vec({rec({{"m", tab({{"k", leaf}})}})})}});
  };

  EXPECT_TRUE(symmetric_equal(make_value(nan()), make_value(nan())));
  EXPECT_FALSE(symmetric_equal(make_value(num(1)), make_value(str("1"))));
}

TEST_F(compare, deep_nesting_does_not_recurse) {
  ptr<> left = num(0);
  ptr<> right = num(0);
  for (int i = 0; i < 100000; ++i) {
    left = vec({left});
    right = vec({right});
  }

  EXPECT_TRUE(isomer::equal(ctx, left, right));
}

TEST_F(compare, registered_containers) {
  observable_containers oc{ctx};

  EXPECT_TRUE(symmetric_equal(oc.make_array(ctx, {num(1), num(2)}),
                              vec({num(1), num(2)})));
  EXPECT_FALSE(symmetric_equal(oc.make_array(ctx, {num(1)}),
                               vec({num(1), num(2)})));
  EXPECT_TRUE(symmetric_equal(oc.make_map(ctx, {{"a", num(1)}}),
                              tab({{"a", num(1)}})));
  EXPECT_FALSE(symmetric_equal(oc.make_map(ctx, {{"a", num(1)}}),
                               oc.make_array(ctx, {num(1)})));
  EXPECT_FALSE(symmetric_equal(oc.make_array(ctx, {}), rec({})));
}

TEST_F(compare, admin_state_does_not_affect_equality) {
  observable_containers oc{ctx};
  auto a = oc.make_array(ctx, {num(1)});
  auto b = oc.make_array(ctx, {num(1)});
  hide(ctx, b, "$observers", vec({num(7)}));

  EXPECT_TRUE(symmetric_equal(a, b));
}
