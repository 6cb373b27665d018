#include "isomer_fixture.hpp"
#include "observable_containers.hpp"

#include "runtime/classify.hpp"

using namespace isomer;

struct classify_values : isomer_fixture { };

TEST_F(classify_values, nullish_values_classify_as_null) {
  EXPECT_EQ(classify(ctx, null()), classification::null);
  EXPECT_EQ(classify(ctx, undefined()), classification::null);
  EXPECT_EQ(classify(ctx, ptr<>{}), classification::null);
}

TEST_F(classify_values, non_objects_are_primitive) {
  EXPECT_EQ(classify(ctx, num(1)), classification::primitive);
  EXPECT_EQ(classify(ctx, str("x")), classification::primitive);
  EXPECT_EQ(classify(ctx, ctx.constants->f), classification::primitive);
  EXPECT_EQ(classify(ctx, ctx.intern("s")), classification::primitive);
  EXPECT_EQ(classify(ctx, make_record_type(ctx, "T")),
            classification::primitive);

  EXPECT_EQ(classify(ctx, make<procedure>(ctx, "noop")),
            classification::primitive);
}

TEST_F(classify_values, native_containers) {
  EXPECT_EQ(classify(ctx, vec({})), classification::ordered_sequence);
  EXPECT_EQ(classify(ctx, tab({})), classification::key_value_container);
}

TEST_F(classify_values, records) {
  EXPECT_EQ(classify(ctx, rec({{"a", num(1)}})), classification::plain_record);
  EXPECT_EQ(classify(ctx, make_bare_record(ctx)), classification::plain_record);

  auto type = make_record_type(ctx, "Point");
  EXPECT_EQ(classify(ctx, make_instance(ctx, type)), classification::opaque);
  EXPECT_FALSE(is_plain_record(ctx, make_instance(ctx, type)));
}

TEST_F(classify_values, registered_kinds_are_recognised) {
  observable_containers oc{ctx};
  auto array = oc.make_array(ctx, {num(1)});
  auto map = oc.make_map(ctx, {{"a", num(1)}});

  EXPECT_EQ(classify(ctx, array), classification::ordered_sequence);
  EXPECT_EQ(classify(ctx, map), classification::key_value_container);
  EXPECT_TRUE(is_sequence_like(ctx, array));
  EXPECT_FALSE(is_map_like(ctx, array));
  EXPECT_TRUE(is_map_like(ctx, map));
}

TEST_F(classify_values, sequence_kinds_take_precedence) {
  observable_containers oc{ctx};

  // Make arrays recognisable as maps as well.
  ctx.container_kinds().add(std::make_unique<observable_map_kind>(
    make_capability_predicate(ctx, "ObservableArray", oc.array_type)
  ));

  EXPECT_EQ(classify(ctx, oc.make_array(ctx, {})),
            classification::ordered_sequence);
}

TEST_F(classify_values, native_kinds_are_registered_first) {
  EXPECT_EQ(ctx.container_kinds().sequence_kind_count(), 1u);
  EXPECT_EQ(ctx.container_kinds().map_kind_count(), 1u);
  EXPECT_EQ(ctx.container_kinds().find_sequence_kind(vec({}))->name(), "vector");
  EXPECT_EQ(ctx.container_kinds().find_map_kind(tab({}))->name(), "table");
  EXPECT_EQ(ctx.container_kinds().find_sequence_kind(num(1)), nullptr);
  EXPECT_EQ(ctx.container_kinds().find_map_kind(null()), nullptr);
}

TEST_F(classify_values, null_kind_is_rejected) {
  EXPECT_THROW(ctx.container_kinds().add(std::unique_ptr<sequence_kind>{}),
               std::invalid_argument);
  EXPECT_THROW(ctx.container_kinds().add(std::unique_ptr<map_kind>{}),
               std::invalid_argument);
}

TEST_F(classify_values, classification_names) {
  EXPECT_STREQ(classification_name(classification::ordered_sequence),
               "ordered-sequence");
  EXPECT_STREQ(classification_name(classification::opaque), "opaque");
}
