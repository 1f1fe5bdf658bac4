/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"
#include "testutil_unity.hpp"

#include "core/options.hpp"
#include "core/value.hpp"
#include "protocol/buffer_source.hpp"
#include "protocol/value_decoder.hpp"

void setUp ()
{
}

void tearDown ()
{
}

static int decode_with (const wire_builder_t &wire_,
                        const zwire::options_t &options_,
                        zwire::value_t *value_,
                        size_t *consumed_ = NULL)
{
    zwire::buffer_source_t source;
    TEST_ASSERT_SUCCESS_ERRNO (source.init (wire_.data (), wire_.size ()));
    zwire::value_decoder_t decoder (&source, options_);
    const int rc = decoder.decode (value_);
    if (consumed_)
        *consumed_ = source.position ();
    return rc;
}

static int decode (const wire_builder_t &wire_, zwire::value_t *value_)
{
    zwire::options_t options;
    return decode_with (wire_, options, value_);
}

//  Nests depth_ single-element arrays around an integer.
static wire_builder_t nested_arrays (int depth_)
{
    wire_builder_t wire;
    for (int i = 0; i < depth_; ++i)
        wire.tag (zwire::operand_array).length (1);
    wire.integer (1);
    return wire;
}

void test_array_keeps_order ()
{
    wire_builder_t wire;
    wire.tag (zwire::operand_array)
      .length (3)
      .integer (3)
      .string ("two")
      .tag (zwire::operand_null);

    zwire::value_t value;
    size_t consumed = 0;
    zwire::options_t options;
    TEST_ASSERT_SUCCESS_ERRNO (decode_with (wire, options, &value, &consumed));
    TEST_ASSERT_EQUAL_INT (zwire::value_t::type_array, value.type ());
    TEST_ASSERT_EQUAL_size_t (3, value.count ());
    TEST_ASSERT_TRUE (value.items ()[0] == make_integer (3));
    TEST_ASSERT_TRUE (value.items ()[1] == make_string ("two"));
    TEST_ASSERT_EQUAL_INT (zwire::value_t::type_null,
                           value.items ()[2].type ());
    TEST_ASSERT_EQUAL_size_t (wire.size (), consumed);
}

void test_array_of_nulls_stays_compact ()
{
    const uint32_t count = 100000;
    wire_builder_t wire;
    wire.tag (zwire::operand_array).length (count);
    for (uint32_t i = 0; i != count; ++i)
        wire.tag (zwire::operand_null);

    zwire::value_t value;
    TEST_ASSERT_SUCCESS_ERRNO (decode (wire, &value));
    TEST_ASSERT_EQUAL_size_t (count, value.count ());
    TEST_ASSERT_EQUAL_INT (zwire::value_t::type_null,
                           value.items ()[count - 1].type ());

    //  Null elements own no heap memory, so the element buffer is all the
    //  array costs: a small constant per wire byte.
    const size_t footprint =
      value.items ().capacity () * sizeof (zwire::value_t);
    TEST_ASSERT_TRUE (footprint <= static_cast<size_t> (count) * 2 * 64);
}

void test_empty_containers ()
{
    const zwire::operand_t tags[] = {zwire::operand_array, zwire::operand_map,
                                     zwire::operand_set,
                                     zwire::operand_unordered_set};
    const zwire::value_t::type_t types[] = {
      zwire::value_t::type_array, zwire::value_t::type_map,
      zwire::value_t::type_set, zwire::value_t::type_unordered_set};

    for (size_t i = 0; i != sizeof tags / sizeof tags[0]; ++i) {
        wire_builder_t wire;
        wire.tag (tags[i]).length (0);
        zwire::value_t value;
        TEST_ASSERT_SUCCESS_ERRNO (decode (wire, &value));
        TEST_ASSERT_EQUAL_INT (types[i], value.type ());
        TEST_ASSERT_EQUAL_size_t (0, value.count ());
    }
}

void test_map_entries ()
{
    wire_builder_t wire;
    wire.tag (zwire::operand_map)
      .length (2)
      .raw ("name")
      .delimiter ()
      .string ("zwire")
      .raw ("port")
      .delimiter ()
      .integer (7556);

    zwire::value_t value;
    TEST_ASSERT_SUCCESS_ERRNO (decode (wire, &value));
    TEST_ASSERT_EQUAL_INT (zwire::value_t::type_map, value.type ());
    TEST_ASSERT_EQUAL_size_t (2, value.count ());

    const zwire::value_t *name = value.map_find ("name");
    TEST_ASSERT_NOT_NULL (name);
    TEST_ASSERT_TRUE (*name == make_string ("zwire"));
    const zwire::value_t *port = value.map_find ("port");
    TEST_ASSERT_NOT_NULL (port);
    TEST_ASSERT_TRUE (*port == make_integer (7556));
    TEST_ASSERT_NULL (value.map_find ("missing"));
}

void test_map_duplicate_key_last_write_wins ()
{
    wire_builder_t wire;
    wire.tag (zwire::operand_map)
      .length (2)
      .raw ("k")
      .delimiter ()
      .integer (1)
      .raw ("k")
      .delimiter ()
      .integer (2);

    zwire::value_t value;
    TEST_ASSERT_SUCCESS_ERRNO (decode (wire, &value));
    TEST_ASSERT_EQUAL_size_t (1, value.count ());
    TEST_ASSERT_TRUE (*value.map_find ("k") == make_integer (2));
}

void test_map_empty_key_fails_before_value ()
{
    //  Count 1, then a key made of the bare delimiter and no value at all:
    //  the key is rejected before the value would run out of bytes.
    wire_builder_t wire;
    wire.tag (zwire::operand_map).length (1).delimiter ();

    zwire::value_t value;
    value.init_integer (42);
    TEST_ASSERT_FAILURE_ERRNO (EINVALIDOPERAND, decode (wire, &value));
    TEST_ASSERT_TRUE (value == make_integer (42));
}

void test_map_key_with_lone_line_feed ()
{
    wire_builder_t wire;
    wire.tag (zwire::operand_map)
      .length (1)
      .raw ("a\nb")
      .delimiter ()
      .tag (zwire::operand_boolean_true);

    zwire::value_t value;
    TEST_ASSERT_SUCCESS_ERRNO (decode (wire, &value));
    TEST_ASSERT_NOT_NULL (value.map_find ("a\nb"));
}

void test_set_keeps_duplicates ()
{
    wire_builder_t wire;
    wire.tag (zwire::operand_set)
      .length (3)
      .integer (5)
      .integer (5)
      .integer (4);

    zwire::value_t value;
    TEST_ASSERT_SUCCESS_ERRNO (decode (wire, &value));
    TEST_ASSERT_EQUAL_INT (zwire::value_t::type_set, value.type ());
    TEST_ASSERT_EQUAL_size_t (3, value.count ());
    TEST_ASSERT_TRUE (value.items ()[0] == make_integer (5));
    TEST_ASSERT_TRUE (value.items ()[1] == make_integer (5));
    TEST_ASSERT_TRUE (value.items ()[2] == make_integer (4));
}

void test_unordered_set_drops_duplicates ()
{
    wire_builder_t wire;
    wire.tag (zwire::operand_unordered_set)
      .length (4)
      .integer (5)
      .string ("x")
      .integer (5)
      .string ("x");

    zwire::value_t value;
    TEST_ASSERT_SUCCESS_ERRNO (decode (wire, &value));
    TEST_ASSERT_EQUAL_INT (zwire::value_t::type_unordered_set, value.type ());
    TEST_ASSERT_EQUAL_size_t (2, value.count ());
    TEST_ASSERT_TRUE (value.uset_contains (make_integer (5)));
    TEST_ASSERT_TRUE (value.uset_contains (make_string ("x")));
    //  A simple string is a different type from a string.
    TEST_ASSERT_FALSE (value.uset_contains (make_simple_string ("x")));
}

void test_map_of_arrays_round_trip ()
{
    zwire::value_t evens;
    evens.init_array ();
    evens.push_back (make_integer (2));
    evens.push_back (make_integer (4));

    zwire::value_t odds;
    odds.init_array ();
    odds.push_back (make_integer (1));
    odds.push_back (make_integer (3));
    odds.push_back (make_integer (-5));

    zwire::value_t original;
    original.init_map ();
    original.map_put ("evens", zwire::value_t (evens));
    original.map_put ("odds", zwire::value_t (odds));

    wire_builder_t wire;
    wire.value (original);

    zwire::value_t decoded;
    size_t consumed = 0;
    zwire::options_t options;
    TEST_ASSERT_SUCCESS_ERRNO (
      decode_with (wire, options, &decoded, &consumed));
    TEST_ASSERT_TRUE (decoded == original);
    TEST_ASSERT_EQUAL_size_t (wire.size (), consumed);
    TEST_ASSERT_EQUAL_size_t (3, decoded.map_find ("odds")->count ());
}

void test_mixed_nesting_round_trip ()
{
    zwire::value_t inner;
    inner.init_unordered_set ();
    inner.uset_insert (make_simple_string ("a"));
    inner.uset_insert (make_simple_string ("b"));

    zwire::value_t set;
    set.init_set ();
    set.set_insert (zwire::value_t (inner));
    set.set_insert (zwire::value_t (inner));

    zwire::value_t map;
    map.init_map ();
    map.map_put ("sets", zwire::value_t (set));

    zwire::value_t root;
    root.init_array ();
    root.push_back (zwire::value_t (map));
    root.push_back (make_string ("tail"));

    wire_builder_t wire;
    wire.value (root);

    zwire::value_t decoded;
    TEST_ASSERT_SUCCESS_ERRNO (decode (wire, &decoded));
    TEST_ASSERT_TRUE (decoded == root);
}

void test_truncated_container_leaves_output_untouched ()
{
    wire_builder_t wire;
    wire.tag (zwire::operand_array).length (3).integer (1).integer (2);

    zwire::value_t value;
    value.init_integer (42);
    TEST_ASSERT_FAILURE_ERRNO (EENDOFSTREAM, decode (wire, &value));
    TEST_ASSERT_TRUE (value == make_integer (42));
}

void test_bad_element_tag_fails ()
{
    wire_builder_t wire;
    wire.tag (zwire::operand_array).length (2).integer (1).byte (0x7F);

    zwire::value_t value;
    TEST_ASSERT_FAILURE_ERRNO (EINVALIDOPERAND, decode (wire, &value));
}

void test_nesting_at_limit_succeeds ()
{
    zwire::options_t options;
    const int max_depth = 4;
    TEST_ASSERT_SUCCESS_ERRNO (
      options.set_option (ZWIRE_MAXDEPTH, &max_depth, sizeof max_depth));

    zwire::value_t value;
    TEST_ASSERT_SUCCESS_ERRNO (decode_with (nested_arrays (4), options, &value));

    const zwire::value_t *cursor = &value;
    for (int i = 0; i < 4; ++i) {
        TEST_ASSERT_EQUAL_INT (zwire::value_t::type_array, cursor->type ());
        cursor = &cursor->items ()[0];
    }
    TEST_ASSERT_TRUE (*cursor == make_integer (1));
}

void test_nesting_above_limit_fails ()
{
    zwire::options_t options;
    const int max_depth = 4;
    TEST_ASSERT_SUCCESS_ERRNO (
      options.set_option (ZWIRE_MAXDEPTH, &max_depth, sizeof max_depth));

    zwire::value_t value;
    TEST_ASSERT_FAILURE_ERRNO (ENESTING,
                               decode_with (nested_arrays (5), options, &value));
}

void test_zero_depth_forbids_containers ()
{
    zwire::options_t options;
    const int max_depth = 0;
    TEST_ASSERT_SUCCESS_ERRNO (
      options.set_option (ZWIRE_MAXDEPTH, &max_depth, sizeof max_depth));

    wire_builder_t wire;
    wire.tag (zwire::operand_map).length (0);
    zwire::value_t value;
    TEST_ASSERT_FAILURE_ERRNO (ENESTING, decode_with (wire, options, &value));

    wire_builder_t scalar;
    scalar.integer (3);
    TEST_ASSERT_SUCCESS_ERRNO (decode_with (scalar, options, &value));
}

void test_default_depth_rejects_adversarial_nesting ()
{
    zwire::value_t value;
    TEST_ASSERT_FAILURE_ERRNO (
      ENESTING, decode (nested_arrays (ZWIRE_MAXDEPTH_DFLT + 1), &value));
    TEST_ASSERT_SUCCESS_ERRNO (
      decode (nested_arrays (ZWIRE_MAXDEPTH_DFLT), &value));
}

void test_count_above_limit_fails ()
{
    zwire::options_t options;
    const int64_t max_length = 2;
    TEST_ASSERT_SUCCESS_ERRNO (
      options.set_option (ZWIRE_MAXLEN, &max_length, sizeof max_length));

    wire_builder_t wire;
    wire.tag (zwire::operand_set).length (3).integer (1).integer (2).integer (3);
    zwire::value_t value;
    TEST_ASSERT_FAILURE_ERRNO (EMSGSIZE, decode_with (wire, options, &value));
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_array_keeps_order);
    RUN_TEST (test_array_of_nulls_stays_compact);
    RUN_TEST (test_empty_containers);
    RUN_TEST (test_map_entries);
    RUN_TEST (test_map_duplicate_key_last_write_wins);
    RUN_TEST (test_map_empty_key_fails_before_value);
    RUN_TEST (test_map_key_with_lone_line_feed);
    RUN_TEST (test_set_keeps_duplicates);
    RUN_TEST (test_unordered_set_drops_duplicates);
    RUN_TEST (test_map_of_arrays_round_trip);
    RUN_TEST (test_mixed_nesting_round_trip);
    RUN_TEST (test_truncated_container_leaves_output_untouched);
    RUN_TEST (test_bad_element_tag_fails);
    RUN_TEST (test_nesting_at_limit_succeeds);
    RUN_TEST (test_nesting_above_limit_fails);
    RUN_TEST (test_zero_depth_forbids_containers);
    RUN_TEST (test_default_depth_rejects_adversarial_nesting);
    RUN_TEST (test_count_above_limit_fails);
    return UNITY_END ();
}
