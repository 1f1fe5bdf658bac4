/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"
#include "testutil_unity.hpp"

#include "core/value.hpp"

#include <limits>

void setUp ()
{
}

void tearDown ()
{
}

void test_default_is_null ()
{
    zwire::value_t value;
    TEST_ASSERT_EQUAL_INT (zwire::value_t::type_null, value.type ());
    TEST_ASSERT_FALSE (value.is_container ());
    TEST_ASSERT_TRUE (value == zwire::value_t ());
}

void test_reinit_discards_previous_content ()
{
    zwire::value_t value;
    value.init_array ();
    value.push_back (make_integer (1));
    value.init_string ("ab", 2);
    TEST_ASSERT_EQUAL_INT (zwire::value_t::type_string, value.type ());
    TEST_ASSERT_EQUAL_size_t (2, value.size ());
    TEST_ASSERT_EQUAL_size_t (0, value.count ());
}

void test_string_kinds_differ ()
{
    zwire::value_t err;
    err.init_err ("x", 1);
    TEST_ASSERT_TRUE (make_string ("x") != make_simple_string ("x"));
    TEST_ASSERT_TRUE (make_string ("x") != err);
    TEST_ASSERT_TRUE (make_string ("x") == make_string ("x"));
}

void test_binary_payload ()
{
    const unsigned char bytes[] = {0x00, 0xFF, 0x0A, 0x0D};
    zwire::value_t value;
    value.init_string (bytes, sizeof bytes);
    TEST_ASSERT_EQUAL_size_t (sizeof bytes, value.size ());
    TEST_ASSERT_EQUAL_UINT8_ARRAY (bytes, value.data (), sizeof bytes);
}

void test_float_compares_bit_patterns ()
{
    zwire::value_t a;
    zwire::value_t b;
    a.init_float (std::numeric_limits<double>::quiet_NaN ());
    b.init_float (std::numeric_limits<double>::quiet_NaN ());
    TEST_ASSERT_TRUE (a == b);
    TEST_ASSERT_EQUAL_size_t (a.hash (), b.hash ());

    a.init_float (0.0);
    b.init_float (-0.0);
    TEST_ASSERT_TRUE (a != b);
}

void test_map_put_and_find ()
{
    zwire::value_t map;
    map.init_map ();
    TEST_ASSERT_TRUE (map.map_put ("a", make_integer (1)));
    TEST_ASSERT_TRUE (map.map_put ("b", make_integer (2)));
    TEST_ASSERT_FALSE (map.map_put ("a", make_integer (3)));

    TEST_ASSERT_EQUAL_size_t (2, map.count ());
    TEST_ASSERT_EQUAL_STRING ("a", map.map_key (0).c_str ());
    TEST_ASSERT_EQUAL_STRING ("b", map.map_key (1).c_str ());
    TEST_ASSERT_TRUE (*map.map_find ("a") == make_integer (3));
    TEST_ASSERT_NULL (map.map_find ("c"));
}

void test_map_equality_ignores_order ()
{
    zwire::value_t first;
    first.init_map ();
    first.map_put ("a", make_integer (1));
    first.map_put ("b", make_integer (2));

    zwire::value_t second;
    second.init_map ();
    second.map_put ("b", make_integer (2));
    second.map_put ("a", make_integer (1));

    TEST_ASSERT_TRUE (first == second);
    TEST_ASSERT_EQUAL_size_t (first.hash (), second.hash ());

    second.map_put ("a", make_integer (9));
    TEST_ASSERT_TRUE (first != second);
}

void test_unordered_set_equality_ignores_order ()
{
    zwire::value_t first;
    first.init_unordered_set ();
    first.uset_insert (make_integer (1));
    first.uset_insert (make_string ("two"));

    zwire::value_t second;
    second.init_unordered_set ();
    TEST_ASSERT_TRUE (second.uset_insert (make_string ("two")));
    TEST_ASSERT_TRUE (second.uset_insert (make_integer (1)));
    TEST_ASSERT_FALSE (second.uset_insert (make_integer (1)));

    TEST_ASSERT_TRUE (first == second);
    TEST_ASSERT_EQUAL_size_t (first.hash (), second.hash ());
}

void test_set_and_array_compare_in_order ()
{
    zwire::value_t first;
    first.init_set ();
    first.set_insert (make_integer (1));
    first.set_insert (make_integer (2));

    zwire::value_t second;
    second.init_set ();
    second.set_insert (make_integer (2));
    second.set_insert (make_integer (1));

    TEST_ASSERT_TRUE (first != second);

    zwire::value_t array;
    array.init_array ();
    array.push_back (make_integer (1));
    array.push_back (make_integer (2));
    TEST_ASSERT_TRUE (array != first);
}

void test_unordered_set_of_containers ()
{
    zwire::value_t inner_a;
    inner_a.init_map ();
    inner_a.map_put ("x", make_integer (1));
    inner_a.map_put ("y", make_integer (2));

    zwire::value_t inner_b;
    inner_b.init_map ();
    inner_b.map_put ("y", make_integer (2));
    inner_b.map_put ("x", make_integer (1));

    zwire::value_t set;
    set.init_unordered_set ();
    TEST_ASSERT_TRUE (set.uset_insert (zwire::value_t (inner_a)));
    TEST_ASSERT_FALSE (set.uset_insert (zwire::value_t (inner_b)));
    TEST_ASSERT_EQUAL_size_t (1, set.count ());
}

void test_copies_are_deep ()
{
    zwire::value_t original;
    original.init_array ();
    original.push_back (make_string ("keep"));

    zwire::value_t copy (original);
    copy.init_null ();
    TEST_ASSERT_EQUAL_size_t (1, original.count ());
    TEST_ASSERT_TRUE (original.items ()[0] == make_string ("keep"));
}

void test_scalars_are_stored_inline ()
{
    //  A scalar holds no container state: the size of a value is bounded by
    //  its largest inline payload, a byte string.
    TEST_ASSERT_TRUE (sizeof (zwire::value_t) <= sizeof (std::string) + 16);
    TEST_ASSERT_TRUE (sizeof (zwire::value_t) <= 64);
}

void test_moved_from_value_is_null ()
{
    zwire::value_t source;
    source.init_map ();
    source.map_put ("k", make_integer (1));

    zwire::value_t target (std::move (source));
    TEST_ASSERT_EQUAL_INT (zwire::value_t::type_map, target.type ());
    TEST_ASSERT_EQUAL_INT (zwire::value_t::type_null, source.type ());
    TEST_ASSERT_EQUAL_size_t (0, source.count ());

    zwire::value_t assigned;
    assigned = std::move (target);
    TEST_ASSERT_TRUE (*assigned.map_find ("k") == make_integer (1));
    TEST_ASSERT_EQUAL_INT (zwire::value_t::type_null, target.type ());
}

void test_assign_from_own_element ()
{
    zwire::value_t inner;
    inner.init_array ();
    inner.push_back (make_string ("leaf"));

    zwire::value_t outer;
    outer.init_array ();
    outer.push_back (std::move (inner));

    //  Copy from an element the assignment releases.
    zwire::value_t copied (outer);
    copied = copied.items ()[0];
    TEST_ASSERT_EQUAL_size_t (1, copied.count ());
    TEST_ASSERT_TRUE (copied.items ()[0] == make_string ("leaf"));

    TEST_ASSERT_EQUAL_INT (zwire::value_t::type_array,
                           outer.items ()[0].type ());
}

void test_type_names ()
{
    TEST_ASSERT_EQUAL_STRING (
      "unordered_set",
      zwire::value_t::type_name (zwire::value_t::type_unordered_set));
    TEST_ASSERT_EQUAL_STRING (
      "simple_string",
      zwire::value_t::type_name (zwire::value_t::type_simple_string));
    TEST_ASSERT_EQUAL_STRING ("err", zwire::value_t::type_name (
                                       zwire::value_t::type_err));
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_default_is_null);
    RUN_TEST (test_reinit_discards_previous_content);
    RUN_TEST (test_string_kinds_differ);
    RUN_TEST (test_binary_payload);
    RUN_TEST (test_float_compares_bit_patterns);
    RUN_TEST (test_map_put_and_find);
    RUN_TEST (test_map_equality_ignores_order);
    RUN_TEST (test_unordered_set_equality_ignores_order);
    RUN_TEST (test_set_and_array_compare_in_order);
    RUN_TEST (test_unordered_set_of_containers);
    RUN_TEST (test_copies_are_deep);
    RUN_TEST (test_scalars_are_stored_inline);
    RUN_TEST (test_moved_from_value_is_null);
    RUN_TEST (test_assign_from_own_element);
    RUN_TEST (test_type_names);
    return UNITY_END ();
}
