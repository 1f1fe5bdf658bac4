/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZWIRE_VALUE_HPP_INCLUDED__
#define __ZWIRE_VALUE_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "utils/macros.hpp"

namespace zwire
{
//  Decoded operand value. A value exclusively owns its byte payload and all
//  of its children; copies are deep.
//
//  Scalars are set up with one of the init_* calls. Containers start empty
//  after init_array/init_map/init_set/init_unordered_set and are filled with
//  the matching insertion call:
//
//    array          - push_back, keeps order and duplicates
//    set            - set_insert, keeps order and duplicates
//    unordered_set  - uset_insert, drops values equal to a present one
//    map            - map_put, simple-string keys, last write wins
//
//  Only the payload of the current type is stored. Scalars and byte strings
//  live inline; container state sits behind one owned pointer, so a null or
//  boolean element costs sizeof (value_t) and nothing on the heap.

class value_t
{
  public:
    enum type_t
    {
        type_simple_string,
        type_string,
        type_integer,
        type_float,
        type_boolean,
        type_null,
        type_array,
        type_map,
        type_set,
        type_unordered_set,
        type_err
    };

    //  A default-constructed value is null.
    value_t ();
    value_t (const value_t &other_);
    value_t (value_t &&other_) ZWIRE_NOEXCEPT;
    ~value_t ();

    value_t &operator= (const value_t &other_);
    value_t &operator= (value_t &&other_) ZWIRE_NOEXCEPT;

    void init_null ();
    void init_boolean (bool value_);
    void init_integer (int64_t value_);
    void init_float (double value_);
    void init_simple_string (const void *data_, size_t size_);
    void init_string (const void *data_, size_t size_);
    void init_err (const void *data_, size_t size_);
    void init_array ();
    void init_map ();
    void init_set ();
    void init_unordered_set ();

    type_t type () const { return _type; }
    bool is_container () const;

    bool boolean () const;
    int64_t integer () const;
    double floating () const;

    //  Byte payload of simple strings, strings and errors.
    const std::string &bytes () const;
    const unsigned char *data () const;
    size_t size () const;

    //  Elements of arrays, sets and unordered sets; values of maps in
    //  key order of map_key (). Empty for scalars.
    const std::vector<value_t> &items () const;
    size_t count () const { return items ().size (); }

    void push_back (value_t &&value_);
    void set_insert (value_t &&value_);
    //  Returns false if an equal element was already present.
    bool uset_insert (value_t &&value_);
    bool uset_contains (const value_t &value_) const;

    //  Returns false if the key replaced an existing entry.
    bool map_put (const std::string &key_, value_t &&value_);
    const value_t *map_find (const std::string &key_) const;
    const std::string &map_key (size_t index_) const;

    //  Deep equality. Maps and unordered sets compare without regard to
    //  order, floats compare by bit pattern.
    bool operator== (const value_t &other_) const;
    bool operator!= (const value_t &other_) const { return !(*this == other_); }

    //  Consistent with operator==.
    size_t hash () const;

    static const char *type_name (type_t type_);

  private:
    //  Arrays and sets.
    struct sequence_t;
    //  Maps and unordered sets, with a hash index over keys or elements.
    struct indexed_t;

    typedef std::unique_ptr<sequence_t> sequence_ptr;
    typedef std::unique_ptr<indexed_t> indexed_ptr;

    sequence_t &sequence ();
    const sequence_t &sequence () const;
    indexed_t &indexed ();
    const indexed_t &indexed () const;

    static ptrdiff_t find_item (const indexed_t &set_, const value_t &value_);
    static ptrdiff_t find_key (const indexed_t &map_, const std::string &key_);

    typedef std::variant<std::monostate,
                         bool,
                         int64_t,
                         double,
                         std::string,
                         sequence_ptr,
                         indexed_ptr>
      payload_t;

    type_t _type;
    payload_t _payload;
};
}

#endif
