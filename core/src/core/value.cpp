/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "core/value.hpp"
#include "utils/err.hpp"

#include <functional>
#include <unordered_map>

namespace
{
size_t hash_combine (size_t seed_, size_t value_)
{
    return seed_ ^ (value_ + 0x9e3779b97f4a7c15ull + (seed_ << 6) + (seed_ >> 2));
}

uint64_t float_bits (double value_)
{
    uint64_t bits;
    memcpy (&bits, &value_, sizeof bits);
    return bits;
}
}

struct zwire::value_t::sequence_t
{
    std::vector<value_t> items;
};

struct zwire::value_t::indexed_t
{
    std::vector<value_t> items;

    //  Parallel to items, maps only.
    std::vector<std::string> keys;

    //  Hash to position in items: key hash for maps, element hash for
    //  unordered sets.
    std::unordered_multimap<size_t, size_t> index;
};

namespace
{
const std::vector<zwire::value_t> no_items;
}

zwire::value_t::value_t () : _type (type_null)
{
}

zwire::value_t::value_t (const value_t &other_) : _type (type_null)
{
    switch (other_._type) {
        case type_null:
            break;
        case type_boolean:
            _payload.emplace<bool> (std::get<bool> (other_._payload));
            break;
        case type_integer:
            _payload.emplace<int64_t> (std::get<int64_t> (other_._payload));
            break;
        case type_float:
            _payload.emplace<double> (std::get<double> (other_._payload));
            break;
        case type_simple_string:
        case type_string:
        case type_err:
            _payload.emplace<std::string> (
              std::get<std::string> (other_._payload));
            break;
        case type_array:
        case type_set:
            _payload.emplace<sequence_ptr> (
              new sequence_t (other_.sequence ()));
            break;
        case type_map:
        case type_unordered_set:
            _payload.emplace<indexed_ptr> (
              new indexed_t (other_.indexed ()));
            break;
    }
    _type = other_._type;
}

zwire::value_t::value_t (value_t &&other_) ZWIRE_NOEXCEPT :
    _type (other_._type),
    _payload (std::move (other_._payload))
{
    other_.init_null ();
}

zwire::value_t::~value_t ()
{
}

zwire::value_t &zwire::value_t::operator= (const value_t &other_)
{
    if (this != &other_) {
        value_t copy (other_);
        *this = std::move (copy);
    }
    return *this;
}

//  other_ may be a child of this value; it is detached before the old
//  payload is released.
zwire::value_t &zwire::value_t::operator= (value_t &&other_) ZWIRE_NOEXCEPT
{
    if (this != &other_) {
        payload_t payload (std::move (other_._payload));
        const type_t type = other_._type;
        other_.init_null ();
        _payload = std::move (payload);
        _type = type;
    }
    return *this;
}

zwire::value_t::sequence_t &zwire::value_t::sequence ()
{
    return *std::get<sequence_ptr> (_payload);
}

const zwire::value_t::sequence_t &zwire::value_t::sequence () const
{
    return *std::get<sequence_ptr> (_payload);
}

zwire::value_t::indexed_t &zwire::value_t::indexed ()
{
    return *std::get<indexed_ptr> (_payload);
}

const zwire::value_t::indexed_t &zwire::value_t::indexed () const
{
    return *std::get<indexed_ptr> (_payload);
}

void zwire::value_t::init_null ()
{
    _payload.emplace<std::monostate> ();
    _type = type_null;
}

void zwire::value_t::init_boolean (bool value_)
{
    _payload.emplace<bool> (value_);
    _type = type_boolean;
}

void zwire::value_t::init_integer (int64_t value_)
{
    _payload.emplace<int64_t> (value_);
    _type = type_integer;
}

void zwire::value_t::init_float (double value_)
{
    _payload.emplace<double> (value_);
    _type = type_float;
}

void zwire::value_t::init_simple_string (const void *data_, size_t size_)
{
    _payload.emplace<std::string> (static_cast<const char *> (data_), size_);
    _type = type_simple_string;
}

void zwire::value_t::init_string (const void *data_, size_t size_)
{
    _payload.emplace<std::string> (static_cast<const char *> (data_), size_);
    _type = type_string;
}

void zwire::value_t::init_err (const void *data_, size_t size_)
{
    _payload.emplace<std::string> (static_cast<const char *> (data_), size_);
    _type = type_err;
}

void zwire::value_t::init_array ()
{
    _payload.emplace<sequence_ptr> (new sequence_t);
    _type = type_array;
}

void zwire::value_t::init_map ()
{
    _payload.emplace<indexed_ptr> (new indexed_t);
    _type = type_map;
}

void zwire::value_t::init_set ()
{
    _payload.emplace<sequence_ptr> (new sequence_t);
    _type = type_set;
}

void zwire::value_t::init_unordered_set ()
{
    _payload.emplace<indexed_ptr> (new indexed_t);
    _type = type_unordered_set;
}

bool zwire::value_t::is_container () const
{
    return _type == type_array || _type == type_map || _type == type_set
           || _type == type_unordered_set;
}

bool zwire::value_t::boolean () const
{
    zwire_assert (_type == type_boolean);
    return std::get<bool> (_payload);
}

int64_t zwire::value_t::integer () const
{
    zwire_assert (_type == type_integer);
    return std::get<int64_t> (_payload);
}

double zwire::value_t::floating () const
{
    zwire_assert (_type == type_float);
    return std::get<double> (_payload);
}

const std::string &zwire::value_t::bytes () const
{
    zwire_assert (_type == type_simple_string || _type == type_string
                  || _type == type_err);
    return std::get<std::string> (_payload);
}

const unsigned char *zwire::value_t::data () const
{
    return reinterpret_cast<const unsigned char *> (bytes ().data ());
}

size_t zwire::value_t::size () const
{
    return bytes ().size ();
}

const std::vector<zwire::value_t> &zwire::value_t::items () const
{
    switch (_type) {
        case type_array:
        case type_set:
            return sequence ().items;
        case type_map:
        case type_unordered_set:
            return indexed ().items;
        default:
            return no_items;
    }
}

void zwire::value_t::push_back (value_t &&value_)
{
    zwire_assert (_type == type_array);
    sequence ().items.push_back (std::move (value_));
}

void zwire::value_t::set_insert (value_t &&value_)
{
    zwire_assert (_type == type_set);
    sequence ().items.push_back (std::move (value_));
}

ptrdiff_t zwire::value_t::find_item (const indexed_t &set_,
                                     const value_t &value_)
{
    const size_t h = value_.hash ();
    auto range = set_.index.equal_range (h);
    for (auto it = range.first; it != range.second; ++it)
        if (set_.items[it->second] == value_)
            return static_cast<ptrdiff_t> (it->second);
    return -1;
}

bool zwire::value_t::uset_insert (value_t &&value_)
{
    zwire_assert (_type == type_unordered_set);
    indexed_t &set = indexed ();
    if (find_item (set, value_) >= 0)
        return false;

    set.index.emplace (value_.hash (), set.items.size ());
    set.items.push_back (std::move (value_));
    return true;
}

bool zwire::value_t::uset_contains (const value_t &value_) const
{
    zwire_assert (_type == type_unordered_set);
    return find_item (indexed (), value_) >= 0;
}

ptrdiff_t zwire::value_t::find_key (const indexed_t &map_,
                                    const std::string &key_)
{
    const size_t h = std::hash<std::string> () (key_);
    auto range = map_.index.equal_range (h);
    for (auto it = range.first; it != range.second; ++it)
        if (map_.keys[it->second] == key_)
            return static_cast<ptrdiff_t> (it->second);
    return -1;
}

bool zwire::value_t::map_put (const std::string &key_, value_t &&value_)
{
    zwire_assert (_type == type_map);
    indexed_t &map = indexed ();
    const ptrdiff_t pos = find_key (map, key_);
    if (pos >= 0) {
        map.items[pos] = std::move (value_);
        return false;
    }

    map.index.emplace (std::hash<std::string> () (key_), map.keys.size ());
    map.keys.push_back (key_);
    map.items.push_back (std::move (value_));
    return true;
}

const zwire::value_t *zwire::value_t::map_find (const std::string &key_) const
{
    zwire_assert (_type == type_map);
    const indexed_t &map = indexed ();
    const ptrdiff_t pos = find_key (map, key_);
    return pos >= 0 ? &map.items[pos] : NULL;
}

const std::string &zwire::value_t::map_key (size_t index_) const
{
    zwire_assert (_type == type_map);
    const indexed_t &map = indexed ();
    zwire_assert (index_ < map.keys.size ());
    return map.keys[index_];
}

bool zwire::value_t::operator== (const value_t &other_) const
{
    if (_type != other_._type)
        return false;

    switch (_type) {
        case type_null:
            return true;
        case type_boolean:
            return boolean () == other_.boolean ();
        case type_integer:
            return integer () == other_.integer ();
        case type_float:
            return float_bits (floating ()) == float_bits (other_.floating ());
        case type_simple_string:
        case type_string:
        case type_err:
            return bytes () == other_.bytes ();
        case type_array:
        case type_set:
            return sequence ().items == other_.sequence ().items;
        case type_unordered_set: {
            const indexed_t &mine = indexed ();
            const indexed_t &theirs = other_.indexed ();
            if (mine.items.size () != theirs.items.size ())
                return false;
            for (size_t i = 0; i != mine.items.size (); ++i)
                if (find_item (theirs, mine.items[i]) < 0)
                    return false;
            return true;
        }
        case type_map: {
            const indexed_t &mine = indexed ();
            const indexed_t &theirs = other_.indexed ();
            if (mine.items.size () != theirs.items.size ())
                return false;
            for (size_t i = 0; i != mine.keys.size (); ++i) {
                const ptrdiff_t pos = find_key (theirs, mine.keys[i]);
                if (pos < 0 || theirs.items[pos] != mine.items[i])
                    return false;
            }
            return true;
        }
    }
    return false;
}

size_t zwire::value_t::hash () const
{
    size_t seed = static_cast<size_t> (_type);

    switch (_type) {
        case type_null:
            break;
        case type_boolean:
            seed = hash_combine (seed, boolean () ? 1 : 0);
            break;
        case type_integer:
            seed = hash_combine (seed, std::hash<int64_t> () (integer ()));
            break;
        case type_float:
            seed =
              hash_combine (seed, std::hash<uint64_t> () (float_bits (floating ())));
            break;
        case type_simple_string:
        case type_string:
        case type_err:
            seed = hash_combine (seed, std::hash<std::string> () (bytes ()));
            break;
        case type_array:
        case type_set: {
            const std::vector<value_t> &items = sequence ().items;
            for (size_t i = 0; i != items.size (); ++i)
                seed = hash_combine (seed, items[i].hash ());
            break;
        }
        case type_unordered_set: {
            //  Order-independent.
            const std::vector<value_t> &items = indexed ().items;
            size_t sum = 0;
            for (size_t i = 0; i != items.size (); ++i)
                sum += items[i].hash ();
            seed = hash_combine (seed, sum);
            break;
        }
        case type_map: {
            const indexed_t &map = indexed ();
            size_t sum = 0;
            for (size_t i = 0; i != map.keys.size (); ++i)
                sum += hash_combine (std::hash<std::string> () (map.keys[i]),
                                     map.items[i].hash ());
            seed = hash_combine (seed, sum);
            break;
        }
    }
    return seed;
}

const char *zwire::value_t::type_name (type_t type_)
{
    switch (type_) {
        case type_simple_string:
            return "simple_string";
        case type_string:
            return "string";
        case type_integer:
            return "integer";
        case type_float:
            return "float";
        case type_boolean:
            return "boolean";
        case type_null:
            return "null";
        case type_array:
            return "array";
        case type_map:
            return "map";
        case type_set:
            return "set";
        case type_unordered_set:
            return "unordered_set";
        case type_err:
            return "err";
    }
    return "unknown";
}
