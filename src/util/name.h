/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <functional>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <string>
#include "util/optional.h"

namespace obligo {
enum class name_kind { ANONYMOUS, STRING, NUMERAL };
/** \brief Hierarchical names. */
class name {
    struct imp;
    std::shared_ptr<imp const> m_ptr;
    explicit name(std::shared_ptr<imp const> const & ptr):m_ptr(ptr) {}
public:
    name();
    name(char const * n);
    name(std::string const & s):name(s.c_str()) {}
    name(name const & prefix, char const * n);
    name(name const & prefix, std::string const & s):name(prefix, s.c_str()) {}
    name(name const & prefix, unsigned k);
    name(std::initializer_list<char const *> const & l);
    static name const & anonymous();

    name_kind kind() const;
    bool is_anonymous() const { return kind() == name_kind::ANONYMOUS; }
    bool is_string() const { return kind() == name_kind::STRING; }
    bool is_numeral() const { return kind() == name_kind::NUMERAL; }
    explicit operator bool() const { return !is_anonymous(); }
    /** \brief Return true iff the name is of the form <tt>s</tt> or <tt>k</tt> */
    bool is_atomic() const;
    name get_prefix() const;
    char const * get_string() const;
    unsigned get_numeral() const;
    unsigned hash() const;
    /** \brief Size of the this name (in characters) when using the given separator. */
    size_t size() const;
    std::string to_string(char const * sep = ".") const;
    std::string escape(char const * sep = ".") const { return to_string(sep); }

    /** \brief Given a name of the form a_1.a_2. ... .a_k, return a_1 */
    name get_root() const;
    /** \brief Append \c s to the last component of this name: <tt>foo</tt> becomes <tt>foo<s></tt> */
    name append_after(char const * s) const;
    /** \brief Append \c i to the last component of this name: <tt>foo</tt> becomes <tt>foo_<i></tt> */
    name append_after(unsigned i) const;
    /** \brief If prefix is a prefix of this name, then replace it with new_prefix. */
    name replace_prefix(name const & prefix, name const & new_prefix) const;

    friend int cmp(name const & a, name const & b);
    friend bool operator==(name const & a, name const & b);
    friend bool operator!=(name const & a, name const & b) { return !(a == b); }
    friend bool operator<(name const & a, name const & b) { return cmp(a, b) < 0; }
    friend bool operator>(name const & a, name const & b) { return cmp(a, b) > 0; }
    friend bool is_eqp(name const & a, name const & b) { return a.m_ptr == b.m_ptr; }
    /** \brief Concatenate the two given names. */
    friend name operator+(name const & n1, name const & n2);
    friend std::ostream & operator<<(std::ostream & out, name const & n);
};

/** \brief Return true iff \c n1 is a prefix of \c n2. */
bool is_prefix_of(name const & n1, name const & n2);

struct name_hash { unsigned operator()(name const & n) const { return n.hash(); } };
struct name_eq { bool operator()(name const & n1, name const & n2) const { return n1 == n2; } };
struct name_cmp { int operator()(name const & n1, name const & n2) const { return cmp(n1, n2); } };
struct name_quick_cmp {
    int operator()(name const & n1, name const & n2) const {
        if (n1.hash() != n2.hash())
            return n1.hash() < n2.hash() ? -1 : 1;
        return cmp(n1, n2);
    }
};

inline optional<name> optional_name(name const & n) { return optional<name>(n); }
}
