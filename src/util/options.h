/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <iostream>
#include <string>
#include <vector>
#include "util/name_map.h"
#include "util/exception.h"

namespace obligo {
enum option_kind { BoolOption, UnsignedOption, StringOption };

std::ostream & operator<<(std::ostream & out, option_kind k);

/** \brief Configuration options. Objects of this class are immutable, the update methods return a new object. */
class options {
    struct value {
        option_kind m_kind;
        bool        m_bool;
        unsigned    m_unsigned;
        std::string m_string;
        value():m_kind(BoolOption), m_bool(false), m_unsigned(0) {}
    };
    name_map<value> m_values;
    value const * find(name const & n, option_kind k) const;
public:
    options() {}
    options(name const & n, bool v) { *this = update(n, v); }
    options(name const & n, unsigned v) { *this = update(n, v); }
    options(name const & n, char const * v) { *this = update(n, v); }

    bool empty() const { return m_values.empty(); }
    unsigned size() const { return m_values.size(); }
    bool contains(name const & n) const { return m_values.contains(n); }

    bool get_bool(name const & n, bool default_value = false) const;
    unsigned get_unsigned(name const & n, unsigned default_value = 0) const;
    std::string get_string(name const & n, std::string const & default_value = std::string()) const;

    options update(name const & n, bool v) const;
    options update(name const & n, unsigned v) const;
    options update(name const & n, char const * v) const;
    options update(name const & n, std::string const & v) const { return update(n, v.c_str()); }
    options update_if_undef(name const & n, bool v) const {
        return contains(n) ? *this : update(n, v);
    }
    options erase(name const & n) const;

    /** \brief Combine options, the ones in \c o take precedence. */
    friend options join(options const & opts1, options const & opts2);

    template<typename F> void for_each(F && fn) const {
        m_values.for_each([&](name const & n, value const &) { fn(n); });
    }

    friend std::ostream & operator<<(std::ostream & out, options const & o);
};

/** \brief Exception raised when an option is used with a value of the wrong kind or is not declared. */
class option_exception : public exception {
public:
    option_exception(std::string const & msg):exception(msg) {}
    option_exception(sstream const & strm):exception(strm) {}
    virtual throwable * clone() const override { return new option_exception(m_msg); }
    virtual void rethrow() const override { throw *this; }
};

class option_declaration {
    name        m_name;
    option_kind m_kind;
    std::string m_default;
    std::string m_description;
public:
    option_declaration(name const & n, option_kind k, char const * default_val, char const * descr):
        m_name(n), m_kind(k), m_default(default_val), m_description(descr) {}
    name const & get_name() const { return m_name; }
    option_kind kind() const { return m_kind; }
    std::string const & get_default_value() const { return m_default; }
    std::string const & get_description() const { return m_description; }
};

typedef name_map<option_declaration> option_declarations;

/** \brief Register a new option, every module declares its options at initialization time. */
void register_option(name const & n, option_kind k, char const * default_value, char const * description);
option_declarations const & get_option_declarations();

/** \brief Update \c opts with the string value \c v for the declared option \c n.
    Throws option_exception if \c n was not declared or \c v is not a valid value of its kind. */
options set_option_from_string(options const & opts, name const & n, std::string const & v);

void initialize_options();
void finalize_options();
}
