/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <string>
#include "util/sstream.h"
#include "util/exception.h"
#include "util/options.h"

namespace obligo {
static option_declarations * g_option_declarations = nullptr;

std::ostream & operator<<(std::ostream & out, option_kind k) {
    switch (k) {
    case BoolOption:     out << "Bool"; break;
    case UnsignedOption: out << "Unsigned Int"; break;
    case StringOption:   out << "String"; break;
    }
    return out;
}

options::value const * options::find(name const & n, option_kind k) const {
    value const * v = m_values.find(n);
    if (v && v->m_kind != k)
        throw option_exception(sstream() << "option '" << n << "' was set with a value of kind " << v->m_kind
                               << ", but it is used as " << k);
    return v;
}

bool options::get_bool(name const & n, bool default_value) const {
    if (value const * v = find(n, BoolOption))
        return v->m_bool;
    return default_value;
}

unsigned options::get_unsigned(name const & n, unsigned default_value) const {
    if (value const * v = find(n, UnsignedOption))
        return v->m_unsigned;
    return default_value;
}

std::string options::get_string(name const & n, std::string const & default_value) const {
    if (value const * v = find(n, StringOption))
        return v->m_string;
    return default_value;
}

options options::update(name const & n, bool b) const {
    options r(*this);
    value v;
    v.m_kind = BoolOption;
    v.m_bool = b;
    r.m_values.insert(n, v);
    return r;
}

options options::update(name const & n, unsigned k) const {
    options r(*this);
    value v;
    v.m_kind     = UnsignedOption;
    v.m_unsigned = k;
    r.m_values.insert(n, v);
    return r;
}

options options::update(name const & n, char const * s) const {
    options r(*this);
    value v;
    v.m_kind   = StringOption;
    v.m_string = s;
    r.m_values.insert(n, v);
    return r;
}

options options::erase(name const & n) const {
    options r(*this);
    r.m_values.erase(n);
    return r;
}

options join(options const & opts1, options const & opts2) {
    options r(opts1);
    opts2.m_values.for_each([&](name const & n, options::value const & v) {
            r.m_values.insert(n, v);
        });
    return r;
}

std::ostream & operator<<(std::ostream & out, options const & o) {
    out << "(";
    bool first = true;
    o.m_values.for_each([&](name const & n, options::value const & v) {
            if (!first) out << " ";
            first = false;
            out << n << " := ";
            switch (v.m_kind) {
            case BoolOption:     out << (v.m_bool ? "true" : "false"); break;
            case UnsignedOption: out << v.m_unsigned; break;
            case StringOption:   out << "\"" << v.m_string << "\""; break;
            }
        });
    out << ")";
    return out;
}

void register_option(name const & n, option_kind k, char const * default_value, char const * description) {
    g_option_declarations->insert(n, option_declaration(n, k, default_value, description));
}

option_declarations const & get_option_declarations() {
    return *g_option_declarations;
}

options set_option_from_string(options const & opts, name const & n, std::string const & v) {
    option_declaration const * d = g_option_declarations->find(n);
    if (!d)
        throw option_exception(sstream() << "unknown option '" << n << "'");
    switch (d->kind()) {
    case BoolOption:
        if (v == "true")
            return opts.update(n, true);
        else if (v == "false")
            return opts.update(n, false);
        break;
    case UnsignedOption: {
        if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos)
            break;
        return opts.update(n, static_cast<unsigned>(std::stoul(v)));
    }
    case StringOption:
        return opts.update(n, v);
    }
    throw option_exception(sstream() << "invalid value '" << v << "' for option '" << n
                           << "', value of kind " << d->kind() << " expected");
}

void initialize_options() {
    g_option_declarations = new option_declarations();
}

void finalize_options() {
    delete g_option_declarations;
}
}
