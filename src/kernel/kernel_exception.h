/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <string>
#include "util/exception.h"
#include "util/sstream.h"
#include "kernel/expr.h"

namespace obligo {
/** \brief Base class for all kernel exceptions. */
class kernel_exception : public exception {
public:
    kernel_exception(char const * msg):exception(msg) {}
    kernel_exception(std::string const & msg):exception(msg) {}
    kernel_exception(sstream const & strm):exception(strm) {}
    virtual throwable * clone() const override { return new kernel_exception(m_msg); }
    virtual void rethrow() const override { throw *this; }
};

class unknown_constant_exception : public kernel_exception {
    name m_name;
public:
    unknown_constant_exception(name const & n):
        kernel_exception(sstream() << "unknown declaration '" << n << "'"), m_name(n) {}
    name const & get_name() const { return m_name; }
    virtual throwable * clone() const override { return new unknown_constant_exception(m_name); }
    virtual void rethrow() const override { throw *this; }
};

class already_declared_exception : public kernel_exception {
    name m_name;
public:
    already_declared_exception(name const & n):
        kernel_exception(sstream() << "invalid declaration, '" << n << "' has already been declared"), m_name(n) {}
    name const & get_name() const { return m_name; }
    virtual throwable * clone() const override { return new already_declared_exception(m_name); }
    virtual void rethrow() const override { throw *this; }
};

class definition_type_mismatch_exception : public kernel_exception {
    name m_name;
    expr m_given_type;
public:
    definition_type_mismatch_exception(name const & n, expr const & given_type, expr const & expected):
        kernel_exception(sstream() << "type mismatch at definition '" << n << "', has type\n  " << given_type
                         << "\nbut is expected to have type\n  " << expected),
        m_name(n), m_given_type(given_type) {}
    name const & get_name() const { return m_name; }
    expr const & get_given_type() const { return m_given_type; }
    virtual throwable * clone() const override { return new definition_type_mismatch_exception(*this); }
    virtual void rethrow() const override { throw *this; }
};

class undeclared_universe_exception : public kernel_exception {
    name m_univ;
public:
    undeclared_universe_exception(name const & decl, name const & u):
        kernel_exception(sstream() << "invalid declaration '" << decl << "', undeclared universe parameter '"
                         << u << "'"), m_univ(u) {}
    name const & get_universe() const { return m_univ; }
    virtual throwable * clone() const override { return new undeclared_universe_exception(*this); }
    virtual void rethrow() const override { throw *this; }
};
}
