/*
Copyright (c) 2014 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <memory>
#include <string>
#include "util/sstream.h"
#include "util/exception.h"
#include "kernel/expr.h"

namespace obligo {
/** \brief Exception that may refer to the term it is about. */
class generic_exception : public exception {
protected:
    optional<expr> m_ref;
public:
    generic_exception(optional<expr> const & ref, char const * msg):exception(msg), m_ref(ref) {}
    generic_exception(optional<expr> const & ref, std::string const & msg):exception(msg), m_ref(ref) {}
    generic_exception(optional<expr> const & ref, sstream const & strm):exception(strm), m_ref(ref) {}
    explicit generic_exception(char const * msg):generic_exception(none_expr(), msg) {}
    explicit generic_exception(std::string const & msg):generic_exception(none_expr(), msg) {}
    explicit generic_exception(sstream const & strm):generic_exception(none_expr(), strm) {}
    generic_exception(expr const & ref, char const * msg):generic_exception(some_expr(ref), msg) {}
    generic_exception(expr const & ref, sstream const & strm):generic_exception(some_expr(ref), strm) {}

    optional<expr> const & get_ref() const { return m_ref; }
    virtual throwable * clone() const override { return new generic_exception(m_ref, m_msg); }
    virtual void rethrow() const override { throw *this; }
};

/** \brief Exception that wraps the exception that caused it. */
class nested_exception : public generic_exception {
protected:
    std::shared_ptr<throwable> m_exception;
    mutable std::string        m_what_buffer;
public:
    nested_exception(optional<expr> const & ref, std::string const & msg, throwable const & ex):
        generic_exception(ref, msg), m_exception(std::shared_ptr<throwable>(ex.clone())) {}
    nested_exception(optional<expr> const & ref, sstream const & strm, throwable const & ex):
        nested_exception(ref, strm.str(), ex) {}
    explicit nested_exception(char const * msg, throwable const & ex):
        nested_exception(none_expr(), std::string(msg), ex) {}
    explicit nested_exception(sstream const & strm, throwable const & ex):
        nested_exception(none_expr(), strm.str(), ex) {}
    virtual ~nested_exception() noexcept {}

    throwable const & get_exception() const { return *m_exception; }
    virtual char const * what() const noexcept override;
    virtual throwable * clone() const override;
    virtual void rethrow() const override { throw *this; }
};
}
