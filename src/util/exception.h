/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <exception>
#include <string>

namespace obligo {
class sstream;
/** \brief Base class for all exceptions thrown by obligo. */
class throwable : public std::exception {
protected:
    std::string m_msg;
    throwable() {}
public:
    throwable(char const * msg);
    throwable(std::string const & msg);
    throwable(sstream const & strm);
    virtual ~throwable() noexcept;
    virtual char const * what() const noexcept override;
    virtual throwable * clone() const { return new throwable(m_msg); }
    virtual void rethrow() const { throw *this; }
};

/** \brief Base class for exceptions that describe errors the user can recover from. */
class exception : public throwable {
protected:
    exception() {}
public:
    exception(char const * msg):throwable(msg) {}
    exception(std::string const & msg):throwable(msg) {}
    exception(sstream const & strm):throwable(strm) {}
    virtual throwable * clone() const override { return new exception(m_msg); }
    virtual void rethrow() const override { throw *this; }
};

/** \brief Raised by obligo_unreachable and failed assertions. */
class unreachable_reached : public throwable {
public:
    unreachable_reached():throwable("unreachable code was reached") {}
    virtual throwable * clone() const override { return new unreachable_reached(); }
    virtual void rethrow() const override { throw *this; }
};
}
