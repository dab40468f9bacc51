/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <new>
#include <utility>
#include "util/debug.h"

namespace obligo {
/** \brief Container that may or may not hold a value of type T. */
template<typename T>
class optional {
    bool m_some;
    union {
        T m_value;
    };
public:
    optional():m_some(false) {}
    optional(optional const & other):m_some(other.m_some) {
        if (m_some)
            new (&m_value) T(other.m_value);
    }
    optional(optional && other):m_some(other.m_some) {
        if (other.m_some)
            new (&m_value) T(std::move(other.m_value));
    }
    explicit optional(T const & v):m_some(true) {
        new (&m_value) T(v);
    }
    explicit optional(T && v):m_some(true) {
        new (&m_value) T(std::move(v));
    }
    ~optional() {
        if (m_some)
            m_value.~T();
    }

    explicit operator bool() const { return m_some; }
    T const * operator->() const { obligo_assert(m_some); return &m_value; }
    T * operator->() { obligo_assert(m_some); return &m_value; }
    T const & operator*() const { obligo_assert(m_some); return m_value; }
    T & operator*() { obligo_assert(m_some); return m_value; }
    T const & value() const { obligo_assert(m_some); return m_value; }
    T & value() { obligo_assert(m_some); return m_value; }

    void reset() {
        if (m_some)
            m_value.~T();
        m_some = false;
    }

    optional & operator=(optional const & other) {
        if (this == &other)
            return *this;
        reset();
        if (other.m_some) {
            new (&m_value) T(other.m_value);
            m_some = true;
        }
        return *this;
    }
    optional & operator=(optional && other) {
        obligo_assert(this != &other);
        reset();
        if (other.m_some) {
            new (&m_value) T(std::move(other.m_value));
            m_some = true;
        }
        return *this;
    }
    optional & operator=(T const & other) {
        reset();
        new (&m_value) T(other);
        m_some = true;
        return *this;
    }
    optional & operator=(T && other) {
        reset();
        new (&m_value) T(std::move(other));
        m_some = true;
        return *this;
    }

    friend bool operator==(optional const & o1, optional const & o2) {
        if (o1.m_some != o2.m_some)
            return false;
        else
            return !o1.m_some || o1.m_value == o2.m_value;
    }
    friend bool operator!=(optional const & o1, optional const & o2) {
        return !operator==(o1, o2);
    }
};

template<typename T> optional<T> some(T const & t) { return optional<T>(t); }
}
