/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <initializer_list>
#include <iterator>
#include <memory>
#include <vector>
#include "util/debug.h"

namespace obligo {
/** \brief Basic functional list. Cells are shared between lists. */
template<typename T>
class list {
    struct cell;
    std::shared_ptr<cell const> m_ptr;
public:
    list() {}
    list(T const & h, list const & t):m_ptr(std::make_shared<cell>(h, t)) {}
    explicit list(T const & h):list(h, list()) {}
    list(std::initializer_list<T> const & l) {
        auto it = l.end();
        while (it != l.begin()) {
            --it;
            *this = list(*it, *this);
        }
    }

    explicit operator bool() const { return static_cast<bool>(m_ptr); }

    friend bool is_nil(list const & l) { return !l.m_ptr; }
    friend T const & head(list const & l) { obligo_assert(!is_nil(l)); return l.m_ptr->m_head; }
    friend list const & tail(list const & l) { obligo_assert(!is_nil(l)); return l.m_ptr->m_tail; }
    /** \brief Pointer equality */
    friend bool is_eqp(list const & l1, list const & l2) { return l1.m_ptr == l2.m_ptr; }

    class iterator {
        friend class list;
        cell const * m_it;
        explicit iterator(cell const * it):m_it(it) {}
    public:
        typedef std::forward_iterator_tag iterator_category;
        typedef T                         value_type;
        typedef std::ptrdiff_t            difference_type;
        typedef T const *                 pointer;
        typedef T const &                 reference;
        iterator & operator++() { m_it = m_it->m_tail.m_ptr.get(); return *this; }
        iterator operator++(int) { iterator tmp(*this); operator++(); return tmp; }
        bool operator==(iterator const & s) const { return m_it == s.m_it; }
        bool operator!=(iterator const & s) const { return !operator==(s); }
        T const & operator*() const { return m_it->m_head; }
        T const * operator->() const { return &(m_it->m_head); }
    };

    iterator begin() const { return iterator(m_ptr.get()); }
    iterator end() const { return iterator(nullptr); }

    friend bool operator==(list const & l1, list const & l2) {
        auto it1 = l1.begin();
        auto it2 = l2.begin();
        for (; it1 != l1.end() && it2 != l2.end(); ++it1, ++it2) {
            if (!(*it1 == *it2))
                return false;
        }
        return it1 == l1.end() && it2 == l2.end();
    }
    friend bool operator!=(list const & l1, list const & l2) { return !(l1 == l2); }
};

template<typename T>
struct list<T>::cell {
    T       m_head;
    list<T> m_tail;
    cell(T const & h, list<T> const & t):m_head(h), m_tail(t) {}
};

template<typename T> inline list<T> cons(T const & h, list<T> const & t) { return list<T>(h, t); }

template<typename T> unsigned length(list<T> const & l) {
    unsigned r = 0;
    for (auto it = l.begin(); it != l.end(); ++it)
        r++;
    return r;
}

template<typename T> list<T> to_list(std::vector<T> const & v) {
    list<T> r;
    for (auto it = v.rbegin(); it != v.rend(); ++it)
        r = cons(*it, r);
    return r;
}

template<typename T> std::vector<T> to_vector(list<T> const & l) {
    return std::vector<T>(l.begin(), l.end());
}

template<typename T> list<T> append(list<T> const & l1, list<T> const & l2) {
    if (is_nil(l1))
        return l2;
    if (is_nil(l2))
        return l1;
    std::vector<T> tmp(l1.begin(), l1.end());
    list<T> r = l2;
    for (auto it = tmp.rbegin(); it != tmp.rend(); ++it)
        r = cons(*it, r);
    return r;
}
}
