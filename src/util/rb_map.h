/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <map>
#include <set>
#include "util/optional.h"

namespace obligo {
/** \brief Adapter that turns a three-way comparator (returning -1, 0, 1) into a strict weak ordering. */
template<typename K, typename CMP>
struct rb_less {
    bool operator()(K const & k1, K const & k2) const { return CMP()(k1, k2) < 0; }
};

/** \brief Ordered set with value semantics. */
template<typename T, typename CMP>
class rb_tree {
    typedef std::set<T, rb_less<T, CMP>> set;
    set m_set;
public:
    typedef typename set::const_iterator iterator;
    bool empty() const { return m_set.empty(); }
    unsigned size() const { return m_set.size(); }
    void clear() { m_set.clear(); }
    void insert(T const & v) { m_set.insert(v); }
    void erase(T const & v) { m_set.erase(v); }
    bool contains(T const & v) const { return m_set.find(v) != m_set.end(); }
    T const * find(T const & v) const {
        auto it = m_set.find(v);
        return it == m_set.end() ? nullptr : &*it;
    }
    iterator begin() const { return m_set.begin(); }
    iterator end() const { return m_set.end(); }
    template<typename F> void for_each(F && f) const {
        for (T const & v : m_set)
            f(v);
    }
    friend bool operator==(rb_tree const & t1, rb_tree const & t2) { return t1.m_set == t2.m_set; }
    friend bool operator!=(rb_tree const & t1, rb_tree const & t2) { return !(t1 == t2); }
};

/** \brief Ordered map with value semantics. */
template<typename K, typename T, typename CMP>
class rb_map {
    typedef std::map<K, T, rb_less<K, CMP>> map;
    map m_map;
public:
    typedef typename map::const_iterator iterator;
    bool empty() const { return m_map.empty(); }
    unsigned size() const { return m_map.size(); }
    void clear() { m_map.clear(); }
    void insert(K const & k, T const & v) {
        auto it = m_map.find(k);
        if (it == m_map.end())
            m_map.insert(std::make_pair(k, v));
        else
            it->second = v;
    }
    void erase(K const & k) { m_map.erase(k); }
    bool contains(K const & k) const { return m_map.find(k) != m_map.end(); }
    T const * find(K const & k) const {
        auto it = m_map.find(k);
        return it == m_map.end() ? nullptr : &(it->second);
    }
    T * find(K const & k) {
        auto it = m_map.find(k);
        return it == m_map.end() ? nullptr : &(it->second);
    }
    optional<T> find_opt(K const & k) const {
        if (T const * v = find(k))
            return optional<T>(*v);
        return optional<T>();
    }
    iterator begin() const { return m_map.begin(); }
    iterator end() const { return m_map.end(); }
    template<typename F> void for_each(F && f) const {
        for (auto const & p : m_map)
            f(p.first, p.second);
    }
};
}
