/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <cstring>
#include <sstream>
#include <string>
#include <vector>
#include "util/debug.h"
#include "util/exception.h"
#include "util/name.h"

namespace obligo {
static unsigned hash_str(char const * str, unsigned init_value) {
    unsigned h = init_value;
    for (char const * it = str; *it; ++it)
        h = h * 31 + static_cast<unsigned char>(*it);
    return h;
}

static unsigned hash(unsigned h1, unsigned h2) {
    h2 -= h1; h2 ^= (h1 << 8);
    return h2;
}

struct name::imp {
    name_kind   m_kind;
    name        m_prefix;
    std::string m_str;
    unsigned    m_k;
    unsigned    m_hash;
    imp(name const & prefix, char const * s):
        m_kind(name_kind::STRING), m_prefix(prefix), m_str(s), m_k(0) {
        m_hash = hash_str(s, prefix.hash());
    }
    imp(name const & prefix, unsigned k):
        m_kind(name_kind::NUMERAL), m_prefix(prefix), m_k(k) {
        m_hash = ::obligo::hash(prefix.hash(), k);
    }
};

name::name() {}

name::name(name const & prefix, char const * n):
    m_ptr(std::make_shared<imp>(prefix, n)) {
}

name::name(name const & prefix, unsigned k):
    m_ptr(std::make_shared<imp>(prefix, k)) {
}

name::name(char const * n):name(name(), n) {
}

name::name(std::initializer_list<char const *> const & l) {
    name r;
    for (char const * s : l)
        r = name(r, s);
    m_ptr = r.m_ptr;
}

name const & name::anonymous() {
    static name g_anonymous;
    return g_anonymous;
}

name_kind name::kind() const {
    return m_ptr ? m_ptr->m_kind : name_kind::ANONYMOUS;
}

bool name::is_atomic() const {
    return !m_ptr || m_ptr->m_prefix.is_anonymous();
}

name name::get_prefix() const {
    return m_ptr ? m_ptr->m_prefix : name();
}

char const * name::get_string() const {
    obligo_assert(is_string());
    return m_ptr->m_str.c_str();
}

unsigned name::get_numeral() const {
    obligo_assert(is_numeral());
    return m_ptr->m_k;
}

unsigned name::hash() const {
    return m_ptr ? m_ptr->m_hash : 11;
}

bool operator==(name const & a, name const & b) {
    if (a.m_ptr == b.m_ptr)
        return true;
    if (!a.m_ptr || !b.m_ptr)
        return false;
    if (a.m_ptr->m_hash != b.m_ptr->m_hash)
        return false;
    return cmp(a, b) == 0;
}

int cmp(name const & a, name const & b) {
    if (a.m_ptr == b.m_ptr)
        return 0;
    std::vector<name::imp const *> limbs1, limbs2;
    for (name::imp const * it = a.m_ptr.get(); it; it = it->m_prefix.m_ptr.get())
        limbs1.push_back(it);
    for (name::imp const * it = b.m_ptr.get(); it; it = it->m_prefix.m_ptr.get())
        limbs2.push_back(it);
    auto it1 = limbs1.rbegin();
    auto it2 = limbs2.rbegin();
    for (; it1 != limbs1.rend() && it2 != limbs2.rend(); ++it1, ++it2) {
        name::imp const * i1 = *it1;
        name::imp const * i2 = *it2;
        if (i1 == i2)
            continue;
        if (i1->m_kind != i2->m_kind)
            return i1->m_kind == name_kind::STRING ? 1 : -1;
        if (i1->m_kind == name_kind::STRING) {
            int c = i1->m_str.compare(i2->m_str);
            if (c != 0)
                return c < 0 ? -1 : 1;
        } else if (i1->m_k != i2->m_k) {
            return i1->m_k < i2->m_k ? -1 : 1;
        }
    }
    if (it1 == limbs1.rend() && it2 == limbs2.rend())
        return 0;
    return it1 == limbs1.rend() ? -1 : 1;
}

static void display_core(std::ostream & out, name const & n, char const * sep) {
    if (n.is_anonymous())
        return;
    if (!n.get_prefix().is_anonymous()) {
        display_core(out, n.get_prefix(), sep);
        out << sep;
    }
    if (n.is_string())
        out << n.get_string();
    else
        out << n.get_numeral();
}

std::string name::to_string(char const * sep) const {
    if (is_anonymous())
        return "[anonymous]";
    std::ostringstream out;
    display_core(out, *this, sep);
    return out.str();
}

size_t name::size() const {
    return to_string().size();
}

std::ostream & operator<<(std::ostream & out, name const & n) {
    if (n.is_anonymous())
        out << "[anonymous]";
    else
        display_core(out, n, ".");
    return out;
}

name operator+(name const & n1, name const & n2) {
    if (n2.is_anonymous()) {
        return n1;
    } else if (n1.is_anonymous()) {
        return n2;
    } else {
        name prefix = n1 + n2.get_prefix();
        if (n2.is_string())
            return name(prefix, n2.get_string());
        else
            return name(prefix, n2.get_numeral());
    }
}

name name::get_root() const {
    name n = *this;
    while (!n.is_atomic())
        n = n.get_prefix();
    return n;
}

name name::append_after(char const * s) const {
    if (is_anonymous()) {
        return name(s);
    } else if (is_string()) {
        return name(get_prefix(), (std::string(get_string()) + std::string(s)).c_str());
    } else {
        return name(*this, s);
    }
}

name name::append_after(unsigned i) const {
    std::ostringstream s;
    s << "_" << i;
    return append_after(s.str().c_str());
}

name name::replace_prefix(name const & prefix, name const & new_prefix) const {
    if (*this == prefix)
        return new_prefix;
    if (is_anonymous())
        return *this;
    name p = get_prefix().replace_prefix(prefix, new_prefix);
    if (is_string())
        return name(p, get_string());
    else
        return name(p, get_numeral());
}

bool is_prefix_of(name const & n1, name const & n2) {
    if (n1.is_anonymous())
        return true;
    name it = n2;
    while (true) {
        if (it == n1)
            return true;
        if (it.is_anonymous())
            return false;
        it = it.get_prefix();
    }
}
}
