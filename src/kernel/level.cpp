/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <algorithm>
#include <vector>
#include "util/debug.h"
#include "util/pair.h"
#include "kernel/level.h"

namespace obligo {
struct level::cell {
    level_kind m_kind;
    unsigned   m_hash;
    level      m_l1;
    level      m_l2;
    name       m_id;
    cell(level_kind k, unsigned h):m_kind(k), m_hash(h) {}
};

static level * g_level_zero = nullptr;
static level * g_level_one  = nullptr;

/* The null cell represents universe zero. */
level::level() {}

level_kind level::kind() const { return m_ptr ? m_ptr->m_kind : level_kind::Zero; }
unsigned level::hash() const { return m_ptr ? m_ptr->m_hash : 7; }

level const & succ_of(level const & l) { obligo_assert(is_succ(l)); return l.m_ptr->m_l1; }
level const & max_lhs(level const & l) { obligo_assert(is_max(l)); return l.m_ptr->m_l1; }
level const & max_rhs(level const & l) { obligo_assert(is_max(l)); return l.m_ptr->m_l2; }
level const & imax_lhs(level const & l) { obligo_assert(is_imax(l)); return l.m_ptr->m_l1; }
level const & imax_rhs(level const & l) { obligo_assert(is_imax(l)); return l.m_ptr->m_l2; }
name const & param_id(level const & l) { obligo_assert(is_param(l)); return l.m_ptr->m_id; }

static unsigned hash(unsigned h1, unsigned h2) {
    return h1 * 31 + h2 + 0x9e3779b9u;
}

level const & mk_level_zero() { return *g_level_zero; }
level const & mk_level_one() { return *g_level_one; }

level mk_succ(level const & l) {
    auto c  = std::make_shared<level::cell>(level_kind::Succ, hash(l.hash(), 11));
    c->m_l1 = l;
    return level(c);
}

level mk_max_core(level const & l1, level const & l2) {
    auto c  = std::make_shared<level::cell>(level_kind::Max, hash(hash(l1.hash(), l2.hash()), 13));
    c->m_l1 = l1;
    c->m_l2 = l2;
    return level(c);
}

level mk_imax_core(level const & l1, level const & l2) {
    auto c  = std::make_shared<level::cell>(level_kind::IMax, hash(hash(l1.hash(), l2.hash()), 17));
    c->m_l1 = l1;
    c->m_l2 = l2;
    return level(c);
}

level mk_univ_param(name const & n) {
    auto c  = std::make_shared<level::cell>(level_kind::Param, hash(n.hash(), 19));
    c->m_id = n;
    return level(c);
}

bool operator==(level const & l1, level const & l2) {
    if (is_eqp(l1, l2))
        return true;
    if (l1.kind() != l2.kind() || l1.hash() != l2.hash())
        return false;
    switch (l1.kind()) {
    case level_kind::Zero:
        return true;
    case level_kind::Param:
        return param_id(l1) == param_id(l2);
    case level_kind::Succ:
        return succ_of(l1) == succ_of(l2);
    case level_kind::Max: case level_kind::IMax:
        return l1.m_ptr->m_l1 == l2.m_ptr->m_l1 && l1.m_ptr->m_l2 == l2.m_ptr->m_l2;
    }
    obligo_unreachable();
}

bool is_not_zero(level const & l) {
    switch (l.kind()) {
    case level_kind::Zero: case level_kind::Param:
        return false;
    case level_kind::Succ:
        return true;
    case level_kind::Max:
        return is_not_zero(max_lhs(l)) || is_not_zero(max_rhs(l));
    case level_kind::IMax:
        return is_not_zero(imax_rhs(l));
    }
    obligo_unreachable();
}

level mk_max(level const & l1, level const & l2) {
    if (is_zero(l1))
        return l2;
    if (is_zero(l2) || l1 == l2)
        return l1;
    if (is_max(l2) && (max_lhs(l2) == l1 || max_rhs(l2) == l1))
        return l2;
    return mk_max_core(l1, l2);
}

level mk_imax(level const & l1, level const & l2) {
    if (is_not_zero(l2))
        return mk_max(l1, l2);
    if (is_zero(l2) || is_zero(l1) || l1 == l2)
        return l2;
    return mk_imax_core(l1, l2);
}

/** \brief Split \c l into a base level and a number of successors. */
static pair<level, unsigned> to_offset(level l) {
    unsigned k = 0;
    while (is_succ(l)) {
        l = succ_of(l);
        k++;
    }
    return mk_pair(l, k);
}

static level mk_succ(level l, unsigned k) {
    while (k > 0) {
        l = mk_succ(l);
        k--;
    }
    return l;
}

static void push_max_args(level const & l, std::vector<level> & r) {
    if (is_max(l)) {
        push_max_args(max_lhs(l), r);
        push_max_args(max_rhs(l), r);
    } else {
        r.push_back(l);
    }
}

static int kind_rank(level const & l) {
    return static_cast<int>(l.kind());
}

static bool is_norm_lt(level const & l1, level const & l2) {
    auto p1 = to_offset(l1);
    auto p2 = to_offset(l2);
    level const & a = p1.first;
    level const & b = p2.first;
    if (a != b) {
        if (a.kind() != b.kind())
            return kind_rank(a) < kind_rank(b);
        switch (a.kind()) {
        case level_kind::Zero: case level_kind::Succ:
            obligo_unreachable();
        case level_kind::Param:
            return param_id(a) < param_id(b);
        case level_kind::Max: case level_kind::IMax:
            if (a.kind() == level_kind::Max) {
                if (max_lhs(a) != max_lhs(b))
                    return is_norm_lt(max_lhs(a), max_lhs(b));
                return is_norm_lt(max_rhs(a), max_rhs(b));
            } else {
                if (imax_lhs(a) != imax_lhs(b))
                    return is_norm_lt(imax_lhs(a), imax_lhs(b));
                return is_norm_lt(imax_rhs(a), imax_rhs(b));
            }
        }
        obligo_unreachable();
    }
    return p1.second < p2.second;
}

level normalize(level const & l) {
    auto p = to_offset(l);
    level const & r = p.first;
    switch (r.kind()) {
    case level_kind::Zero: case level_kind::Param:
        return l;
    case level_kind::Succ:
        obligo_unreachable();
    case level_kind::IMax: {
        level l1 = normalize(imax_lhs(r));
        level l2 = normalize(imax_rhs(r));
        return mk_succ(mk_imax(l1, l2), p.second);
    }
    case level_kind::Max: {
        std::vector<level> todo;
        push_max_args(r, todo);
        std::vector<level> args;
        for (level const & a : todo)
            push_max_args(normalize(mk_succ(a, p.second)), args);
        std::stable_sort(args.begin(), args.end(), is_norm_lt);
        std::vector<level> rargs;
        for (unsigned i = 0; i < args.size(); i++) {
            level const & a = args[i];
            if (is_zero(a) && args.size() > 1)
                continue;
            /* max(l+k1, l+k2) with k1 < k2 is l+k2 */
            if (i + 1 < args.size() && to_offset(a).first == to_offset(args[i+1]).first)
                continue;
            rargs.push_back(a);
        }
        obligo_assert(!rargs.empty());
        level result = rargs.back();
        for (unsigned i = rargs.size() - 1; i > 0; i--)
            result = mk_max_core(rargs[i-1], result);
        return result;
    }
    }
    obligo_unreachable();
}

bool is_equivalent(level const & l1, level const & l2) {
    return l1 == l2 || normalize(l1) == normalize(l2);
}

void collect_univ_params(level const & l, name_set & s) {
    switch (l.kind()) {
    case level_kind::Zero:
        return;
    case level_kind::Param:
        s.insert(param_id(l));
        return;
    case level_kind::Succ:
        collect_univ_params(succ_of(l), s);
        return;
    case level_kind::Max:
        collect_univ_params(max_lhs(l), s);
        collect_univ_params(max_rhs(l), s);
        return;
    case level_kind::IMax:
        collect_univ_params(imax_lhs(l), s);
        collect_univ_params(imax_rhs(l), s);
        return;
    }
}

bool has_param(level const & l) {
    name_set s;
    collect_univ_params(l, s);
    return !s.empty();
}

template<typename F>
static level replace_params(level const & l, F const & fn) {
    switch (l.kind()) {
    case level_kind::Zero:
        return l;
    case level_kind::Param:
        if (auto r = fn(param_id(l)))
            return *r;
        return l;
    case level_kind::Succ:
        return mk_succ(replace_params(succ_of(l), fn));
    case level_kind::Max:
        return mk_max(replace_params(max_lhs(l), fn), replace_params(max_rhs(l), fn));
    case level_kind::IMax:
        return mk_imax(replace_params(imax_lhs(l), fn), replace_params(imax_rhs(l), fn));
    }
    obligo_unreachable();
}

level instantiate(level const & l, level_param_names const & ps, levels const & ls) {
    obligo_assert(length(ps) == length(ls));
    return replace_params(l, [&](name const & n) {
            auto it1 = ps.begin();
            auto it2 = ls.begin();
            for (; it1 != ps.end(); ++it1, ++it2) {
                if (*it1 == n)
                    return optional<level>(*it2);
            }
            return none_level();
        });
}

level instantiate(level const & l, name_map<level> const & s) {
    return replace_params(l, [&](name const & n) { return s.find_opt(n); });
}

static void print(std::ostream & out, level const & l, bool nested) {
    auto p = to_offset(l);
    level const & r = p.first;
    if (is_zero(r)) {
        out << p.second;
        return;
    }
    bool parens = nested && (p.second > 0 || is_max(r) || is_imax(r));
    if (parens) out << "(";
    switch (r.kind()) {
    case level_kind::Zero: case level_kind::Succ:
        obligo_unreachable();
    case level_kind::Param:
        out << param_id(r);
        break;
    case level_kind::Max:
        out << "max ";
        print(out, max_lhs(r), true);
        out << " ";
        print(out, max_rhs(r), true);
        break;
    case level_kind::IMax:
        out << "imax ";
        print(out, imax_lhs(r), true);
        out << " ";
        print(out, imax_rhs(r), true);
        break;
    }
    if (p.second > 0)
        out << "+" << p.second;
    if (parens) out << ")";
}

std::ostream & operator<<(std::ostream & out, level const & l) {
    print(out, l, false);
    return out;
}

std::ostream & operator<<(std::ostream & out, levels const & ls) {
    bool first = true;
    for (level const & l : ls) {
        if (!first) out << " ";
        first = false;
        print(out, l, true);
    }
    return out;
}

void initialize_level() {
    g_level_zero = new level();
    g_level_one  = new level(mk_succ(*g_level_zero));
}

void finalize_level() {
    delete g_level_one;
    delete g_level_zero;
}
}
