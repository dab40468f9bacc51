/*
Copyright (c) 2017 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.
*/
#include <algorithm>
#include <string>
#include <tuple>
#include <vector>
#include "util/sstream.h"
#include "kernel/universe_context.h"

namespace obligo {
bool operator==(univ_constraint const & c1, univ_constraint const & c2) {
    return c1.m_lhs == c2.m_lhs && c1.m_kind == c2.m_kind && c1.m_rhs == c2.m_rhs;
}

bool operator<(univ_constraint const & c1, univ_constraint const & c2) {
    if (c1.m_lhs != c2.m_lhs)
        return c1.m_lhs < c2.m_lhs;
    if (c1.m_rhs != c2.m_rhs)
        return c1.m_rhs < c2.m_rhs;
    return c1.m_kind < c2.m_kind;
}

std::ostream & operator<<(std::ostream & out, univ_constraint const & c) {
    out << c.m_lhs << (c.m_kind == univ_constraint_kind::Le ? " <= " : " < ") << c.m_rhs;
    return out;
}

/* Longest path semantics: dist(u, v) is the largest number of strict steps on a path from u to v,
   -1 when there is no path. */
typedef name_map<name_map<int>> distances;

static distances closure(std::vector<univ_constraint> const & cs) {
    distances d;
    auto update = [&](name const & u, name const & v, int w) {
        name_map<int> * row = d.find(u);
        if (!row) {
            d.insert(u, name_map<int>());
            row = d.find(u);
        }
        int const * old = row->find(v);
        if (!old || *old < w) {
            row->insert(v, w);
            return true;
        }
        return false;
    };
    for (univ_constraint const & c : cs)
        update(c.m_lhs, c.m_rhs, c.m_kind == univ_constraint_kind::Lt ? 1 : 0);
    bool modified = true;
    unsigned num_nodes = 2 * cs.size() + 1;
    unsigned iter = 0;
    while (modified && iter <= num_nodes) {
        modified = false;
        iter++;
        std::vector<std::tuple<name, name, int>> new_edges;
        d.for_each([&](name const & u, name_map<int> const & row) {
                row.for_each([&](name const & v, int w1) {
                        if (name_map<int> const * row2 = d.find(v)) {
                            row2->for_each([&](name const & x, int w2) {
                                    new_edges.emplace_back(u, x, w1 + w2);
                                });
                        }
                    });
            });
        for (auto const & e : new_edges) {
            if (update(std::get<0>(e), std::get<1>(e), std::get<2>(e)))
                modified = true;
        }
    }
    return d;
}

static optional<int> distance(distances const & d, name const & u, name const & v) {
    if (name_map<int> const * row = d.find(u)) {
        if (int const * w = row->find(v))
            return optional<int>(*w);
    }
    return optional<int>();
}

bool universe_context::implies(univ_constraint const & c, std::vector<univ_constraint> const & cs) const {
    if (c.m_kind == univ_constraint_kind::Le && c.m_lhs == c.m_rhs)
        return true;
    distances d = closure(cs);
    optional<int> w = distance(d, c.m_lhs, c.m_rhs);
    if (!w)
        return false;
    return c.m_kind == univ_constraint_kind::Le || *w >= 1;
}

void universe_context::check_consistency() const {
    distances d = closure(m_constraints);
    for (name const & u : m_params) {
        if (optional<int> w = distance(d, u, u)) {
            if (*w > 0)
                throw universe_inconsistency_exception(sstream() << "universe inconsistency, "
                                                       << u << " < " << u << " is implied by the constraints");
        }
    }
}

bool universe_context::contains(name const & u) const {
    return std::find(m_params.begin(), m_params.end(), u) != m_params.end();
}

universe_context universe_context::add_param(name const & u, bool flexible) const {
    if (contains(u))
        return *this;
    universe_context r(*this);
    r.m_params.push_back(u);
    if (flexible)
        r.m_flexible.insert(u);
    return r;
}

universe_context universe_context::add_constraint(univ_constraint const & c) const {
    if (std::find(m_constraints.begin(), m_constraints.end(), c) != m_constraints.end())
        return *this;
    universe_context r = add_param(c.m_lhs, true).add_param(c.m_rhs, true);
    r.m_constraints.push_back(c);
    r.check_consistency();
    return r;
}

universe_context universe_context::merge(universe_context const & other) const {
    universe_context r(*this);
    for (name const & u : other.m_params)
        r = r.add_param(u, other.is_flexible(u));
    for (univ_constraint const & c : other.m_constraints) {
        if (std::find(r.m_constraints.begin(), r.m_constraints.end(), c) == r.m_constraints.end())
            r.m_constraints.push_back(c);
    }
    r.check_consistency();
    return r;
}

universe_context universe_context::restrict(name_set const & used) const {
    universe_context r;
    for (name const & u : m_params) {
        if (used.contains(u))
            r = r.add_param(u, is_flexible(u));
    }
    distances d = closure(m_constraints);
    for (name const & u : r.m_params) {
        for (name const & v : r.m_params) {
            if (u == v)
                continue;
            if (optional<int> w = distance(d, u, v))
                r.m_constraints.push_back(*w > 0 ? mk_lt(u, v) : mk_le(u, v));
        }
    }
    /* remove the constraints implied by the other ones */
    std::vector<univ_constraint> cs = r.m_constraints;
    unsigned i = cs.size();
    while (i > 0) {
        --i;
        std::vector<univ_constraint> others(cs);
        others.erase(others.begin() + i);
        if (r.implies(cs[i], others))
            cs = others;
    }
    r.m_constraints = cs;
    return r;
}

pair<universe_context, name_map<level>> universe_context::minimize() const {
    universe_context r(*this);
    name_map<level> subst;
    std::vector<name> flexible;
    for (name const & u : m_params) {
        if (is_flexible(u))
            flexible.push_back(u);
    }
    std::sort(flexible.begin(), flexible.end());
    bool modified = true;
    while (modified) {
        modified = false;
        for (name const & u : flexible) {
            if (!r.contains(u))
                continue;
            optional<name> lower;
            unsigned num_lower = 0;
            bool strict = false;
            for (univ_constraint const & c : r.m_constraints) {
                if (c.m_kind == univ_constraint_kind::Lt && (c.m_lhs == u || c.m_rhs == u))
                    strict = true;
                if (c.m_kind == univ_constraint_kind::Le && c.m_rhs == u && c.m_lhs != u) {
                    num_lower++;
                    lower = c.m_lhs;
                }
            }
            if (strict || num_lower != 1)
                continue;
            /* u := lower */
            name l = *lower;
            level l_level = mk_univ_param(l);
            name_map<level> new_subst;
            subst.for_each([&](name const & v, level const & lv) {
                    name_map<level> s1;
                    s1.insert(u, l_level);
                    new_subst.insert(v, instantiate(lv, s1));
                });
            new_subst.insert(u, l_level);
            subst = new_subst;
            universe_context new_r;
            for (name const & v : r.m_params) {
                if (v != u)
                    new_r = new_r.add_param(v, r.is_flexible(v));
            }
            for (univ_constraint const & c : r.m_constraints) {
                name lhs = c.m_lhs == u ? l : c.m_lhs;
                name rhs = c.m_rhs == u ? l : c.m_rhs;
                if (lhs == rhs && c.m_kind == univ_constraint_kind::Le)
                    continue;
                univ_constraint new_c(lhs, c.m_kind, rhs);
                if (std::find(new_r.m_constraints.begin(), new_r.m_constraints.end(), new_c) == new_r.m_constraints.end())
                    new_r.m_constraints.push_back(new_c);
            }
            r = new_r;
            modified = true;
        }
    }
    name_set all;
    for (name const & u : r.m_params)
        all.insert(u);
    r = r.restrict(all);
    return mk_pair(r, subst);
}

bool operator==(universe_context const & c1, universe_context const & c2) {
    std::vector<name> ps1 = c1.m_params;
    std::vector<name> ps2 = c2.m_params;
    std::sort(ps1.begin(), ps1.end());
    std::sort(ps2.begin(), ps2.end());
    if (ps1 != ps2 || c1.m_flexible != c2.m_flexible)
        return false;
    std::vector<univ_constraint> cs1 = c1.m_constraints;
    std::vector<univ_constraint> cs2 = c2.m_constraints;
    std::sort(cs1.begin(), cs1.end());
    std::sort(cs2.begin(), cs2.end());
    return cs1 == cs2;
}

std::ostream & operator<<(std::ostream & out, universe_context const & c) {
    out << "{";
    bool first = true;
    for (name const & u : c.m_params) {
        if (!first) out << " ";
        first = false;
        out << u;
        if (c.is_flexible(u))
            out << "?";
    }
    out << "}";
    if (!c.m_constraints.empty()) {
        out << " |= ";
        first = true;
        for (univ_constraint const & cn : c.m_constraints) {
            if (!first) out << ", ";
            first = false;
            out << cn;
        }
    }
    return out;
}
}
