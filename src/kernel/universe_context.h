/*
Copyright (c) 2017 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.
*/
#pragma once
#include <iostream>
#include <vector>
#include "util/exception.h"
#include "util/name_map.h"
#include "util/name_set.h"
#include "util/pair.h"
#include "kernel/level.h"

namespace obligo {
enum class univ_constraint_kind { Le, Lt };

/** \brief Constraint <tt>lhs <= rhs</tt> or <tt>lhs < rhs</tt> between two universe parameters. */
struct univ_constraint {
    name                 m_lhs;
    univ_constraint_kind m_kind;
    name                 m_rhs;
    univ_constraint(name const & lhs, univ_constraint_kind k, name const & rhs):
        m_lhs(lhs), m_kind(k), m_rhs(rhs) {}
};

inline univ_constraint mk_le(name const & l, name const & r) { return univ_constraint(l, univ_constraint_kind::Le, r); }
inline univ_constraint mk_lt(name const & l, name const & r) { return univ_constraint(l, univ_constraint_kind::Lt, r); }
bool operator==(univ_constraint const & c1, univ_constraint const & c2);
inline bool operator!=(univ_constraint const & c1, univ_constraint const & c2) { return !(c1 == c2); }
bool operator<(univ_constraint const & c1, univ_constraint const & c2);
std::ostream & operator<<(std::ostream & out, univ_constraint const & c);

class universe_inconsistency_exception : public exception {
public:
    universe_inconsistency_exception(std::string const & msg):exception(msg) {}
    universe_inconsistency_exception(sstream const & strm):exception(strm) {}
    virtual throwable * clone() const override { return new universe_inconsistency_exception(m_msg); }
    virtual void rethrow() const override { throw *this; }
};

/**
   \brief Universe parameters of a declaration together with the constraints accumulated
   while its terms were built.

   Flexible parameters were introduced by elaboration (they are not named by the user) and
   can be eliminated by minimization.
*/
class universe_context {
    std::vector<name>            m_params;
    name_set                     m_flexible;
    std::vector<univ_constraint> m_constraints;

    bool implies(univ_constraint const & c, std::vector<univ_constraint> const & cs) const;
    void check_consistency() const;
public:
    universe_context() {}

    bool empty() const { return m_params.empty(); }
    std::vector<name> const & get_params() const { return m_params; }
    std::vector<univ_constraint> const & get_constraints() const { return m_constraints; }
    level_param_names get_level_params() const { return to_list(m_params); }
    bool contains(name const & u) const;
    bool is_flexible(name const & u) const { return m_flexible.contains(u); }

    /** \brief Add the universe parameter \c u, nothing happens if it is already there. */
    universe_context add_param(name const & u, bool flexible = false) const;
    /** \brief Add a constraint, throws universe_inconsistency_exception if it creates a cycle
        containing a strict constraint. */
    universe_context add_constraint(univ_constraint const & c) const;
    /** \brief Union of the two contexts. */
    universe_context merge(universe_context const & other) const;
    /** \brief Keep only the parameters in \c used and the constraints among them implied by
        the current set of constraints. */
    universe_context restrict(name_set const & used) const;
    /** \brief Eliminate flexible parameters whose value is forced and remove redundant
        constraints. Returns the new context and the substitution applied to the parameters. */
    pair<universe_context, name_map<level>> minimize() const;
    /** \brief Return true iff the constraints imply <tt>lhs <= rhs</tt> (or <tt>lhs < rhs</tt>). */
    bool entails(univ_constraint const & c) const { return implies(c, m_constraints); }

    friend bool operator==(universe_context const & c1, universe_context const & c2);
    friend bool operator!=(universe_context const & c1, universe_context const & c2) { return !(c1 == c2); }
    friend std::ostream & operator<<(std::ostream & out, universe_context const & c);
};
}
