/*
Copyright (c) 2015 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <set>
#include <string>
#include <vector>
#include "kernel/expr.h"
#include "library/exception.h"
#include "library/tactic/proof_state.h"

namespace obligo {
class obligation_exception : public exception {
public:
    obligation_exception(char const * msg):exception(msg) {}
    obligation_exception(std::string const & msg):exception(msg) {}
    obligation_exception(sstream const & strm):exception(strm) {}
    virtual throwable * clone() const override { return new obligation_exception(m_msg); }
    virtual void rethrow() const override { throw *this; }
};

/** \brief \c Expand obligations are folded into the terms that use them, \c Define obligations
    are declared as constants and referenced by name. */
enum class obligation_definition_status { Define, Expand };

struct obligation_status {
    bool                         m_opaque;
    obligation_definition_status m_def;
    obligation_status(bool opaque = false, obligation_definition_status d = obligation_definition_status::Define):
        m_opaque(opaque), m_def(d) {}
};

/** \brief Where the obligation comes from, used for diagnostics only. */
struct obligation_location {
    std::string        m_origin;
    optional<unsigned> m_line;
    optional<unsigned> m_column;
    obligation_location(std::string const & origin = "hole"):m_origin(origin) {}
    obligation_location(std::string const & origin, unsigned line, unsigned col):
        m_origin(origin), m_line(line), m_column(col) {}
};
std::ostream & operator<<(std::ostream & out, obligation_location const & l);

/** \brief Solution of an obligation: a term, or a constant registered in the environment. */
class obligation_body {
    bool m_constant;
    bool m_transparent;
    expr m_ref;
    expr m_value;
    obligation_body(bool c, bool t, expr const & r, expr const & v):m_constant(c), m_transparent(t), m_ref(r), m_value(v) {}
public:
    static obligation_body mk_term(expr const & v) { return obligation_body(false, true, v, v); }
    /** \brief Solution declared as the constant \c c with value \c v. */
    static obligation_body mk_constant(expr const & c, expr const & v, bool transparent) {
        return obligation_body(true, transparent, c, v);
    }
    bool is_constant() const { return m_constant; }
    bool is_transparent() const { return m_transparent; }
    /** \brief The term used when the obligation is not expanded. */
    expr const & get_ref() const { return m_ref; }
    expr const & get_value() const { return m_value; }
    /** \brief Term substituted for the obligation, \c expand unfolds transparent constants. */
    expr const & get_term(bool expand) const { return expand && m_transparent ? m_value : m_ref; }
};

class obligation {
    name                      m_name;
    expr                      m_type;
    obligation_location       m_location;
    std::set<unsigned>        m_deps;
    obligation_status         m_status;
    tactic                    m_tactic;
    optional<obligation_body> m_body;
public:
    obligation(name const & n, expr const & type, obligation_location const & loc, std::set<unsigned> const & deps,
               obligation_status const & st, tactic const & tac = tactic()):
        m_name(n), m_type(type), m_location(loc), m_deps(deps), m_status(st), m_tactic(tac) {}
    name const & get_name() const { return m_name; }
    expr const & get_type() const { return m_type; }
    obligation_location const & get_location() const { return m_location; }
    std::set<unsigned> const & get_deps() const { return m_deps; }
    obligation_status const & get_status() const { return m_status; }
    /** \brief Tactic used to solve the obligation automatically, empty if it must be solved manually. */
    tactic const & get_tactic() const { return m_tactic; }
    bool has_tactic() const { return static_cast<bool>(m_tactic); }
    optional<obligation_body> const & get_body() const { return m_body; }
    bool is_solved() const { return static_cast<bool>(m_body); }

    /** \brief Set the solution, throws obligation_exception if the obligation is already solved. */
    obligation set_body(obligation_body const & b) const;
    obligation set_status(obligation_status const & st) const;
    obligation set_type(expr const & type) const;
};

/** \brief Name of the obligation at position \c idx (starting at 0) of the program \c prog. */
name mk_obligation_name(name const & prog, unsigned idx);
/** \brief Placeholder for the obligation \c n of type \c type in the body of a program. */
expr mk_obligation_ref(name const & n, expr const & type);
inline expr mk_obligation_ref(obligation const & o) { return mk_obligation_ref(o.get_name(), o.get_type()); }

/** \brief Transitive closure of the dependencies of the obligation \c i. */
std::set<unsigned> dependencies(std::vector<obligation> const & obls, unsigned i);
/** \brief Obligations that depend directly on \c i. */
std::set<unsigned> dependents(std::vector<obligation> const & obls, unsigned i);

struct obligation_subst_entry {
    name m_name;
    expr m_type;
    expr m_term;
    obligation_subst_entry(name const & n, expr const & type, expr const & term):m_name(n), m_type(type), m_term(term) {}
};
/** \brief Solutions of the obligations \c idxs. Throws obligation_exception if one of them is unsolved. */
std::vector<obligation_subst_entry> obligation_substitution(bool expand, std::vector<obligation> const & obls,
                                                            std::set<unsigned> const & idxs);
/** \brief Replace the references to the obligations \c deps in \c e with their solutions. */
expr subst_deps(bool expand, std::vector<obligation> const & obls, std::set<unsigned> const & deps, expr const & e);

/** \brief Return true iff every dependency of the obligation \c i is solved. */
bool is_attemptable(std::vector<obligation> const & obls, unsigned i);
/** \brief Unsolved obligations in \c deps. */
std::vector<unsigned> deps_remaining(std::vector<obligation> const & obls, std::set<unsigned> const & deps);
unsigned count_remaining(std::vector<obligation> const & obls);
}
