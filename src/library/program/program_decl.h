/*
Copyright (c) 2015 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <functional>
#include <set>
#include <string>
#include <vector>
#include "kernel/universe_context.h"
#include "library/declare.h"
#include "library/program/obligation.h"

namespace obligo {
/** \brief Obligation produced when a program is elaborated. Its type may refer to the obligations
    it depends on using mk_obligation_ref. */
struct obligation_info {
    expr                m_type;
    obligation_location m_location;
    obligation_status   m_status;
    std::set<unsigned>  m_deps;
    tactic              m_tactic;
    obligation_info(expr const & type, std::set<unsigned> const & deps = std::set<unsigned>(),
                    obligation_status const & st = obligation_status(),
                    obligation_location const & loc = obligation_location(), tactic const & tac = tactic()):
        m_type(type), m_location(loc), m_status(st), m_deps(deps), m_tactic(tac) {}
};

/** \brief Member of a mutually recursive program. */
struct fixpoint_info {
    decl_kind         m_kind;
    std::vector<name> m_args;
    optional<name>    m_struct_arg;
    fixpoint_info(decl_kind k, std::vector<name> const & args = std::vector<name>(),
                  optional<name> const & struct_arg = optional<name>()):
        m_kind(k), m_args(args), m_struct_arg(struct_arg) {}
};

typedef std::function<expr(expr const &)> reduce_fn;

/** \brief Declaration whose body is waiting for its obligations to be solved. */
class program_decl {
    name                     m_name;
    expr                     m_type;
    expr                     m_body;
    universe_context         m_uctx;
    std::vector<std::string> m_notations;
    optional<fixpoint_info>  m_fixpoint;
    std::vector<obligation>  m_obls;
    unsigned                 m_remaining;
    /** \brief Members of the mutually recursive group of this program, in declaration order. */
    std::vector<name>        m_deps;
    decl_info                m_info;
    tactic                   m_tactic;
    reduce_fn                m_reduce;
public:
    program_decl(name const & n, expr const & type, expr const & body, universe_context const & uctx,
                 std::vector<obligation> const & obls, decl_info const & info, tactic const & tac = tactic(),
                 reduce_fn const & reduce = reduce_fn());

    name const & get_name() const { return m_name; }
    expr const & get_type() const { return m_type; }
    /** \brief Body of the program, the obligations appear as references created by mk_obligation_ref. */
    expr const & get_body() const { return m_body; }
    universe_context const & get_uctx() const { return m_uctx; }
    std::vector<std::string> const & get_notations() const { return m_notations; }
    optional<fixpoint_info> const & get_fixpoint() const { return m_fixpoint; }
    bool is_fixpoint() const { return static_cast<bool>(m_fixpoint); }
    std::vector<obligation> const & get_obligations() const { return m_obls; }
    unsigned get_remaining() const { return m_remaining; }
    std::vector<name> const & get_deps() const { return m_deps; }
    decl_info const & get_info() const { return m_info; }
    /** \brief Tactic used to solve the obligations of this program automatically, may be empty. */
    tactic const & get_tactic() const { return m_tactic; }
    expr reduce(expr const & e) const { return m_reduce ? m_reduce(e) : e; }

    /** \brief Update the obligations, the number of remaining obligations is recomputed. */
    program_decl set_obligations(std::vector<obligation> const & obls) const;
    program_decl set_uctx(universe_context const & uctx) const;
    program_decl set_fixpoint(fixpoint_info const & fi, std::vector<name> const & deps,
                              std::vector<std::string> const & notations) const;
};

/** \brief Create a program, the obligation at position i is named mk_obligation_name(n, i).
    Throws obligation_exception if a dependency is out of range or refers to the obligation itself. */
program_decl mk_program_decl(name const & n, expr const & type, expr const & body, universe_context const & uctx,
                             std::vector<obligation_info> const & obls, decl_info const & info,
                             tactic const & tac = tactic(), reduce_fn const & reduce = reduce_fn());

/** \brief Type of the obligation \c i where its solved dependencies have been substituted. */
expr get_obligation_type(program_decl const & p, unsigned i);
/** \brief Body of the program where the solved obligations have been substituted. */
expr get_program_body(program_decl const & p);
/** \brief Pairs (obligation name, term) given to the declaration hook. */
std::vector<pair<name, expr>> get_obligation_terms(program_decl const & p);
}
