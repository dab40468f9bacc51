/*
Copyright (c) 2016 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <functional>
#include "util/name_map.h"
#include "util/name_set.h"
#include "library/local_context.h"

namespace obligo {
/**
   \brief Declaration of a metavariable: the hypotheses it may use and its type.

   A metavariable <tt>?m</tt> declared in the context <tt>x_1 : A_1, ..., x_n : A_n</tt> with type \c T
   has kernel type <tt>Pi (x_1 : A_1) ... (x_n : A_n), T</tt> and occurs in terms as
   <tt>?m x_1 ... x_n</tt>. Assignments are stored as closed functions
   <tt>fun x_1 ... x_n, v</tt>, so abstracting hypotheses over a term containing
   <tt>?m x_1 ... x_n</tt> is safe.
*/
class metavar_decl {
    local_context m_context;
    expr          m_type;
public:
    metavar_decl(local_context const & ctx, expr const & type):m_context(ctx), m_type(type) {}
    local_context const & get_context() const { return m_context; }
    expr const & get_type() const { return m_type; }
};

/** \brief Return true iff \c e is of the form <tt>?m a_1 ... a_n</tt>. */
inline bool is_metavar_app(expr const & e) { return is_metavar(get_app_fn(e)); }
inline name const & get_metavar_name(expr const & occ) { return mlocal_name(get_app_fn(occ)); }

class metavar_context {
    name_map<metavar_decl> m_decls;
    name_map<expr>         m_assignment;
public:
    /** \brief Declare a fresh metavariable, and return its occurrence in the context \c ctx. */
    expr mk_metavar_decl(local_context const & ctx, expr const & type);
    optional<metavar_decl> find_metavar_decl(name const & n) const { return m_decls.find_opt(n); }
    metavar_decl const & get_metavar_decl(expr const & occ) const;

    bool is_assigned(name const & n) const { return m_assignment.contains(n); }
    bool is_assigned(expr const & occ) const { return is_assigned(get_metavar_name(occ)); }
    /** \brief Assign the value \c v to the metavariable occurring in \c occ, \c v may use the hypotheses
        of the metavariable context. Throws generic_exception if \c v uses other hypotheses or
        contains the metavariable itself. */
    void assign(expr const & occ, expr const & v);
    /** \brief Return the value of the given occurrence. */
    optional<expr> get_assignment(expr const & occ) const;
    /** \brief Stored value of \c n, a function of the hypotheses that may still contain assigned metavariables. */
    optional<expr> get_stored_assignment(name const & n) const { return m_assignment.find_opt(n); }

    /** \brief Replace the assigned metavariables in \c e with their values. */
    expr instantiate_mvars(expr const & e) const;

    /** \brief Remove the declarations and assignments of the metavariables not in \c keep. */
    metavar_context restrict(name_set const & keep) const;
    unsigned num_decls() const { return m_decls.size(); }
    unsigned num_assigned() const { return m_assignment.size(); }
    void for_each_decl(std::function<void(name const &, metavar_decl const &)> const & fn) const {
        m_decls.for_each(fn);
    }
};
}
