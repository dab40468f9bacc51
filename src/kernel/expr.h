/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <iostream>
#include <memory>
#include <vector>
#include "util/list.h"
#include "util/name.h"
#include "util/optional.h"
#include "kernel/level.h"

namespace obligo {
/**
   \brief Expression kinds.

   - Var      : bound variable (de Bruijn index)
   - Sort     : Sort l
   - Constant : reference to a declaration in the environment, with universe levels
   - Local    : free variable, carries its type
   - Meta     : metavariable (placeholder solved by tactics), carries its type
   - App      : application
   - Lambda   : function
   - Pi       : function space
*/
enum class expr_kind { Var, Sort, Constant, Local, Meta, App, Lambda, Pi };

class expr {
    struct cell;
    std::shared_ptr<cell const> m_ptr;
    explicit expr(std::shared_ptr<cell const> const & c):m_ptr(c) {}
    friend expr mk_var(unsigned idx);
    friend expr mk_sort(level const & l);
    friend expr mk_constant(name const & n, levels const & ls);
    friend expr mk_local(name const & n, name const & pp_n, expr const & t);
    friend expr mk_metavar(name const & n, expr const & t);
    friend expr mk_app(expr const & f, expr const & a);
    friend expr mk_binding(expr_kind k, name const & n, expr const & d, expr const & b);
public:
    /** \brief Default constructor, creates the expression Prop. */
    expr();
    expr_kind kind() const;
    unsigned hash() const;
    /** \brief One plus the greatest de Bruijn index occurring free in this expression. */
    unsigned get_loose_bv_range() const;
    bool has_local() const;
    bool has_metavar() const;
    bool has_univ_param() const;

    friend bool is_eqp(expr const & a, expr const & b) { return a.m_ptr == b.m_ptr; }
    /** \brief Structural equality, binder names are ignored. */
    friend bool operator==(expr const & a, expr const & b);
    friend bool operator!=(expr const & a, expr const & b) { return !(a == b); }

    friend unsigned var_idx(expr const & e);
    friend level const & sort_level(expr const & e);
    friend name const & const_name(expr const & e);
    friend levels const & const_levels(expr const & e);
    friend name const & mlocal_name(expr const & e);
    friend expr const & mlocal_type(expr const & e);
    friend name const & local_pp_name(expr const & e);
    friend expr const & app_fn(expr const & e);
    friend expr const & app_arg(expr const & e);
    friend name const & binding_name(expr const & e);
    friend expr const & binding_domain(expr const & e);
    friend expr const & binding_body(expr const & e);
};

typedef std::vector<expr> exprs;

inline optional<expr> none_expr() { return optional<expr>(); }
inline optional<expr> some_expr(expr const & e) { return optional<expr>(e); }

expr mk_var(unsigned idx);
expr mk_sort(level const & l);
expr mk_constant(name const & n, levels const & ls);
inline expr mk_constant(name const & n) { return mk_constant(n, levels()); }
expr mk_local(name const & n, name const & pp_n, expr const & t);
inline expr mk_local(name const & n, expr const & t) { return mk_local(n, n, t); }
expr mk_metavar(name const & n, expr const & t);
expr mk_app(expr const & f, expr const & a);
expr mk_app(expr const & f, unsigned num_args, expr const * args);
inline expr mk_app(expr const & f, exprs const & args) { return mk_app(f, args.size(), args.data()); }
inline expr mk_app(expr const & f, expr const & a1, expr const & a2) { return mk_app(mk_app(f, a1), a2); }
expr mk_binding(expr_kind k, name const & n, expr const & d, expr const & b);
inline expr mk_lambda(name const & n, expr const & d, expr const & b) { return mk_binding(expr_kind::Lambda, n, d, b); }
inline expr mk_pi(name const & n, expr const & d, expr const & b) { return mk_binding(expr_kind::Pi, n, d, b); }
/** \brief Non dependent function space <tt>A -> B</tt>, \c b must not contain loose bound variables. */
expr mk_arrow(expr const & a, expr const & b);
expr const & mk_Prop();
expr const & mk_Type();

inline bool is_var(expr const & e) { return e.kind() == expr_kind::Var; }
inline bool is_sort(expr const & e) { return e.kind() == expr_kind::Sort; }
inline bool is_constant(expr const & e) { return e.kind() == expr_kind::Constant; }
inline bool is_local(expr const & e) { return e.kind() == expr_kind::Local; }
inline bool is_metavar(expr const & e) { return e.kind() == expr_kind::Meta; }
inline bool is_mlocal(expr const & e) { return is_local(e) || is_metavar(e); }
inline bool is_app(expr const & e) { return e.kind() == expr_kind::App; }
inline bool is_lambda(expr const & e) { return e.kind() == expr_kind::Lambda; }
inline bool is_pi(expr const & e) { return e.kind() == expr_kind::Pi; }
inline bool is_binding(expr const & e) { return is_lambda(e) || is_pi(e); }
inline bool is_constant(expr const & e, name const & n) { return is_constant(e) && const_name(e) == n; }

inline bool has_loose_bvars(expr const & e) { return e.get_loose_bv_range() > 0; }
inline bool closed(expr const & e) { return !has_loose_bvars(e); }
inline bool has_local(expr const & e) { return e.has_local(); }
inline bool has_metavar(expr const & e) { return e.has_metavar(); }
inline bool has_univ_param(expr const & e) { return e.has_univ_param(); }
/** \brief Return true iff <tt>Var(i)</tt> occurs free in \c e. */
bool has_loose_bvar(expr const & e, unsigned i);

/** \brief Given <tt>f a_1 ... a_n</tt>, return \c f. */
expr const & get_app_fn(expr const & e);
/** \brief Given <tt>f a_1 ... a_n</tt>, store <tt>a_1 ... a_n</tt> in \c args and return \c f. */
expr const & get_app_args(expr const & e, exprs & args);
unsigned get_app_num_args(expr const & e);

expr update_app(expr const & e, expr const & new_fn, expr const & new_arg);
expr update_binding(expr const & e, expr const & new_domain, expr const & new_body);
expr update_mlocal(expr const & e, expr const & new_type);
expr update_sort(expr const & e, level const & new_level);
expr update_constant(expr const & e, levels const & new_levels);

std::ostream & operator<<(std::ostream & out, expr const & e);

void initialize_expr();
void finalize_expr();
}
