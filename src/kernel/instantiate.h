/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include "kernel/expr.h"

namespace obligo {
/** \brief Replace the loose bound variables with indices 0, ..., n-1 with s[0], ..., s[n-1],
    and lower the remaining loose bound variables by \c n. */
expr instantiate(expr const & e, unsigned n, expr const * s);
/** \brief Replace the loose bound variables with indices 0, ..., n-1 with s[n-1], ..., s[0]. */
expr instantiate_rev(expr const & e, unsigned n, expr const * s);
inline expr instantiate_rev(expr const & e, exprs const & s) { return instantiate_rev(e, s.size(), s.data()); }
expr instantiate(expr const & e, expr const & s);

expr lift_loose_bvars(expr const & e, unsigned d);
expr lower_loose_bvars(expr const & e, unsigned d);

/** \brief Given a binding <tt>(x : A), B</tt>, return <tt>B[x := a]</tt>. */
expr binding_body_instantiate(expr const & e, expr const & a);

expr instantiate_univ_params(expr const & e, level_param_names const & ps, levels const & ls);
expr instantiate_univ_params(expr const & e, name_map<level> const & s);
void collect_univ_params(expr const & e, name_set & s);

bool is_head_beta(expr const & e);
/** \brief Beta reduce the head of \c e until it is not a beta redex. */
expr head_beta_reduce(expr const & e);
/** \brief Beta reduce every redex in \c e. */
expr beta_reduce(expr const & e);
}
