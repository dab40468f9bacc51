/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include "kernel/expr.h"

namespace obligo {
/** \brief Replace the locals \c s[i] in \c e with <tt>Var(n - i - 1)</tt>, the last local
    becomes <tt>Var(0)</tt>. Locals are compared by name. */
expr abstract_locals(expr const & e, unsigned n, expr const * s);
inline expr abstract_locals(expr const & e, exprs const & s) { return abstract_locals(e, s.size(), s.data()); }
inline expr abstract_local(expr const & e, expr const & s) { return abstract_locals(e, 1, &s); }

/** \brief Create <tt>fun (x_1 : A_1) ... (x_n : A_n), b</tt> for the locals <tt>x_i : A_i</tt>. */
expr Fun(unsigned n, expr const * locals, expr const & b);
inline expr Fun(exprs const & locals, expr const & b) { return Fun(locals.size(), locals.data(), b); }
/** \brief Create <tt>Pi (x_1 : A_1) ... (x_n : A_n), b</tt> for the locals <tt>x_i : A_i</tt>. */
expr Pi(unsigned n, expr const * locals, expr const & b);
inline expr Pi(exprs const & locals, expr const & b) { return Pi(locals.size(), locals.data(), b); }

/** \brief Replace the locals named as \c locals[i] with \c terms[i]. */
expr replace_locals(expr const & e, unsigned n, expr const * locals, expr const * terms);
inline expr replace_locals(expr const & e, exprs const & locals, exprs const & terms) {
    obligo_assert(locals.size() == terms.size());
    return replace_locals(e, locals.size(), locals.data(), terms.data());
}
inline expr replace_local(expr const & e, expr const & local, expr const & term) {
    return replace_locals(e, 1, &local, &term);
}
/** \brief Return true iff a local named \c n occurs in \c e. */
bool occurs_local(name const & n, expr const & e);
}
