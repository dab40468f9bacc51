/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include "kernel/environment.h"

namespace obligo {
/** \brief Type inference and definitional equality for closed terms, locals and metavariables
    are typed by the type they carry. */
class type_checker {
    environment m_env;
    bool        m_unfold_theorems;

    expr infer_constant(expr const & e);
    expr infer_app(expr const & e);
    expr infer_lambda(expr const & e);
    expr infer_pi(expr const & e);
    optional<expr> unfold_definition(expr const & e);
    bool is_def_eq_core(expr const & a, expr const & b);
public:
    type_checker(environment const & env, bool unfold_theorems = false):
        m_env(env), m_unfold_theorems(unfold_theorems) {}

    environment const & env() const { return m_env; }

    /** \brief Infer and check the type of \c e, throws kernel_exception if \c e is not well typed. */
    expr infer(expr const & e);
    expr check(expr const & e) { return infer(e); }
    /** \brief Weak head normal form using beta and delta (transparent definitions only). */
    expr whnf(expr const & e);
    bool is_def_eq(expr const & a, expr const & b);
    /** \brief Return the weak head normal form of \c e if it is a sort, throw otherwise. */
    expr ensure_sort(expr const & e);
    /** \brief Return the weak head normal form of \c e if it is a Pi, throw otherwise. */
    expr ensure_pi(expr const & e);
    /** \brief Return true iff \c type is a proposition. */
    bool is_prop(expr const & type);
};
}
