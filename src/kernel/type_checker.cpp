/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <vector>
#include "util/fresh_name.h"
#include "kernel/kernel_exception.h"
#include "kernel/instantiate.h"
#include "kernel/abstract.h"
#include "kernel/type_checker.h"

namespace obligo {
expr type_checker::infer_constant(expr const & e) {
    declaration d = m_env.get(const_name(e));
    if (length(const_levels(e)) != d.get_num_univ_params())
        throw kernel_exception(sstream() << "incorrect number of universe levels for '" << const_name(e)
                               << "', " << d.get_num_univ_params() << " expected");
    return instantiate_univ_params(d.get_type(), d.get_univ_params(), const_levels(e));
}

expr type_checker::infer_app(expr const & e) {
    exprs args;
    expr const & f = get_app_args(e, args);
    expr f_type = infer(f);
    for (expr const & a : args) {
        f_type = ensure_pi(f_type);
        expr a_type = infer(a);
        if (!is_def_eq(a_type, binding_domain(f_type)))
            throw kernel_exception(sstream() << "application type mismatch at\n  " << e
                                   << "\nargument\n  " << a << "\nhas type\n  " << a_type
                                   << "\nbut is expected to have type\n  " << binding_domain(f_type));
        f_type = binding_body_instantiate(f_type, a);
    }
    return f_type;
}

expr type_checker::infer_lambda(expr const & e) {
    ensure_sort(infer(binding_domain(e)));
    expr l = mk_local(mk_fresh_name(), binding_name(e), binding_domain(e));
    expr b_type = infer(binding_body_instantiate(e, l));
    return Pi(1, &l, b_type);
}

expr type_checker::infer_pi(expr const & e) {
    expr s1 = ensure_sort(infer(binding_domain(e)));
    expr l  = mk_local(mk_fresh_name(), binding_name(e), binding_domain(e));
    expr s2 = ensure_sort(infer(binding_body_instantiate(e, l)));
    return mk_sort(mk_imax(sort_level(s1), sort_level(s2)));
}

expr type_checker::infer(expr const & e) {
    switch (e.kind()) {
    case expr_kind::Var:
        throw kernel_exception("type checker does not support loose bound variables");
    case expr_kind::Sort:
        return mk_sort(mk_succ(sort_level(e)));
    case expr_kind::Constant:
        return infer_constant(e);
    case expr_kind::Local: case expr_kind::Meta:
        return mlocal_type(e);
    case expr_kind::App:
        return infer_app(e);
    case expr_kind::Lambda:
        return infer_lambda(e);
    case expr_kind::Pi:
        return infer_pi(e);
    }
    obligo_unreachable();
}

optional<expr> type_checker::unfold_definition(expr const & e) {
    expr const & f = get_app_fn(e);
    if (!is_constant(f))
        return none_expr();
    optional<declaration> d = m_env.find(const_name(f));
    if (!d || !d->has_value() || d->is_recursive())
        return none_expr();
    if (d->is_theorem() && !m_unfold_theorems)
        return none_expr();
    if (length(const_levels(f)) != d->get_num_univ_params())
        return none_expr();
    exprs args;
    get_app_args(e, args);
    expr v = instantiate_univ_params(d->get_value(), d->get_univ_params(), const_levels(f));
    return some_expr(mk_app(v, args));
}

expr type_checker::whnf(expr const & e) {
    expr r = e;
    while (true) {
        r = head_beta_reduce(r);
        if (optional<expr> n = unfold_definition(r))
            r = *n;
        else
            return r;
    }
}

bool type_checker::is_def_eq_core(expr const & a0, expr const & b0) {
    if (is_eqp(a0, b0) || a0 == b0)
        return true;
    expr a = whnf(a0);
    expr b = whnf(b0);
    if (a.kind() != b.kind())
        return false;
    switch (a.kind()) {
    case expr_kind::Var:
        return var_idx(a) == var_idx(b);
    case expr_kind::Sort:
        return is_equivalent(sort_level(a), sort_level(b));
    case expr_kind::Constant: {
        if (const_name(a) != const_name(b))
            return false;
        auto it1 = const_levels(a).begin();
        auto it2 = const_levels(b).begin();
        for (; it1 != const_levels(a).end() && it2 != const_levels(b).end(); ++it1, ++it2) {
            if (!is_equivalent(*it1, *it2))
                return false;
        }
        return it1 == const_levels(a).end() && it2 == const_levels(b).end();
    }
    case expr_kind::Local: case expr_kind::Meta:
        return mlocal_name(a) == mlocal_name(b);
    case expr_kind::App: {
        exprs args_a, args_b;
        expr const & fa = get_app_args(a, args_a);
        expr const & fb = get_app_args(b, args_b);
        if (args_a.size() != args_b.size() || !is_def_eq_core(fa, fb))
            return false;
        for (unsigned i = 0; i < args_a.size(); i++) {
            if (!is_def_eq_core(args_a[i], args_b[i]))
                return false;
        }
        return true;
    }
    case expr_kind::Lambda: case expr_kind::Pi:
        return
            is_def_eq_core(binding_domain(a), binding_domain(b)) &&
            is_def_eq_core(binding_body(a), binding_body(b));
    }
    obligo_unreachable();
}

bool type_checker::is_def_eq(expr const & a, expr const & b) {
    return is_def_eq_core(a, b);
}

expr type_checker::ensure_sort(expr const & e) {
    expr r = whnf(e);
    if (!is_sort(r))
        throw kernel_exception(sstream() << "type expected, given\n  " << e);
    return r;
}

expr type_checker::ensure_pi(expr const & e) {
    expr r = whnf(e);
    if (!is_pi(r))
        throw kernel_exception(sstream() << "function expected, given\n  " << e);
    return r;
}

bool type_checker::is_prop(expr const & type) {
    expr s = whnf(infer(type));
    return is_sort(s) && is_zero(sort_level(s));
}
}
