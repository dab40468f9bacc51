/*
Copyright (c) 2016 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <vector>
#include "util/fresh_name.h"
#include "util/sstream.h"
#include "kernel/abstract.h"
#include "kernel/find_fn.h"
#include "kernel/instantiate.h"
#include "kernel/replace_fn.h"
#include "library/exception.h"
#include "library/metavar_context.h"

namespace obligo {
expr metavar_context::mk_metavar_decl(local_context const & ctx, expr const & type) {
    name n = mk_tagged_fresh_name("_mvar");
    m_decls.insert(n, metavar_decl(ctx, type));
    expr m = mk_metavar(n, Pi(ctx.get_locals(), type));
    return mk_app(m, ctx.get_locals());
}

metavar_decl const & metavar_context::get_metavar_decl(expr const & occ) const {
    metavar_decl const * d = m_decls.find(get_metavar_name(occ));
    if (!d)
        throw generic_exception(sstream() << "unknown metavariable '?" << get_metavar_name(occ) << "'");
    return *d;
}

static bool occurs_metavar(name const & n, expr const & e) {
    if (!has_metavar(e))
        return false;
    return static_cast<bool>(find(e, [&](expr const & c, unsigned) { return is_metavar(c) && mlocal_name(c) == n; }));
}

void metavar_context::assign(expr const & occ, expr const & v) {
    name const & n = get_metavar_name(occ);
    metavar_decl const & d = get_metavar_decl(occ);
    if (is_assigned(n))
        throw generic_exception(sstream() << "metavariable '?" << n << "' has already been assigned");
    expr new_v = instantiate_mvars(v);
    if (occurs_metavar(n, new_v))
        throw generic_exception(sstream() << "failed to assign '?" << n << "', value contains the metavariable itself");
    if (!d.get_context().well_formed(new_v))
        throw generic_exception(sstream() << "failed to assign '?" << n << "', value contains hypotheses not in its context");
    m_assignment.insert(n, Fun(d.get_context().get_locals(), new_v));
}

optional<expr> metavar_context::get_assignment(expr const & occ) const {
    if (expr const * a = m_assignment.find(get_metavar_name(occ))) {
        exprs args;
        get_app_args(occ, args);
        return some_expr(instantiate_mvars(head_beta_reduce(mk_app(*a, args))));
    }
    return none_expr();
}

expr metavar_context::instantiate_mvars(expr const & e) const {
    if (!has_metavar(e))
        return e;
    return replace(e, [&](expr const & m, unsigned) -> optional<expr> {
            if (!has_metavar(m))
                return some_expr(m);
            if (is_metavar_app(m)) {
                if (expr const * a = m_assignment.find(get_metavar_name(m))) {
                    exprs args;
                    get_app_args(m, args);
                    for (expr & arg : args)
                        arg = instantiate_mvars(arg);
                    return some_expr(instantiate_mvars(head_beta_reduce(mk_app(*a, args))));
                }
            }
            return none_expr();
        });
}

metavar_context metavar_context::restrict(name_set const & keep) const {
    metavar_context r;
    m_decls.for_each([&](name const & n, metavar_decl const & d) {
            if (keep.contains(n))
                r.m_decls.insert(n, d);
        });
    m_assignment.for_each([&](name const & n, expr const & v) {
            if (keep.contains(n))
                r.m_assignment.insert(n, v);
        });
    return r;
}
}
