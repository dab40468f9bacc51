/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include "kernel/replace_fn.h"
#include "kernel/find_fn.h"
#include "kernel/instantiate.h"
#include "kernel/abstract.h"

namespace obligo {
expr abstract_locals(expr const & e, unsigned n, expr const * s) {
    if (n == 0 || !has_local(e))
        return e;
    return replace(e, [=](expr const & m, unsigned offset) -> optional<expr> {
            if (!has_local(m))
                return some_expr(m);
            if (is_local(m)) {
                unsigned i = n;
                while (i > 0) {
                    --i;
                    if (mlocal_name(s[i]) == mlocal_name(m))
                        return some_expr(mk_var(offset + n - i - 1));
                }
                return none_expr();
            }
            return none_expr();
        });
}

static expr mk_locals_binding(expr_kind k, unsigned n, expr const * locals, expr const & b) {
    expr r = abstract_locals(b, n, locals);
    unsigned i = n;
    while (i > 0) {
        --i;
        expr const & l = locals[i];
        obligo_assert(is_local(l));
        expr d = abstract_locals(mlocal_type(l), i, locals);
        r = mk_binding(k, local_pp_name(l), d, r);
    }
    return r;
}

expr Fun(unsigned n, expr const * locals, expr const & b) {
    return mk_locals_binding(expr_kind::Lambda, n, locals, b);
}

expr Pi(unsigned n, expr const * locals, expr const & b) {
    return mk_locals_binding(expr_kind::Pi, n, locals, b);
}

expr replace_locals(expr const & e, unsigned n, expr const * locals, expr const * terms) {
    if (n == 0 || !has_local(e))
        return e;
    return replace(e, [=](expr const & m, unsigned offset) -> optional<expr> {
            if (!has_local(m))
                return some_expr(m);
            if (is_local(m)) {
                for (unsigned i = 0; i < n; i++) {
                    if (mlocal_name(locals[i]) == mlocal_name(m))
                        return some_expr(lift_loose_bvars(terms[i], offset));
                }
            }
            return none_expr();
        });
}

bool occurs_local(name const & n, expr const & e) {
    if (!has_local(e))
        return false;
    return static_cast<bool>(find(e, [&](expr const & m, unsigned) {
                return is_local(m) && mlocal_name(m) == n;
            }));
}
}
