/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include "kernel/replace_fn.h"

namespace obligo {
class replace_fn {
    std::function<optional<expr>(expr const &, unsigned)> const & m_f;

    expr apply(expr const & e, unsigned offset) {
        if (optional<expr> r = m_f(e, offset))
            return *r;
        switch (e.kind()) {
        case expr_kind::Var: case expr_kind::Sort: case expr_kind::Constant:
            return e;
        case expr_kind::Local: case expr_kind::Meta:
            return update_mlocal(e, apply(mlocal_type(e), offset));
        case expr_kind::App: {
            expr new_f = apply(app_fn(e), offset);
            expr new_a = apply(app_arg(e), offset);
            return update_app(e, new_f, new_a);
        }
        case expr_kind::Lambda: case expr_kind::Pi: {
            expr new_d = apply(binding_domain(e), offset);
            expr new_b = apply(binding_body(e), offset + 1);
            return update_binding(e, new_d, new_b);
        }
        }
        obligo_unreachable();
    }
public:
    replace_fn(std::function<optional<expr>(expr const &, unsigned)> const & f):m_f(f) {}
    expr operator()(expr const & e) { return apply(e, 0); }
};

expr replace(expr const & e, std::function<optional<expr>(expr const &, unsigned)> const & f) {
    return replace_fn(f)(e);
}
}
