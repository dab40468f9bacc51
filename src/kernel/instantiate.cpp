/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <algorithm>
#include <vector>
#include "kernel/replace_fn.h"
#include "kernel/for_each_fn.h"
#include "kernel/instantiate.h"

namespace obligo {
expr lift_loose_bvars(expr const & e, unsigned d) {
    if (d == 0 || !has_loose_bvars(e))
        return e;
    return replace(e, [=](expr const & m, unsigned offset) -> optional<expr> {
            if (m.get_loose_bv_range() <= offset)
                return some_expr(m);
            if (is_var(m))
                return some_expr(mk_var(var_idx(m) + d));
            return none_expr();
        });
}

expr lower_loose_bvars(expr const & e, unsigned d) {
    if (d == 0 || !has_loose_bvars(e))
        return e;
    return replace(e, [=](expr const & m, unsigned offset) -> optional<expr> {
            if (m.get_loose_bv_range() <= offset)
                return some_expr(m);
            if (is_var(m)) {
                obligo_assert(var_idx(m) >= offset + d);
                return some_expr(mk_var(var_idx(m) - d));
            }
            return none_expr();
        });
}

expr instantiate(expr const & e, unsigned n, expr const * s) {
    if (n == 0 || !has_loose_bvars(e))
        return e;
    return replace(e, [=](expr const & m, unsigned offset) -> optional<expr> {
            if (m.get_loose_bv_range() <= offset)
                return some_expr(m);
            if (is_var(m)) {
                unsigned idx = var_idx(m);
                if (idx < offset)
                    return some_expr(m);
                if (idx < offset + n)
                    return some_expr(lift_loose_bvars(s[idx - offset], offset));
                return some_expr(mk_var(idx - n));
            }
            return none_expr();
        });
}

expr instantiate_rev(expr const & e, unsigned n, expr const * s) {
    std::vector<expr> rev(s, s + n);
    std::reverse(rev.begin(), rev.end());
    return instantiate(e, n, rev.data());
}

expr instantiate(expr const & e, expr const & s) {
    return instantiate(e, 1, &s);
}

expr binding_body_instantiate(expr const & e, expr const & a) {
    obligo_assert(is_binding(e));
    return instantiate(binding_body(e), a);
}

expr instantiate_univ_params(expr const & e, level_param_names const & ps, levels const & ls) {
    if (!e.has_univ_param() || is_nil(ps))
        return e;
    return replace(e, [&](expr const & m, unsigned) -> optional<expr> {
            if (!m.has_univ_param())
                return some_expr(m);
            if (is_constant(m)) {
                std::vector<level> new_ls;
                for (level const & l : const_levels(m))
                    new_ls.push_back(instantiate(l, ps, ls));
                return some_expr(update_constant(m, to_list(new_ls)));
            }
            if (is_sort(m))
                return some_expr(update_sort(m, instantiate(sort_level(m), ps, ls)));
            return none_expr();
        });
}

expr instantiate_univ_params(expr const & e, name_map<level> const & s) {
    if (!e.has_univ_param() || s.empty())
        return e;
    return replace(e, [&](expr const & m, unsigned) -> optional<expr> {
            if (!m.has_univ_param())
                return some_expr(m);
            if (is_constant(m)) {
                std::vector<level> new_ls;
                for (level const & l : const_levels(m))
                    new_ls.push_back(instantiate(l, s));
                return some_expr(update_constant(m, to_list(new_ls)));
            }
            if (is_sort(m))
                return some_expr(update_sort(m, instantiate(sort_level(m), s)));
            return none_expr();
        });
}

void collect_univ_params(expr const & e, name_set & s) {
    if (!e.has_univ_param())
        return;
    for_each(e, [&](expr const & m, unsigned) {
            if (!m.has_univ_param())
                return false;
            if (is_constant(m)) {
                for (level const & l : const_levels(m))
                    collect_univ_params(l, s);
            } else if (is_sort(m)) {
                collect_univ_params(sort_level(m), s);
            }
            return true;
        });
}

bool is_head_beta(expr const & e) {
    return is_app(e) && is_lambda(get_app_fn(e));
}

expr head_beta_reduce(expr const & e) {
    if (!is_head_beta(e))
        return e;
    exprs args;
    expr f = get_app_args(e, args);
    unsigned i = 0;
    while (is_lambda(f) && i < args.size()) {
        f = binding_body_instantiate(f, args[i]);
        i++;
    }
    expr r = mk_app(f, args.size() - i, args.data() + i);
    return head_beta_reduce(r);
}

expr beta_reduce(expr const & e) {
    return replace(e, [](expr const & m, unsigned) -> optional<expr> {
            if (is_head_beta(m))
                return some_expr(beta_reduce(head_beta_reduce(m)));
            return none_expr();
        });
}
}
