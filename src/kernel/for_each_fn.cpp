/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <vector>
#include "kernel/for_each_fn.h"

namespace obligo {
void for_each(expr const & e, std::function<bool(expr const &, unsigned)> const & f) {
    std::vector<pair<expr, unsigned>> todo;
    todo.push_back(mk_pair(e, 0u));
    while (!todo.empty()) {
        auto p = todo.back();
        todo.pop_back();
        expr const & c   = p.first;
        unsigned offset  = p.second;
        if (!f(c, offset))
            continue;
        switch (c.kind()) {
        case expr_kind::Var: case expr_kind::Sort: case expr_kind::Constant:
            break;
        case expr_kind::Local: case expr_kind::Meta:
            todo.push_back(mk_pair(mlocal_type(c), offset));
            break;
        case expr_kind::App:
            todo.push_back(mk_pair(app_arg(c), offset));
            todo.push_back(mk_pair(app_fn(c), offset));
            break;
        case expr_kind::Lambda: case expr_kind::Pi:
            todo.push_back(mk_pair(binding_body(c), offset + 1));
            todo.push_back(mk_pair(binding_domain(c), offset));
            break;
        }
    }
}
}
