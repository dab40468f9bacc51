/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include "kernel/declaration.h"

namespace obligo {
declaration mk_definition(name const & n, level_param_names const & ps, expr const & t, expr const & v) {
    return declaration(std::make_shared<declaration::cell>(n, ps, t, v, declaration_kind::Definition));
}

declaration mk_theorem(name const & n, level_param_names const & ps, expr const & t, expr const & v) {
    return declaration(std::make_shared<declaration::cell>(n, ps, t, v, declaration_kind::Theorem));
}

declaration mk_axiom(name const & n, level_param_names const & ps, expr const & t) {
    return declaration(std::make_shared<declaration::cell>(n, ps, t, expr(), declaration_kind::Axiom));
}

declaration mk_recursive_definition(name const & n, level_param_names const & ps, expr const & t,
                                    expr const & v, optional<unsigned> const & rec_arg) {
    auto c = std::make_shared<declaration::cell>(n, ps, t, v, declaration_kind::Definition);
    c->m_recursive = true;
    c->m_rec_arg   = rec_arg;
    return declaration(c);
}
}
