/*
Copyright (c) 2016 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <vector>
#include "util/fresh_name.h"
#include "util/sstream.h"
#include "kernel/for_each_fn.h"
#include "library/exception.h"
#include "library/local_context.h"

namespace obligo {
expr local_context::mk_local_decl(name const & pp_name, expr const & type) {
    expr l = mk_local(mk_fresh_name(), pp_name, type);
    m_locals.push_back(l);
    return l;
}

void local_context::push_local(expr const & l) {
    obligo_assert(is_local(l));
    m_locals.push_back(l);
}

optional<expr> local_context::find_local(name const & n) const {
    for (expr const & l : m_locals) {
        if (mlocal_name(l) == n)
            return some_expr(l);
    }
    return none_expr();
}

optional<expr> local_context::find_local_by_user_name(name const & pp_name) const {
    auto it = m_locals.rbegin();
    for (; it != m_locals.rend(); ++it) {
        if (local_pp_name(*it) == pp_name)
            return some_expr(*it);
    }
    return none_expr();
}

expr local_context::get_local(name const & pp_name) const {
    if (auto l = find_local_by_user_name(pp_name))
        return *l;
    throw generic_exception(sstream() << "unknown hypothesis '" << pp_name << "'");
}

bool local_context::well_formed(expr const & e) const {
    bool ok = true;
    for_each(e, [&](expr const & c, unsigned) {
            if (!ok || !has_local(c))
                return false;
            if (is_local(c) && !contains(mlocal_name(c))) {
                ok = false;
                return false;
            }
            return true;
        });
    return ok;
}

bool local_context::is_subset_of(local_context const & ctx) const {
    for (expr const & l : m_locals) {
        if (!ctx.contains(mlocal_name(l)))
            return false;
    }
    return true;
}

std::ostream & operator<<(std::ostream & out, local_context const & lctx) {
    for (expr const & l : lctx.m_locals)
        out << local_pp_name(l) << " : " << mlocal_type(l) << "\n";
    return out;
}
}
