/*
Copyright (c) 2014 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include "kernel/find_fn.h"
#include "library/sorry.h"

namespace obligo {
static name * g_sorry_ax_name = nullptr;

name const & get_sorry_ax_name() {
    return *g_sorry_ax_name;
}

declaration mk_sorry_ax_decl() {
    name u("u");
    expr type = mk_pi(name("A"), mk_sort(mk_univ_param(u)), mk_var(0));
    return mk_axiom(*g_sorry_ax_name, level_param_names(u), type);
}

expr mk_sorry(expr const & ty, level const & l) {
    return mk_app(mk_constant(*g_sorry_ax_name, levels(l)), ty);
}

bool is_sorry(expr const & e) {
    return is_app(e) && is_constant(app_fn(e), *g_sorry_ax_name);
}

expr const & sorry_type(expr const & sry) {
    obligo_assert(is_sorry(sry));
    return app_arg(sry);
}

bool has_sorry(expr const & ex) {
    return static_cast<bool>(find(ex, [](expr const & e, unsigned) { return is_constant(e, *g_sorry_ax_name); }));
}

bool has_sorry(declaration const & d) {
    return has_sorry(d.get_type()) || (d.has_value() && has_sorry(d.get_value()));
}

void initialize_sorry() {
    g_sorry_ax_name = new name{"sorryAx"};
}

void finalize_sorry() {
    delete g_sorry_ax_name;
}
}
