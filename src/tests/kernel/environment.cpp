/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <vector>
#include "util/debug.h"
#include "util/init_module.h"
#include "kernel/abstract.h"
#include "kernel/environment.h"
#include "kernel/kernel_exception.h"
#include "kernel/type_checker.h"
#include "kernel/init_module.h"
using namespace obligo;

static environment mk_nat_env() {
    environment env;
    expr nat = mk_constant("nat");
    env = env.add(mk_axiom("nat", level_param_names(), mk_Type()));
    env = env.add(mk_axiom("zero", level_param_names(), nat));
    env = env.add(mk_axiom("succ", level_param_names(), mk_arrow(nat, nat)));
    return env;
}

static void tst1() {
    environment env = mk_nat_env();
    expr nat  = mk_constant("nat");
    expr zero = mk_constant("zero");
    expr succ = mk_constant("succ");
    obligo_assert(env.contains("succ"));
    environment env2 = env.add(mk_definition("one", level_param_names(), nat, mk_app(succ, zero)));
    obligo_assert(env2.is_descendant(env));
    obligo_assert(!env.is_descendant(env2));
    obligo_assert(!env.contains("one"));
    type_checker tc(env2);
    obligo_assert(tc.is_def_eq(mk_constant("one"), mk_app(succ, zero)));
    try {
        env2.add(mk_axiom("one", level_param_names(), nat));
        obligo_unreachable();
    } catch (already_declared_exception & ex) {
        obligo_assert(ex.get_name() == name("one"));
    }
}

static void tst2() {
    environment env = mk_nat_env();
    expr nat = mk_constant("nat");
    try {
        env.add(mk_definition("bad", level_param_names(), nat, nat));
        obligo_unreachable();
    } catch (definition_type_mismatch_exception &) {
    }
    try {
        env.add(mk_axiom("bad", level_param_names(), mk_local("x", nat)));
        obligo_unreachable();
    } catch (kernel_exception &) {
    }
    try {
        env.add(mk_axiom("bad", level_param_names(), mk_sort(mk_univ_param("u"))));
        obligo_unreachable();
    } catch (undeclared_universe_exception &) {
    }
    try {
        env.get("unknown");
        obligo_unreachable();
    } catch (unknown_constant_exception &) {
    }
}

static void tst3() {
    environment env = mk_nat_env();
    expr nat  = mk_constant("nat");
    expr even = mk_constant("even");
    expr odd  = mk_constant("odd");
    expr n    = mk_local("n", nat);
    expr t    = mk_arrow(nat, mk_Prop());
    /* the bodies only have to be well typed when even and odd are opaque */
    std::vector<declaration> ds;
    ds.push_back(mk_recursive_definition("even", level_param_names(), t, Fun(exprs({n}), mk_app(odd, n)),
                                         optional<unsigned>(0)));
    ds.push_back(mk_recursive_definition("odd", level_param_names(), t, Fun(exprs({n}), mk_app(even, n)),
                                         optional<unsigned>(0)));
    environment env2 = env.add_mutual(ds);
    obligo_assert(env2.get("even").is_recursive());
    obligo_assert(*env2.get("odd").get_recursive_arg() == 0);
    ds[0] = mk_recursive_definition("even", level_param_names(), t, Fun(exprs({n}), mk_app(odd, n)),
                                    optional<unsigned>(1));
    try {
        env.add_mutual(ds);
        obligo_unreachable();
    } catch (kernel_exception &) {
    }
}

int main() {
    initialize_util_module();
    initialize_kernel_module();
    tst1();
    tst2();
    tst3();
    finalize_kernel_module();
    finalize_util_module();
    return has_violations() ? 1 : 0;
}
