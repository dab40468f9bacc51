/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <sstream>
#include <string>
#include "util/debug.h"
#include "util/init_module.h"
#include "kernel/expr.h"
#include "kernel/abstract.h"
#include "kernel/instantiate.h"
#include "kernel/init_module.h"
using namespace obligo;

static std::string to_str(expr const & e) {
    std::ostringstream out;
    out << e;
    return out.str();
}

static void tst1() {
    expr A = mk_constant("A");
    expr a = mk_local("a", A);
    expr f = mk_constant("f");
    expr e = mk_app(f, a, a);
    obligo_assert(has_local(e));
    obligo_assert(!has_loose_bvars(e));
    expr l = Fun(exprs({a}), e);
    obligo_assert(is_lambda(l));
    obligo_assert(!has_local(l));
    obligo_assert(closed(l));
    expr b = mk_constant("b");
    obligo_assert(binding_body_instantiate(l, b) == mk_app(f, b, b));
    obligo_assert(head_beta_reduce(mk_app(l, b)) == mk_app(f, b, b));
}

static void tst2() {
    expr A = mk_constant("A");
    expr x = mk_local("x", A);
    expr y = mk_local("y", A);
    expr g = mk_constant("g");
    expr p = Pi(exprs({x, y}), mk_app(g, x, y));
    obligo_assert(is_pi(p));
    obligo_assert(is_pi(binding_body(p)));
    obligo_assert(binding_name(p) == name("x"));
    exprs args;
    expr const & fn = get_app_args(mk_app(g, x, y), args);
    obligo_assert(fn == g);
    obligo_assert(args.size() == 2 && args[0] == x && args[1] == y);
    obligo_assert(replace_local(mk_app(g, x, y), x, y) == mk_app(g, y, y));
    obligo_assert(occurs_local(mlocal_name(x), mk_app(g, x, y)));
}

static void tst3() {
    level u = mk_univ_param("u");
    expr c = mk_constant("c", levels({u}));
    expr s = mk_sort(u);
    obligo_assert(has_univ_param(c));
    name_set ps;
    collect_univ_params(mk_app(c, s), ps);
    obligo_assert(ps.size() == 1 && ps.contains(name("u")));
    expr c1 = instantiate_univ_params(c, level_param_names({name("u")}), levels({mk_level_one()}));
    obligo_assert(!has_univ_param(c1));
    obligo_assert(mk_Prop() == mk_sort(mk_level_zero()));
    obligo_assert(to_str(mk_Prop()) == "Prop");
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
