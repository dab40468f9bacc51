/*
Copyright (c) 2015 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.
*/
#pragma once
#include "kernel/abstract.h"
#include "kernel/environment.h"
#include "library/program/obligations.h"

namespace obligo {
/* nat, zero, succ, a predicate P with p_zero : P zero and p_succ : Pi n, P n -> P (succ n) */
inline expr nat() { return mk_constant("nat"); }
inline expr zero() { return mk_constant("zero"); }
inline expr succ(expr const & n) { return mk_app(mk_constant("succ"), n); }
inline expr P(expr const & n) { return mk_app(mk_constant("P"), n); }
inline expr p_zero() { return mk_constant("p_zero"); }
inline expr p_succ() { return mk_constant("p_succ"); }

inline environment mk_test_env() {
    environment env;
    level_param_names no_ps;
    env = env.add(mk_axiom("nat", no_ps, mk_Type()));
    env = env.add(mk_axiom("zero", no_ps, nat()));
    env = env.add(mk_axiom("succ", no_ps, mk_arrow(nat(), nat())));
    env = env.add(mk_axiom("P", no_ps, mk_arrow(nat(), mk_Prop())));
    env = env.add(mk_axiom("p_zero", no_ps, P(zero())));
    expr n = mk_local("n", nat());
    env = env.add(mk_axiom("p_succ", no_ps, Pi(exprs({n}), mk_arrow(P(n), P(succ(n))))));
    return import_program_library(env);
}
}
