/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <string>
#include <vector>
#include "util/debug.h"
#include "util/init_module.h"
#include "kernel/init_module.h"
#include "library/admitted.h"
#include "library/declare.h"
#include "library/messages.h"
#include "library/tactic/tactic.h"
#include "library/init_module.h"
#include "library/program/init_module.h"
#include "tests/library/test_env.h"
using namespace obligo;

static void tst1() {
    environment env = mk_test_env();
    unsigned calls = 0;
    name ref;
    declaration_hook hook = [&](environment const & e, hook_data const & d) {
        calls++;
        ref = d.m_ref;
        obligo_assert(e.contains(d.m_ref));
        return e.add(mk_axiom(name(d.m_ref, "spec"), level_param_names(), P(mk_constant(d.m_ref))));
    };
    message_log log;
    environment new_env;
    {
        scope_message_log scope(log);
        new_env = declare_definition(env, "two", decl_info(decl_scope::Global, decl_kind::Definition, false, hook),
                                     nat(), succ(succ(zero())), universe_context());
    }
    obligo_assert(calls == 1);
    obligo_assert(ref == name("two"));
    obligo_assert(new_env.get("two").is_definition());
    obligo_assert(new_env.contains(name("two", "spec")));
    obligo_assert(log.contains("two is defined"));
    obligo_assert(!log.has_errors());
}

static void tst2() {
    environment env = mk_test_env();
    declaration_hook hook = [](environment const &, hook_data const &) -> environment {
        throw exception("hook exploded");
    };
    message_log log;
    environment new_env;
    {
        scope_message_log scope(log);
        new_env = declare_definition(env, "th", decl_info(decl_scope::Global, decl_kind::Theorem, true, hook),
                                     P(zero()), p_zero(), universe_context());
    }
    /* the definition is kept even though the hook failed */
    obligo_assert(new_env.get("th").is_theorem());
    obligo_assert(log.has_errors());
    obligo_assert(log.contains("hook exploded"));
}

static void tst3() {
    environment env = mk_test_env();
    environment env1 = declare_admitted(env, "ax1", P(succ(zero())), universe_context());
    obligo_assert(is_admitted(env1, "ax1"));
    obligo_assert(env1.get("ax1").is_axiom());
    environment env2 = declare_assumption(env, "ax2", decl_info(), P(succ(zero())), universe_context());
    obligo_assert(env2.get("ax2").is_axiom());
    obligo_assert(!is_admitted(env2, "ax2"));
    try {
        declare_assumption(env2, "ax2", decl_info(), P(zero()), universe_context());
        obligo_unreachable();
    } catch (exception &) {
    }
}

static void tst4() {
    environment env = mk_test_env();
    expr n = mk_local("n", nat());
    expr ty = mk_arrow(nat(), nat());
    /* even n := odd n, odd n := even n */
    fixpoint_member even("even", ty, Fun(exprs({n}), mk_app(mk_constant("odd"), n)),
                         std::vector<name>({name("n")}), optional<name>(name("n")));
    fixpoint_member odd("odd", ty, Fun(exprs({n}), mk_app(mk_constant("even"), n)),
                        std::vector<name>({name("n")}), optional<name>(name("n")));
    std::vector<std::string> notations({std::string("x =e= y")});
    unsigned calls = 0;
    declaration_hook hook = [&](environment const & e, hook_data const & d) {
        calls++;
        obligo_assert(d.m_ref == name("even"));
        return e;
    };
    message_log log;
    environment new_env;
    {
        scope_message_log scope(log);
        new_env = declare_mutually_recursive(env, decl_info(decl_scope::Global, decl_kind::Fixpoint, false, hook),
                                             {even, odd}, universe_context(), notations);
    }
    obligo_assert(calls == 1);
    obligo_assert(new_env.get("even").is_recursive());
    obligo_assert(new_env.get("odd").is_recursive());
    obligo_assert(get_recorded_notations(new_env, "odd") == notations);
    obligo_assert(get_recorded_notations(env, "odd").empty());
    obligo_assert(log.contains("even is recursively defined"));
    obligo_assert(log.contains("odd is recursively defined"));
    /* the structural argument must be one of the arguments */
    fixpoint_member bad("bad", ty, Fun(exprs({n}), mk_app(mk_constant("bad"), n)),
                        std::vector<name>({name("n")}), optional<name>(name("m")));
    try {
        register_mutually_recursive(env, decl_kind::Fixpoint, {bad}, universe_context(), {});
        obligo_unreachable();
    } catch (exception &) {
    }
    environment co_env = declare_mutually_recursive(env, decl_info(decl_scope::Global, decl_kind::CoFixpoint),
                                                    {fixpoint_member("loop", ty, Fun(exprs({n}), mk_app(mk_constant("loop"), n)))},
                                                    universe_context());
    obligo_assert(co_env.get("loop").is_recursive());
}

static void tst5() {
    universe_context uctx = universe_context().add_param("u").add_param("v").add_param("w", true);
    uctx = uctx.add_constraint(mk_le("w", "u"));
    expr e = mk_sort(mk_univ_param("u"));
    auto r = prepare_universe_context(uctx, std::vector<expr>({e}));
    obligo_assert(r.first.get_params().size() == 1);
    obligo_assert(r.first.contains("u"));
    obligo_assert(!r.first.contains("v"));
}

static void tst6() {
    environment env = mk_test_env();
    unsigned calls = 0;
    declaration_hook hook = [&](environment const & e, hook_data const &) { calls++; return e; };
    proof_state s(env, "l1", P(succ(zero())), universe_context());
    s = by(then_tactic(apply_tactic(p_succ()), exact_tactic(p_zero())), s).first;
    environment new_env = save_lemma_proved(env, close_proof(s, false),
                                            decl_info(decl_scope::Global, decl_kind::Definition, true, hook));
    obligo_assert(calls == 1);
    /* the proof object decides whether the result is opaque */
    obligo_assert(new_env.get("l1").is_definition());
    new_env = save_lemma_proved(env, close_proof(s, true));
    obligo_assert(new_env.get("l1").is_theorem());
}

static void tst7() {
    environment env = mk_test_env();
    unsigned calls = 0;
    proof_terminator fn = [&](environment const & e, proof_output const & out, bool opaque) {
        calls++;
        obligo_assert(!opaque);
        obligo_assert(out.m_entries.size() == 1);
        obligo_assert(out.m_uctx.get_params().empty());
        return e.add(mk_definition("derived", level_param_names(), out.m_entries[0].m_type, *out.m_entries[0].m_value));
    };
    universe_context uctx = universe_context().add_param("u", true);
    proof_state s(env, "d", P(zero()), uctx, local_context(), proof_ending::mk_derive("d", fn));
    s = by(exact_tactic(p_zero()), s).first;
    environment new_env = save_lemma_proved(env, close_proof(s, false));
    obligo_assert(calls == 1);
    obligo_assert(new_env.contains("derived"));
    obligo_assert(!new_env.contains("d"));
}

int main() {
    initialize_util_module();
    initialize_kernel_module();
    initialize_library_module();
    initialize_program_module();
    tst1();
    tst2();
    tst3();
    tst4();
    tst5();
    tst6();
    tst7();
    finalize_program_module();
    finalize_library_module();
    finalize_kernel_module();
    finalize_util_module();
    return has_violations() ? 1 : 0;
}
