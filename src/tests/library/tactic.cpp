/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <vector>
#include "util/debug.h"
#include "util/init_module.h"
#include "kernel/init_module.h"
#include "kernel/type_checker.h"
#include "library/admitted.h"
#include "library/declare.h"
#include "library/sorry.h"
#include "library/tactic/tactic.h"
#include "library/init_module.h"
#include "library/program/init_module.h"
#include "tests/library/test_env.h"
using namespace obligo;

static expr mk_succ_stmt() {
    expr n = mk_local("n", nat());
    return Pi(exprs({n}), mk_arrow(P(n), P(succ(n))));
}

static void tst1() {
    environment env = mk_test_env();
    proof_state s(env, "t1", mk_succ_stmt(), universe_context());
    obligo_assert(get_open_goals(s) == 1);
    s = by(intros_tactic(), s).first;
    obligo_assert(get_open_goals(s) == 1);
    local_context ctx = get_current_goal_context(s).first;
    obligo_assert(ctx.size() == 2);
    /* a failing tactic does not change the state */
    try {
        by(exact_tactic(p_zero()), s);
        obligo_unreachable();
    } catch (tactic_exception &) {
    }
    obligo_assert(get_open_goals(s) == 1);
    auto r = by(apply_tactic(p_succ()), s);
    obligo_assert(r.second);
    s = r.first;
    obligo_assert(get_open_goals(s) == 1);
    obligo_assert(get_current_goal_context(s).second == P(ctx.get_locals()[0]));
    s = by(assumption_tactic(), s).first;
    obligo_assert(get_open_goals(s) == 0);
    environment new_env = save_lemma_proved(env, close_proof(s, true));
    obligo_assert(new_env.get("t1").is_theorem());
    type_checker tc(new_env);
    obligo_assert(tc.is_def_eq(new_env.get("t1").get_type(), mk_succ_stmt()));
}

static void tst2() {
    environment env = mk_test_env();
    proof_state s(env, "t2", mk_arrow(P(zero()), P(succ(succ(zero())))), universe_context());
    tactic t = then_tactic(intro_tactic("h"), repeat_tactic(apply_tactic(p_succ())));
    s = by(t, s).first;
    /* repeat stops on P zero */
    obligo_assert(get_open_goals(s) == 1);
    obligo_assert(get_current_goal_context(s).second == P(zero()));
    s = by(exact_tactic([](local_context const & ctx) { return ctx.get_local("h"); }), s).first;
    obligo_assert(get_open_goals(s) == 0);
    proof_output out = return_proof(s);
    obligo_assert(!out.m_admitted);
    obligo_assert(out.m_entries.size() == 1 && out.m_entries[0].m_value);
}

static void tst3() {
    environment env = mk_test_env();
    proof_state s(env, "t3", P(succ(zero())), universe_context());
    try {
        close_proof(s, true);
        obligo_unreachable();
    } catch (exception &) {
    }
    auto r = by(admit_tactic(), s);
    obligo_assert(!r.second);
    obligo_assert(get_open_goals(r.first) == 0);
    proof_output out = return_partial_proof(s);
    obligo_assert(out.m_admitted);
    obligo_assert(has_sorry(*out.m_entries[0].m_value));
    environment new_env = save_lemma_proved(env, close_proof(r.first, true));
    obligo_assert(depends_on_admitted(new_env, "t3"));
    new_env = save_lemma_admitted(env, s);
    obligo_assert(is_admitted(new_env, "t3"));
    obligo_assert(new_env.get("t3").is_axiom());
}

static void tst4() {
    environment env = mk_test_env();
    proof_state s(env, "t4", P(zero()), universe_context());
    s = by(exact_tactic(p_zero()), s).first;
    unsigned counter = 0;
    proof_object obj = close_future_proof(s, true, 7);
    obligo_assert(obj.is_deferred());
    obligo_assert(*obj.get_state_id() == 7);
    environment new_env = save_lemma_proved(env, obj);
    obligo_assert(new_env.contains("t4"));
    try {
        save_lemma_proved(env, obj);
        obligo_unreachable();
    } catch (exception &) {
        counter++;
    }
    obligo_assert(counter == 1);
}

static void tst5() {
    environment env = mk_test_env();
    local_context section;
    expr x  = section.mk_local_decl("x", nat());
    expr hx = section.mk_local_decl("hx", P(x));
    section.mk_local_decl("y", nat());
    proof_state s(env, "t5", P(succ(x)), universe_context(), section);
    auto r = set_used_variables(s, std::vector<name>({name("hx")}));
    obligo_assert(r.second.size() == 2);
    obligo_assert(r.second[0] == x && r.second[1] == hx);
    try {
        set_used_variables(r.first, std::vector<name>({name("x")}));
        obligo_unreachable();
    } catch (exception &) {
    }
    s = by(then_tactic(apply_tactic(p_succ()), assumption_tactic()), r.first).first;
    obligo_assert(get_open_goals(s) == 0);
    proof_output out = return_proof(s);
    /* the statement is abstracted over the used section variables */
    obligo_assert(is_pi(out.m_entries[0].m_type));
    obligo_assert(is_pi(binding_body(out.m_entries[0].m_type)));
    obligo_assert(!has_local(out.m_entries[0].m_type));
    environment new_env = save_lemma_proved(env, close_proof(s, true));
    obligo_assert(new_env.contains("t5"));
}

static void tst6() {
    environment env = mk_test_env();
    proof_state s(env, "t6", mk_arrow(P(zero()), P(zero())), universe_context());
    s = set_endline_tactic(s, try_tactic(assumption_tactic()));
    auto r = by_endline(intro_tactic(), s);
    obligo_assert(get_open_goals(r.first) == 0);
    proof_state s2 = compact(r.first);
    obligo_assert(s2.mctx().num_decls() <= r.first.mctx().num_decls());
    obligo_assert(s2.get_proof() == r.first.get_proof());
    try {
        by(fail_tactic("boom"), s);
        obligo_unreachable();
    } catch (tactic_exception & ex) {
        obligo_assert(std::string(ex.what()) == "boom");
    }
    proof_state s3 = by(orelse_tactic(fail_tactic(), then_tactic(intro_tactic(), assumption_tactic())), s).first;
    obligo_assert(get_open_goals(s3) == 0);
    proof_state s4 = by(first_tactic({apply_tactic(p_succ()), intro_tactic("h")}), s).first;
    obligo_assert(get_open_goals(s4) == 1);
    obligo_assert(get_current_goal_context(s4).first.size() == 1);
    /* open goals reachable through stored assignments are kept */
    proof_state s5 = compact(s4);
    obligo_assert(get_open_goals(s5) == 1);
    obligo_assert(s5.get_proof() == s4.get_proof());
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
    finalize_program_module();
    finalize_library_module();
    finalize_kernel_module();
    finalize_util_module();
    return has_violations() ? 1 : 0;
}
