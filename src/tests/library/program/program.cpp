/*
Copyright (c) 2015 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <string>
#include <vector>
#include "util/debug.h"
#include "util/init_module.h"
#include "kernel/init_module.h"
#include "library/admitted.h"
#include "library/io_state.h"
#include "library/messages.h"
#include "library/tactic/tactic.h"
#include "library/init_module.h"
#include "library/program/init_module.h"
#include "tests/library/test_env.h"
using namespace obligo;

static optional<name> none_prog() { return optional<name>(); }
static optional<name> prog(char const * n) { return optional<name>(name(n)); }

static expr ref(name const & p, unsigned idx, expr const & type) {
    return mk_obligation_ref(mk_obligation_name(p, idx), type);
}

/* Interactive proof of the obligation k of p closed with t. */
static environment prove(environment const & env, unsigned k, char const * p, tactic const & t, bool opaque = false) {
    proof_state s = start_obligation(env, k, prog(p));
    s = by(t, s).first;
    return save_lemma_proved(env, close_proof(s, opaque));
}

static tactic succ_zero_tactic() {
    return then_tactic(apply_tactic(p_succ()), exact_tactic(p_zero()));
}

/* c : P (succ ?1) := ?3 with ?1 : nat, ?2 : P ?1, ?3 : P (succ ?1) */
static pair<environment, progress> mk_chain(environment const & env, decl_info const & info = decl_info()) {
    expr r1 = ref("c", 0, nat());
    std::vector<obligation_info> obls;
    obls.emplace_back(nat());
    obls.emplace_back(P(r1), std::set<unsigned>({0}));
    obls.emplace_back(P(succ(r1)), std::set<unsigned>({1}));
    return add_definition(env, "c", P(succ(r1)), some_expr(ref("c", 2, P(succ(r1)))),
                          universe_context(), obls, info);
}

static void tst1() {
    environment env = mk_test_env();
    message_log log;
    scope_message_log scope(log);
    auto r = mk_chain(env);
    obligo_assert(r.second.is_remain() && r.second.get_remaining() == 3);
    env = r.first;
    obligo_assert(log.contains("3 obligations remaining"));
    obligo_assert(num_pending_programs(env) == 1);
    /* obligations are solved after their dependencies */
    try {
        start_obligation(env, 3, prog("c"));
        obligo_unreachable();
    } catch (obligation_exception & ex) {
        obligo_assert(std::string(ex.what()) == "Obligations 2 of c remain to be solved first");
    }
    try {
        start_obligation(env, 4, prog("c"));
        obligo_unreachable();
    } catch (unknown_obligation_exception & ex) {
        obligo_assert(ex.get_idx() == 4);
    }
    env = prove(env, 1, "c", exact_tactic(zero()));
    obligo_assert(get_program(env, "c").get_remaining() == 2);
    obligo_assert(env.get("c_obligation_1").is_definition());
    try {
        start_obligation(env, 1, prog("c"));
        obligo_unreachable();
    } catch (obligation_exception & ex) {
        obligo_assert(std::string(ex.what()) == "Obligation 1 already solved");
    }
    /* the solved dependency is unfolded in the goal */
    proof_state s = start_obligation(env, 2, none_prog());
    obligo_assert(get_current_goal_context(s).second == P(zero()));
    env = prove(env, 2, "c", exact_tactic(p_zero()));
    obligo_assert(get_program(env, "c").get_remaining() == 1);
    env = prove(env, 3, "c", succ_zero_tactic(), true);
    obligo_assert(env.get("c_obligation_3").is_theorem());
    obligo_assert(!find_program(env, "c"));
    obligo_assert(num_pending_programs(env) == 0);
    declaration d = env.get("c");
    obligo_assert(d.get_value() == mk_constant("c_obligation_3"));
    obligo_assert(d.get_type() == P(succ(mk_constant("c_obligation_1"))));
}

static void tst2() {
    environment env = mk_test_env();
    /* the program tactic solves the obligation right away */
    std::vector<obligation_info> obls({obligation_info(P(zero()))});
    expr body = mk_app(p_succ(), zero(), ref("d", 0, P(zero())));
    auto r = add_definition(env, "d", P(succ(zero())), some_expr(body), universe_context(), obls,
                            decl_info(), exact_tactic(p_zero()));
    obligo_assert(r.second.is_defined() && r.second.get_ref() == name("d"));
    obligo_assert(r.first.contains("d_obligation_1"));
    obligo_assert(r.first.get("d").get_value() == mk_app(p_succ(), zero(), mk_constant("d_obligation_1")));
    /* an expanded obligation is not declared, its solution is folded into the body */
    obligation_status st(false, obligation_definition_status::Expand);
    std::vector<obligation_info> obls2({obligation_info(P(zero()), std::set<unsigned>(), st, obligation_location(),
                                                        exact_tactic(p_zero()))});
    expr body2 = mk_app(p_succ(), zero(), ref("e", 0, P(zero())));
    r = add_definition(env, "e", P(succ(zero())), some_expr(body2), universe_context(), obls2);
    obligo_assert(r.second.is_defined());
    obligo_assert(!r.first.contains("e_obligation_1"));
    obligo_assert(r.first.get("e").get_value() == mk_app(p_succ(), zero(), p_zero()));
    /* no tactic applies: the obligation stays open */
    r = add_definition(env, "e", P(succ(zero())), some_expr(body2), universe_context(),
                       std::vector<obligation_info>({obligation_info(P(zero()), std::set<unsigned>(), st)}));
    obligo_assert(r.second.is_remain() && r.second.get_remaining() == 1);
    try {
        prove(r.first, 1, "e", exact_tactic(p_zero()), true);
        obligo_unreachable();
    } catch (obligation_exception &) {
    }
    environment env2 = prove(r.first, 1, "e", exact_tactic(p_zero()), false);
    obligo_assert(env2.get("e").get_value() == mk_app(p_succ(), zero(), p_zero()));
}

static void tst3() {
    environment env = mk_test_env();
    unsigned calls = 0;
    declaration_hook hook = [&](environment const & e, hook_data const & d) {
        calls++;
        obligo_assert(e.contains(d.m_ref));
        obligo_assert(!find_program(e, d.m_ref));
        obligo_assert(d.m_scope == decl_scope::Local);
        return e;
    };
    decl_info info(decl_scope::Local, decl_kind::Definition, false, hook);
    /* without obligations the definition is declared at once, the registry is not used */
    auto r = add_definition(env, "z", nat(), some_expr(zero()), universe_context(),
                            std::vector<obligation_info>(), info);
    obligo_assert(r.second.is_defined());
    obligo_assert(calls == 1);
    obligo_assert(num_pending_programs(r.first) == 0);
    obligo_assert(r.first.get("z").is_definition());
    try {
        add_definition(r.first, "z", nat(), some_expr(zero()), universe_context(), std::vector<obligation_info>());
        obligo_unreachable();
    } catch (exception &) {
    }
    /* the hook is called once, after the program left the registry */
    calls = 0;
    r = mk_chain(env, info);
    env = r.first;
    obligo_assert(calls == 0);
    env = prove(env, 1, "c", exact_tactic(zero()));
    env = prove(env, 2, "c", exact_tactic(p_zero()));
    obligo_assert(calls == 0);
    env = prove(env, 3, "c", succ_zero_tactic());
    obligo_assert(calls == 1);
}

static void tst4() {
    environment env = mk_test_env();
    env = mk_chain(env).first;
    message_log log;
    scope_message_log scope(log);
    env = admit_obligations(env, none_prog());
    obligo_assert(!find_program(env, "c"));
    obligo_assert(is_admitted(env, "c_obligation_1"));
    obligo_assert(is_admitted(env, "c_obligation_3"));
    obligo_assert(depends_on_admitted(env, "c"));
    log.clear();
    show_obligations(env, prog("c"));
    obligo_assert(log.contains("No more obligations remaining"));
    try {
        show_obligations(env, prog("unknown"));
        obligo_unreachable();
    } catch (exception &) {
    }
}

static void tst5() {
    environment env = mk_test_env();
    try {
        get_unique_open_program(env, none_prog());
        obligo_unreachable();
    } catch (ambiguous_program_exception & ex) {
        obligo_assert(ex.get_programs().empty());
        obligo_assert(std::string(ex.what()) == "No obligations remaining");
    }
    env = mk_chain(env).first;
    obligo_assert(get_unique_open_program(env, none_prog()).get_name() == name("c"));
    std::vector<obligation_info> obls({obligation_info(P(zero()))});
    env = add_definition(env, "d", P(succ(zero())), some_expr(mk_app(p_succ(), zero(), ref("d", 0, P(zero())))),
                         universe_context(), obls).first;
    try {
        get_unique_open_program(env, none_prog());
        obligo_unreachable();
    } catch (ambiguous_program_exception & ex) {
        obligo_assert(ex.get_programs().size() == 2);
    }
    obligo_assert(get_unique_open_program(env, prog("d")).get_name() == name("d"));
    try {
        check_solved_obligations(env, "section s");
        obligo_unreachable();
    } catch (unsolved_obligations_exception & ex) {
        obligo_assert(ex.get_programs().size() == 2);
        obligo_assert(std::string(ex.what()).find("section s") != std::string::npos);
    }
    env = solve_obligations(env, prog("d"), exact_tactic(p_zero())).first;
    env = abandon_program(env, "c");
    check_solved_obligations(env, "section s");
    obligo_assert(env.contains("d") && !env.contains("c"));
}

static void tst6() {
    environment env = mk_test_env();
    expr n  = mk_local("n", nat());
    expr ty = mk_arrow(nat(), nat());
    expr o  = ref("odd", 0, nat());
    std::vector<mutual_member> ms;
    ms.emplace_back("even", ty, Fun(exprs({n}), mk_app(mk_constant("odd"), n)), std::vector<obligation_info>(),
                    std::vector<name>({name("n")}), optional<name>(name("n")));
    ms.emplace_back("odd", ty, Fun(exprs({n}), mk_app(mk_constant("even"), o)),
                    std::vector<obligation_info>({obligation_info(nat())}),
                    std::vector<name>({name("n")}), optional<name>(name("n")));
    std::vector<std::string> notations({std::string("x =o= y")});
    auto r = add_mutual_definitions(env, ms, universe_context(), decl_kind::Fixpoint, decl_info(), notations);
    obligo_assert(r.second.is_remain() && r.second.get_remaining() == 1);
    env = r.first;
    obligo_assert(num_pending_programs(env) == 1);
    obligo_assert(find_program(env, "even"));
    obligo_assert(get_program(env, "even").get_deps().size() == 2);
    env = prove(env, 1, "odd", exact_tactic(zero()));
    obligo_assert(!find_program(env, "even") && !find_program(env, "odd"));
    obligo_assert(env.get("even").is_recursive());
    obligo_assert(env.get("odd").get_value() == Fun(exprs({n}), mk_app(mk_constant("even"), mk_constant("odd_obligation_1"))));
    obligo_assert(get_recorded_notations(env, "even") == notations);
    /* abandoning a member drops the whole group */
    environment env2 = add_mutual_definitions(mk_test_env(), ms, universe_context(), decl_kind::Fixpoint).first;
    env2 = abandon_program(env2, "odd");
    obligo_assert(get_programs(env2).empty());
}

static void tst7() {
    environment env = mk_test_env();
    /* without body the whole term is an obligation */
    auto r = add_definition(env, "nb", P(succ(zero())), none_expr(), universe_context(), std::vector<obligation_info>());
    obligo_assert(r.second.is_remain() && r.second.get_remaining() == 1);
    env = r.first;
    program_decl p = get_program(env, "nb");
    obligo_assert(p.get_obligations()[0].get_name() == name("nb_obligation"));
    proof_state s = next_obligation(env, prog("nb"), apply_tactic(p_succ()));
    obligo_assert(get_open_goals(s) == 1);
    s = by(exact_tactic(p_zero()), s).first;
    env = save_lemma_proved(env, close_proof(s, false));
    obligo_assert(env.get("nb").get_value() == mk_constant("nb_obligation"));
    try {
        next_obligation(env, prog("nb"));
        obligo_unreachable();
    } catch (exception &) {
    }
}

static void tst8() {
    environment env = mk_test_env();
    env = mk_chain(env).first;
    options opts = get_global_ios().get_options().update(name{"program", "max_shown_obligations"}, 1u);
    io_state ios(get_global_ios(), opts);
    scope_global_ios scope1(ios);
    message_log log;
    scope_message_log scope2(log);
    show_obligations(env, none_prog());
    obligo_assert(log.contains("3 obligations remaining"));
    obligo_assert(log.contains("Obligation 1 of c"));
    obligo_assert(!log.contains("Obligation 2 of c"));
    std::string t = show_term(env, prog("c"));
    obligo_assert(t.find("c : ") == 0);
    obligo_assert(log.contains("c_obligation_3"));
    /* the first attemptable obligation is the lowest one */
    obligo_assert(next_obligation(env, none_prog()).get_name() == name("c_obligation_1"));
    /* the default obligation tactic cannot solve nat, a session tactic can */
    environment env2 = solve_all_obligations(env);
    obligo_assert(get_program(env2, "c").get_remaining() == 3);
    env2 = set_obligation_tactic(env, first_tactic({exact_tactic(zero()), exact_tactic(p_zero()), succ_zero_tactic()}));
    env2 = try_solve_obligation(env2, 1, none_prog());
    obligo_assert(get_program(env2, "c").get_remaining() == 2);
    env2 = try_solve_obligations(env2, none_prog());
    obligo_assert(!find_program(env2, "c"));
}

static void tst9() {
    environment env = mk_test_env();
    env = mk_chain(env).first;
    options opts = get_global_ios().get_options().update(name{"program", "transparent_obligations"}, true);
    io_state ios(get_global_ios(), opts);
    scope_global_ios scope(ios);
    env = prove(env, 1, "c", exact_tactic(zero()), true);
    obligo_assert(env.get("c_obligation_1").is_definition());
    check_program_libraries(env);
    try {
        check_program_libraries(environment());
        obligo_unreachable();
    } catch (exception &) {
    }
}

/* q : Pi (A : Sort u) (B : Sort v), Type.{w} := fun A B, ?1 A  with  ?1 : Pi (A : Sort u), Type.{w}
   in the context u <= w, v <= w where w is flexible */
static environment mk_universe_program(obligation_definition_status d, bool automatic) {
    environment env = mk_test_env();
    level u = mk_univ_param("u"), v = mk_univ_param("v"), w = mk_univ_param("w");
    universe_context uctx = universe_context().add_param("u").add_param("v").add_param("w", true)
        .add_constraint(mk_le("u", "w")).add_constraint(mk_le("v", "w"));
    expr A = mk_local("A", mk_sort(u));
    expr B = mk_local("B", mk_sort(v));
    expr type_w = mk_sort(mk_succ(w));
    expr obl_type = Pi(exprs({A}), type_w);
    expr sol = Fun(exprs({A}), mk_sort(w));
    obligation_info info(obl_type, std::set<unsigned>(), obligation_status(false, d), obligation_location(),
                         automatic ? exact_tactic(sol) : tactic());
    expr body = Fun(exprs({A, B}), mk_app(ref("q", 0, obl_type), A));
    auto r = add_definition(env, "q", Pi(exprs({A, B}), type_w), some_expr(body), uctx,
                            std::vector<obligation_info>({info}));
    if (automatic) {
        obligo_assert(r.second.is_defined());
        return r.first;
    }
    obligo_assert(r.second.is_remain());
    return prove(r.first, 1, "q", exact_tactic(sol));
}

static void tst10() {
    for (obligation_definition_status d : {obligation_definition_status::Expand, obligation_definition_status::Define}) {
        environment env1 = mk_universe_program(d, true);
        environment env2 = mk_universe_program(d, false);
        declaration d1 = env1.get("q");
        declaration d2 = env2.get("q");
        obligo_assert(d1.get_value() == d2.get_value());
        obligo_assert(d1.get_type() == d2.get_type());
        /* w has two lower bounds, it survives minimization */
        obligo_assert(length(d1.get_univ_params()) == 3);
        obligo_assert(length(d2.get_univ_params()) == 3);
        if (d == obligation_definition_status::Define) {
            obligo_assert(length(env2.get("q_obligation_1").get_univ_params()) == 3);
            obligo_assert(env1.get("q_obligation_1").get_value() == env2.get("q_obligation_1").get_value());
        }
    }
}

static void tst11() {
    environment env = mk_test_env();
    expr body = mk_app(p_succ(), zero(), ref("d", 0, P(zero())));
    std::vector<obligation_info> out_of_range({obligation_info(P(zero()), std::set<unsigned>({5}))});
    try {
        add_definition(env, "d", P(succ(zero())), some_expr(body), universe_context(), out_of_range);
        obligo_unreachable();
    } catch (obligation_exception &) {
    }
    std::vector<obligation_info> self({obligation_info(P(zero()), std::set<unsigned>({0}))});
    try {
        add_definition(env, "d", P(succ(zero())), some_expr(body), universe_context(), self);
        obligo_unreachable();
    } catch (obligation_exception &) {
    }
    obligo_assert(num_pending_programs(env) == 0);
    expr n  = mk_local("n", nat());
    std::vector<mutual_member> ms;
    ms.emplace_back("loop", mk_arrow(nat(), nat()), Fun(exprs({n}), mk_app(mk_constant("loop"), ref("loop", 0, nat()))),
                    std::vector<obligation_info>({obligation_info(nat(), std::set<unsigned>({1}))}));
    try {
        add_mutual_definitions(env, ms, universe_context(), decl_kind::CoFixpoint);
        obligo_unreachable();
    } catch (obligation_exception &) {
    }
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
    tst8();
    tst9();
    tst10();
    tst11();
    finalize_program_module();
    finalize_library_module();
    finalize_kernel_module();
    finalize_util_module();
    return has_violations() ? 1 : 0;
}
