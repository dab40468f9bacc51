/*
Copyright (c) 2014 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <string>
#include <vector>
#include "util/debug.h"
#include "util/init_module.h"
#include "kernel/init_module.h"
#include "library/admitted.h"
#include "library/messages.h"
#include "library/init_module.h"
#include "library/program/init_module.h"
#include "frontends/program/session.h"
#include "tests/library/test_env.h"
using namespace obligo;

static optional<name> prog(char const * n) { return optional<name>(name(n)); }

static expr ref(name const & p, unsigned idx, expr const & type) {
    return mk_obligation_ref(mk_obligation_name(p, idx), type);
}

/* f : P (succ (succ zero)) := p_succ (succ zero) ?2 with ?1 : P zero, ?2 : P (succ zero) */
static progress start_f(session & s) {
    std::vector<obligation_info> obls;
    obls.emplace_back(P(zero()));
    obls.emplace_back(P(succ(zero())));
    expr body = mk_app(p_succ(), succ(zero()), ref("f", 1, P(succ(zero()))));
    return s.start_program_definition("f", P(succ(succ(zero()))), some_expr(body), universe_context(), obls);
}

static void tst1() {
    session s(mk_test_env());
    message_log log;
    scope_message_log scope(log);
    progress p = start_f(s);
    obligo_assert(p.is_remain() && p.get_remaining() == 2);
    s.obligation(2, prog("f"));
    obligo_assert(s.has_proof());
    /* a failed step leaves the proof unchanged */
    try {
        s.by(exact_tactic(p_zero()));
        obligo_unreachable();
    } catch (tactic_exception &) {
    }
    obligo_assert(get_open_goals(s.get_proof_state()) == 1);
    obligo_assert(s.by(apply_tactic(p_succ())));
    obligo_assert(s.by(exact_tactic(p_zero())));
    s.qed();
    obligo_assert(!s.has_proof());
    obligo_assert(s.env().get("f_obligation_2").is_theorem());
    obligo_assert(log.contains("1 obligation remaining"));
    s.next_obligation();
    obligo_assert(s.get_proof_state().get_name() == name("f_obligation_1"));
    s.by(exact_tactic(p_zero()));
    s.defined();
    obligo_assert(s.env().get("f_obligation_1").is_definition());
    obligo_assert(s.env().contains("f"));
    obligo_assert(log.contains("f is defined"));
    try {
        s.next_obligation();
        obligo_unreachable();
    } catch (ambiguous_program_exception &) {
    }
}

static void tst2() {
    session s(mk_test_env());
    try {
        s.add_variable("x", nat());
        obligo_unreachable();
    } catch (exception &) {
    }
    s.begin_section("sec");
    expr x  = s.add_variable("x", nat());
    expr hx = s.add_variable("hx", P(x));
    start_f(s);
    try {
        s.end_section();
        obligo_unreachable();
    } catch (unsolved_obligations_exception & ex) {
        obligo_assert(std::string(ex.what()) == "Unsolved obligations when closing section sec: f");
    }
    s.set_obligation_tactic(first_tactic({exact_tactic(p_zero()), then_tactic(apply_tactic(p_succ()), exact_tactic(p_zero()))}));
    progress p = s.solve_obligations();
    obligo_assert(p.is_defined());
    /* a theorem using the section variables */
    s.start_proof("lx", P(succ(x)));
    std::vector<expr> used = s.set_used_variables({name("hx")});
    obligo_assert(used.size() == 2 && used[1] == hx);
    s.by(apply_tactic(p_succ()));
    s.by(assumption_tactic());
    try {
        s.end_section();
        obligo_unreachable();
    } catch (exception &) {
    }
    s.qed();
    s.end_section();
    obligo_assert(s.env().get("lx").is_theorem());
    try {
        s.end_section();
        obligo_unreachable();
    } catch (exception &) {
    }
}

static void tst3() {
    session s(mk_test_env());
    s.set_deferred_proofs(true);
    s.start_proof("t", P(succ(zero())));
    s.set_endline_tactic(try_tactic(exact_tactic(p_zero())));
    s.by(apply_tactic(p_succ()));
    obligo_assert(get_open_goals(s.get_proof_state()) == 0);
    s.qed();
    obligo_assert(s.env().get("t").is_theorem());
    try {
        s.start_proof("t", P(zero()));
        obligo_unreachable();
    } catch (exception &) {
    }
    s.start_proof("u", P(succ(zero())));
    obligo_assert(!s.by(admit_tactic()));
    s.abort();
    obligo_assert(!s.has_proof());
    obligo_assert(!s.env().contains("u"));
    s.start_proof("u", P(succ(zero())));
    s.admitted();
    obligo_assert(is_admitted(s.env(), "u"));
    try {
        s.abort();
        obligo_unreachable();
    } catch (exception &) {
    }
}

static void tst4() {
    session s(mk_test_env());
    s.set_option(get_verbose_opt_name(), false);
    message_log log;
    scope_message_log scope(log);
    start_f(s);
    obligo_assert(!log.contains("obligations remaining"));
    s.obligation(1);
    s.admitted();
    obligo_assert(is_admitted(s.env(), "f_obligation_1"));
    s.admit_obligations();
    obligo_assert(s.env().contains("f"));
    obligo_assert(depends_on_admitted(s.env(), "f"));
    /* show_obligations is not affected by the verbose option */
    s.show_obligations(prog("f"));
    obligo_assert(log.contains("No more obligations remaining"));
}

static void tst5() {
    session s(mk_test_env());
    start_f(s);
    std::string t = s.show_term();
    obligo_assert(t.find("f : ") == 0);
    s.solve_obligation(1, prog("f"), exact_tactic(p_zero()));
    obligo_assert(get_program(s.env(), "f").get_remaining() == 1);
    s.solve_all_obligations(then_tactic(apply_tactic(p_succ()), exact_tactic(p_zero())));
    obligo_assert(s.env().contains("f"));
    environment empty;
    session s2(empty);
    try {
        s2.check_program_libraries();
        obligo_unreachable();
    } catch (exception &) {
    }
    s2.import_program_library();
    s2.check_program_libraries();
    session s3(mk_test_env());
    start_f(s3);
    s3.abandon_program("f");
    obligo_assert(!find_program(s3.env(), "f") && !s3.env().contains("f"));
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
    finalize_program_module();
    finalize_library_module();
    finalize_kernel_module();
    finalize_util_module();
    return has_violations() ? 1 : 0;
}
