/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include "util/debug.h"
#include "util/init_module.h"
#include "kernel/init_module.h"
#include "library/init_module.h"
#include "library/program/obligation.h"
#include "library/program/init_module.h"
#include "tests/library/test_env.h"
using namespace obligo;

static obligation mk_obl(name const & prog, unsigned idx, expr const & type, std::set<unsigned> const & deps) {
    return obligation(mk_obligation_name(prog, idx), type, obligation_location(), deps, obligation_status());
}

/* 0 <- 1 <- 2, 3 depends on 0 and 2 */
static std::vector<obligation> mk_chain() {
    std::vector<obligation> obls;
    obls.push_back(mk_obl("f", 0, nat(), {}));
    expr r0 = mk_obligation_ref(obls[0]);
    obls.push_back(mk_obl("f", 1, P(r0), {0}));
    obls.push_back(mk_obl("f", 2, P(succ(r0)), {1}));
    obls.push_back(mk_obl("f", 3, nat(), {0, 2}));
    return obls;
}

static void tst1() {
    obligo_assert(mk_obligation_name("f", 0) == name("f_obligation_1"));
    obligo_assert(mk_obligation_name(name("a", "f"), 2) == name(name("a"), "f_obligation_3"));
    std::vector<obligation> obls = mk_chain();
    obligo_assert(dependencies(obls, 0).empty());
    obligo_assert(dependencies(obls, 2) == std::set<unsigned>({0, 1}));
    obligo_assert(dependencies(obls, 3) == std::set<unsigned>({0, 1, 2}));
    obligo_assert(dependents(obls, 0) == std::set<unsigned>({1, 3}));
    obligo_assert(dependents(obls, 2) == std::set<unsigned>({3}));
    obligo_assert(dependents(obls, 3).empty());
}

static void tst2() {
    std::vector<obligation> obls = mk_chain();
    obligo_assert(count_remaining(obls) == 4);
    obligo_assert(is_attemptable(obls, 0));
    obligo_assert(!is_attemptable(obls, 1));
    obls[0] = obls[0].set_body(obligation_body::mk_term(zero()));
    obligo_assert(obls[0].is_solved());
    obligo_assert(count_remaining(obls) == 3);
    obligo_assert(is_attemptable(obls, 1));
    obligo_assert(!is_attemptable(obls, 3));
    obligo_assert(deps_remaining(obls, obls[3].get_deps()) == std::vector<unsigned>({2}));
    try {
        obls[0].set_body(obligation_body::mk_term(succ(zero())));
        obligo_unreachable();
    } catch (obligation_exception &) {
    }
}

static void tst3() {
    std::vector<obligation> obls = mk_chain();
    expr c0 = mk_constant(obls[0].get_name());
    obls[0] = obls[0].set_body(obligation_body::mk_constant(c0, zero(), true));
    expr t1 = obls[1].get_type();
    /* transparent constants are unfolded only when expanding */
    obligo_assert(subst_deps(true, obls, {0}, t1) == P(zero()));
    obligo_assert(subst_deps(false, obls, {0}, t1) == P(c0));
    obls[0] = obligation(obls[0].get_name(), nat(), obligation_location(), {}, obligation_status(true))
        .set_body(obligation_body::mk_constant(c0, zero(), false));
    obligo_assert(subst_deps(true, obls, {0}, t1) == P(c0));
    try {
        subst_deps(true, obls, {0, 1}, t1);
        obligo_unreachable();
    } catch (obligation_exception &) {
    }
    std::vector<obligation_subst_entry> s = obligation_substitution(false, obls, {0});
    obligo_assert(s.size() == 1 && s[0].m_name == obls[0].get_name() && s[0].m_term == c0);
}

static void tst4() {
    obligation o("g_obligation_1", nat(), obligation_location("hole", 3, 7), {},
                 obligation_status(false, obligation_definition_status::Expand));
    obligo_assert(!o.has_tactic());
    obligation o2 = o.set_status(obligation_status(true, obligation_definition_status::Define));
    obligo_assert(o2.get_status().m_opaque);
    obligo_assert(o.get_status().m_def == obligation_definition_status::Expand);
    obligation o3 = o2.set_type(P(zero()));
    obligo_assert(o3.get_type() == P(zero()));
    obligo_assert(o2.get_type() == nat());
    std::ostringstream out;
    out << o.get_location();
    obligo_assert(out.str().find("3") != std::string::npos);
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
    finalize_program_module();
    finalize_library_module();
    finalize_kernel_module();
    finalize_util_module();
    return has_violations() ? 1 : 0;
}
