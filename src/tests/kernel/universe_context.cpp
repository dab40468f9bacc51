/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <string>
#include "util/debug.h"
#include "util/init_module.h"
#include "kernel/universe_context.h"
#include "kernel/init_module.h"
using namespace obligo;

static void tst1() {
    universe_context c;
    c = c.add_param("u").add_param("v");
    c = c.add_constraint(mk_le("u", "v"));
    c = c.add_constraint(mk_le("v", "w"));
    obligo_assert(c.contains("w"));
    obligo_assert(c.is_flexible("w"));
    obligo_assert(!c.is_flexible("u"));
    obligo_assert(c.entails(mk_le("u", "w")));
    obligo_assert(!c.entails(mk_lt("u", "w")));
    try {
        c.add_constraint(mk_lt("w", "u"));
        obligo_unreachable();
    } catch (universe_inconsistency_exception & ex) {
        obligo_assert(std::string(ex.what()).find("universe inconsistency") == 0);
    }
    /* a cycle of non strict constraints is consistent */
    obligo_assert(c.add_constraint(mk_le("w", "u")).entails(mk_le("w", "v")));
}

static void tst2() {
    universe_context c;
    c = c.add_param("u").add_param("v").add_param("w");
    c = c.add_constraint(mk_le("u", "v")).add_constraint(mk_le("v", "w"));
    name_set used;
    used.insert("u");
    used.insert("w");
    universe_context r = c.restrict(used);
    obligo_assert(!r.contains("v"));
    obligo_assert(r.contains("u") && r.contains("w"));
    obligo_assert(r.entails(mk_le("u", "w")));
    obligo_assert(r.get_constraints().size() == 1);
}

static void tst3() {
    universe_context c1, c2;
    c1 = c1.add_param("u").add_constraint(mk_le("u", "v"));
    c2 = c2.add_param("w");
    universe_context m = c1.merge(c2);
    obligo_assert(m.contains("u") && m.contains("v") && m.contains("w"));
    obligo_assert(m.entails(mk_le("u", "v")));
    auto p = m.minimize();
    for (name const & u : p.first.get_params())
        obligo_assert(m.contains(u));
    /* v is flexible and its only lower bound is u */
    obligo_assert(!p.first.contains("v"));
    obligo_assert(p.second.contains("v"));
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
