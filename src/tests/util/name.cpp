/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <sstream>
#include "util/debug.h"
#include "util/name.h"
#include "util/name_set.h"
#include "util/init_module.h"
using namespace obligo;

static void tst1() {
    name n("foo");
    obligo_assert(n.is_atomic());
    name n2(n, "bla");
    obligo_assert(!n2.is_atomic());
    obligo_assert(n2.get_prefix() == n);
    obligo_assert(n2.to_string() == "foo.bla");
    obligo_assert(name({"foo", "bla"}) == n2);
    obligo_assert(!name());
    obligo_assert(n < n2);
}

static void tst2() {
    name p("p");
    obligo_assert(p.append_after("_obligation").append_after(1) == name("p_obligation_1"));
    obligo_assert(p.append_after("_obligation").to_string() == "p_obligation");
    name n(name("foo"), 3u);
    obligo_assert(n.is_numeral());
    obligo_assert(n.get_numeral() == 3);
}

static void tst3() {
    name_set s;
    s.insert(name("b"));
    s.insert(name("a"));
    s.insert(name("b"));
    obligo_assert(s.size() == 2);
    obligo_assert(s.contains(name("a")));
    s.erase(name("a"));
    obligo_assert(!s.contains(name("a")));
}

int main() {
    initialize_util_module();
    tst1();
    tst2();
    tst3();
    finalize_util_module();
    return has_violations() ? 1 : 0;
}
