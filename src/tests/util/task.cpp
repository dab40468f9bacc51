/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <functional>
#include <memory>
#include <string>
#include "util/task.h"
#include "util/debug.h"
#include "util/init_module.h"
using namespace obligo;

static void tst1() {
    task<int> t = mk_pure_task(10);
    obligo_assert(t.is_finished());
    obligo_assert(t.get() == 10);
}

static void tst2() {
    unsigned counter = 0;
    task<int> t = mk_deferred_task<int>([&]() { counter++; return 42; });
    obligo_assert(!t.is_finished());
    obligo_assert(counter == 0);
    task<int> t2 = t;
    obligo_assert(get(t2) == 42);
    obligo_assert(t.is_finished());
    obligo_assert(t.get() == 42);
    obligo_assert(counter == 1);
}

static void tst3() {
    unsigned counter = 0;
    task<int> t = mk_deferred_task<int>([&]() -> int { counter++; throw exception("failed"); });
    for (unsigned i = 0; i < 2; i++) {
        try {
            t.get();
            obligo_unreachable();
        } catch (exception & ex) {
            obligo_assert(std::string(ex.what()) == "failed");
        }
    }
    obligo_assert(counter == 1);
    obligo_assert(t.is_finished());
}

static void tst4() {
    auto self = std::make_shared<task<int>>();
    *self = mk_deferred_task<int>([=]() { return self->get() + 1; });
    try {
        self->get();
        obligo_unreachable();
    } catch (task_cycle_exception &) {
    }
    *self = task<int>();
}

int main() {
    initialize_util_module();
    tst1();
    tst2();
    tst3();
    tst4();
    finalize_util_module();
    return has_violations() ? 1 : 0;
}
