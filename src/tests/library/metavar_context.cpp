/*
Copyright (c) 2016 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include "util/debug.h"
#include "util/init_module.h"
#include "kernel/init_module.h"
#include "kernel/abstract.h"
#include "library/exception.h"
#include "library/metavar_context.h"
#include "library/init_module.h"
#include "library/program/init_module.h"
#include "tests/library/test_env.h"
using namespace obligo;

static void tst1() {
    local_context ctx;
    expr h = ctx.mk_local_decl("h", P(zero()));
    metavar_context mctx;
    expr m = mctx.mk_metavar_decl(ctx, P(zero()));
    obligo_assert(is_metavar_app(m));
    obligo_assert(!mctx.is_assigned(m));
    mctx.assign(m, h);
    obligo_assert(mctx.is_assigned(m));
    obligo_assert(mctx.instantiate_mvars(m) == h);
    obligo_assert(mctx.instantiate_mvars(mk_app(mk_constant("f"), m)) == mk_app(mk_constant("f"), h));
    try {
        mctx.assign(m, h);
        obligo_unreachable();
    } catch (generic_exception &) {
    }
}

static void tst2() {
    local_context ctx;
    metavar_context mctx;
    expr m = mctx.mk_metavar_decl(ctx, P(zero()));
    expr h = mk_local("h", P(zero()));
    /* h is not in the context of m */
    try {
        mctx.assign(m, h);
        obligo_unreachable();
    } catch (generic_exception &) {
    }
    expr m2 = mctx.mk_metavar_decl(ctx, P(zero()));
    try {
        mctx.assign(m2, mk_app(mk_constant("f"), m2));
        obligo_unreachable();
    } catch (generic_exception &) {
    }
    name_set keep;
    keep.insert(get_metavar_name(m));
    metavar_context r = mctx.restrict(keep);
    obligo_assert(r.num_decls() == 1);
    obligo_assert(!r.find_metavar_decl(get_metavar_name(m2)));
}

int main() {
    initialize_util_module();
    initialize_kernel_module();
    initialize_library_module();
    initialize_program_module();
    tst1();
    tst2();
    finalize_program_module();
    finalize_library_module();
    finalize_kernel_module();
    finalize_util_module();
    return has_violations() ? 1 : 0;
}
