/*
Copyright (c) 2014 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include "kernel/level.h"
#include "kernel/expr.h"
#include "kernel/environment.h"
#include "kernel/init_module.h"

namespace obligo {
void initialize_kernel_module() {
    initialize_level();
    initialize_expr();
    initialize_environment();
}

void finalize_kernel_module() {
    finalize_environment();
    finalize_expr();
    finalize_level();
}
}
