/*
Copyright (c) 2014 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include "util/debug.h"
#include "util/fresh_name.h"
#include "util/options.h"
#include "util/init_module.h"

namespace obligo {
void initialize_util_module() {
    initialize_debug();
    initialize_options();
    initialize_fresh_name();
}

void finalize_util_module() {
    finalize_fresh_name();
    finalize_options();
    finalize_debug();
}
}
