/*
Copyright (c) 2016 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include "util/fresh_name.h"

namespace obligo {
static name *   g_fresh    = nullptr;
static unsigned g_next_idx = 0;

name mk_fresh_name() {
    return name(*g_fresh, g_next_idx++);
}

name mk_tagged_fresh_name(name const & tag) {
    return name(*g_fresh + tag, g_next_idx++);
}

bool is_fresh_name(name const & n) {
    return is_prefix_of(*g_fresh, n);
}

void initialize_fresh_name() {
    g_fresh = new name("_fresh");
}

void finalize_fresh_name() {
    delete g_fresh;
}
}
