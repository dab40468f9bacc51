/*
Copyright (c) 2015 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include "library/program/program_state.h"
#include "library/program/obligations.h"
#include "library/program/init_module.h"

namespace obligo {
void initialize_program_module() {
    initialize_program_state();
    initialize_obligations();
}

void finalize_program_module() {
    finalize_obligations();
    finalize_program_state();
}
}
