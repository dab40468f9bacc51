/*
Copyright (c) 2014 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include "library/tactic/proof_state.h"
#include "library/tactic/init_module.h"

namespace obligo {
void initialize_tactic_module() {
    initialize_proof_state();
}

void finalize_tactic_module() {
    finalize_proof_state();
}
}
