/*
Copyright (c) 2014 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include "library/trace.h"
#include "library/io_state.h"
#include "library/messages.h"
#include "library/sorry.h"
#include "library/admitted.h"
#include "library/declare.h"
#include "library/tactic/init_module.h"
#include "library/init_module.h"

namespace obligo {
void initialize_library_module() {
    initialize_trace();
    initialize_io_state();
    initialize_messages();
    initialize_sorry();
    initialize_admitted();
    initialize_tactic_module();
    initialize_declare();
}

void finalize_library_module() {
    finalize_declare();
    finalize_tactic_module();
    finalize_admitted();
    finalize_sorry();
    finalize_messages();
    finalize_io_state();
    finalize_trace();
}
}
