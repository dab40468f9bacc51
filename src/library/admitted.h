/*
Copyright (c) 2015 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.
*/
#pragma once
#include "kernel/environment.h"

namespace obligo {
/** \brief Add the axiom \c n of type \c type, and record that it stands for an admitted proof. */
environment add_admitted(environment const & env, name const & n, level_param_names const & ps, expr const & type);
/** \brief Return true iff \c n was declared by add_admitted. */
bool is_admitted(environment const & env, name const & n);
/** \brief Return true iff the declaration \c n depends (transitively through the types and values of
    the declarations it uses) on an admitted axiom or on the sorry placeholder. */
bool depends_on_admitted(environment const & env, name const & n);
void initialize_admitted();
void finalize_admitted();
}
