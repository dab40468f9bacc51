/*
Copyright (c) 2016 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include "util/name.h"

namespace obligo {
/** \brief Create a unique fresh name. */
name mk_fresh_name();
/** \brief Create a unique fresh name of the form <tt>_tag.<idx></tt>. */
name mk_tagged_fresh_name(name const & tag);
bool is_fresh_name(name const & n);
void initialize_fresh_name();
void finalize_fresh_name();
}
