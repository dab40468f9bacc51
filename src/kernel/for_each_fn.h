/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <functional>
#include "util/pair.h"
#include "kernel/expr.h"

namespace obligo {
/** \brief Visit the subexpressions of \c e. The second argument of \c f is the number of binders
    between \c e and the visited subexpression. If \c f returns false, the children of the
    visited subexpression are skipped. */
void for_each(expr const & e, std::function<bool(expr const &, unsigned)> const & f);
}
