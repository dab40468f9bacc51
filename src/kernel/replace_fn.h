/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <functional>
#include "kernel/expr.h"

namespace obligo {
/**
   \brief Apply <tt>f</tt> to the subexpressions of a given expression.

   If \c f returns some expression for a subexpression, it replaces it and its children are not
   visited. The second argument of \c f is the number of binders between the root and the
   subexpression.
*/
expr replace(expr const & e, std::function<optional<expr>(expr const &, unsigned)> const & f);
}
