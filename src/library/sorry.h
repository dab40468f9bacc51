/*
Copyright (c) 2014 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include "kernel/environment.h"

namespace obligo {
/** \brief Name of the axiom <tt>sorryAx.{u} : Pi (A : Sort u), A</tt> used for admitted placeholders. */
name const & get_sorry_ax_name();
/** \brief Declaration of \c sorryAx. */
declaration mk_sorry_ax_decl();
/** \brief Return <tt>sorryAx.{l} ty</tt>, where \c ty has type <tt>Sort l</tt>. */
expr mk_sorry(expr const & ty, level const & l);
/** \brief Return true iff \c e is an application of \c sorryAx. */
bool is_sorry(expr const & e);
/** \brief Type of the sorry placeholder. */
expr const & sorry_type(expr const & sry);
/** \brief Return true iff the given expression contains a sorry placeholder. */
bool has_sorry(expr const & e);
bool has_sorry(declaration const & d);
void initialize_sorry();
void finalize_sorry();
}
