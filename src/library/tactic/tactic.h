/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <functional>
#include <string>
#include <vector>
#include "library/tactic/proof_state.h"

namespace obligo {
/** \brief Builds a term from the hypotheses of the goal it is used on. */
typedef std::function<expr(local_context const &)> term_builder;

/* Basic tactics. Unless stated otherwise they act on the first goal. */
tactic id_tactic();
tactic fail_tactic(std::string const & msg = "failed");
/** \brief Introduce one hypothesis, named \c n or after the binder when \c n is anonymous. */
tactic intro_tactic(name const & n = name());
/** \brief Introduce as many hypotheses as possible, it never fails. */
tactic intros_tactic();
/** \brief Close the goal with \c e, the type of \c e must be definitionally equal to the goal. */
tactic exact_tactic(expr const & e);
tactic exact_tactic(term_builder const & fn);
/** \brief Reduce the goal to the hypotheses of \c e that cannot be inferred from the goal. */
tactic apply_tactic(expr const & e);
tactic apply_tactic(term_builder const & fn);
/** \brief Close the goal with a hypothesis of the same type. */
tactic assumption_tactic();
/** \brief Close the goal with the sorry placeholder. */
tactic admit_tactic();

/* Combinators */
/** \brief Apply \c t1, then \c t2 to every goal produced by \c t1. */
tactic then_tactic(tactic const & t1, tactic const & t2);
tactic orelse_tactic(tactic const & t1, tactic const & t2);
tactic try_tactic(tactic const & t);
/** \brief Apply \c t until it fails or makes no progress, at most \c max times. */
tactic repeat_tactic(tactic const & t, unsigned max = 1000);
/** \brief Apply the first tactic that succeeds. */
tactic first_tactic(std::vector<tactic> const & ts);
/** \brief Apply \c t to every goal. */
tactic all_goals_tactic(tactic const & t);
/** \brief Apply \c t and fail unless it closes the goal. */
tactic solve_tactic(tactic const & t);

/** \brief Tactic used to solve obligations when nothing else is specified: <tt>intros; try assumption</tt>. */
tactic mk_default_obligation_tactic();
}
