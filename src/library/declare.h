/*
Copyright (c) 2014 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <functional>
#include <string>
#include <vector>
#include "util/pair.h"
#include "kernel/environment.h"
#include "kernel/universe_context.h"
#include "library/tactic/proof_state.h"

namespace obligo {
enum class decl_scope { Local, Global };
enum class decl_kind { Definition, Theorem, Fixpoint, CoFixpoint };

/** \brief Information given to a declaration hook once the declaration has been registered. */
struct hook_data {
    universe_context              m_uctx;
    /** \brief Obligations of the declaration and the terms that solved them. */
    std::vector<pair<name, expr>> m_obligations;
    decl_scope                    m_scope;
    /** \brief Name of the registered constant. */
    name                          m_ref;
    hook_data(universe_context const & uctx, std::vector<pair<name, expr>> const & obls, decl_scope s, name const & r):
        m_uctx(uctx), m_obligations(obls), m_scope(s), m_ref(r) {}
};

/** \brief Callback invoked once after a declaration is registered. It may add more declarations. */
typedef std::function<environment(environment const &, hook_data const &)> declaration_hook;

struct decl_info {
    decl_scope       m_scope;
    decl_kind        m_kind;
    bool             m_opaque;
    declaration_hook m_hook;
    decl_info(decl_scope s = decl_scope::Global, decl_kind k = decl_kind::Definition, bool opaque = false,
              declaration_hook const & hook = declaration_hook()):
        m_scope(s), m_kind(k), m_opaque(opaque), m_hook(hook) {}
};

/** \brief Restrict \c uctx to the universe parameters occurring in \c es and minimize it.
    Returns the new context and the substitution that must be applied to \c es. */
pair<universe_context, name_map<level>> prepare_universe_context(universe_context const & uctx, std::vector<expr> const & es);

/** \brief Invoke \c hook, a failure is reported as an error message and the environment \c env is returned. */
environment call_hook(environment const & env, declaration_hook const & hook, hook_data const & data);

/** \brief Register <tt>n : type := value</tt>, as a theorem when \c opaque is true. The universe context is
    restricted and minimized. Returns the new environment and the final universe context. */
pair<environment, universe_context> register_definition(environment const & env, name const & n, bool opaque,
                                                        expr const & type, expr const & value,
                                                        universe_context const & uctx);
/** \brief Register <tt>n : type := value</tt>, as a theorem when \c info is opaque, then invoke the hook. */
environment declare_definition(environment const & env, name const & n, decl_info const & info,
                               expr const & type, expr const & value, universe_context const & uctx,
                               std::vector<pair<name, expr>> const & obls = std::vector<pair<name, expr>>());
/** \brief Register <tt>n : type</tt> as an axiom. */
environment declare_assumption(environment const & env, name const & n, decl_info const & info,
                               expr const & type, universe_context const & uctx);
/** \brief Register <tt>n : type := value</tt>, or the admitted statement <tt>n : type</tt> when \c value is none,
    with every universe parameter of \c uctx. The context is neither restricted nor minimized, it is minimized
    later with the declaration that uses \c n. */
environment register_auxiliary(environment const & env, name const & n, bool opaque, expr const & type,
                               optional<expr> const & value, universe_context const & uctx);
/** \brief Register <tt>n : type</tt> as an admitted statement. */
environment declare_admitted(environment const & env, name const & n, expr const & type, universe_context const & uctx);

/** \brief Member of a group of mutually recursive definitions. */
struct fixpoint_member {
    name              m_name;
    expr              m_type;
    expr              m_value;
    /** \brief Names of the arguments, used to locate the structural argument. */
    std::vector<name> m_args;
    /** \brief Structural argument of a fixpoint, none for cofixpoints or when unknown. */
    optional<name>    m_struct_arg;
    fixpoint_member(name const & n, expr const & type, expr const & value,
                    std::vector<name> const & args = std::vector<name>(),
                    optional<name> const & struct_arg = optional<name>()):
        m_name(n), m_type(type), m_value(value), m_args(args), m_struct_arg(struct_arg) {}
};

/** \brief Register a group of mutually recursive definitions and record the notations.
    Returns the new environment and the final universe context. */
pair<environment, universe_context> register_mutually_recursive(environment const & env, decl_kind k,
                                                                std::vector<fixpoint_member> const & members,
                                                                universe_context const & uctx,
                                                                std::vector<std::string> const & notations);
/** \brief Register a group of mutually recursive definitions, record the notations, and invoke
    the hook once with the first member. */
environment declare_mutually_recursive(environment const & env, decl_info const & info,
                                       std::vector<fixpoint_member> const & members, universe_context const & uctx,
                                       std::vector<std::string> const & notations = std::vector<std::string>(),
                                       std::vector<pair<name, expr>> const & obls = std::vector<pair<name, expr>>());
/** \brief Notations recorded for the mutual group containing \c n. */
std::vector<std::string> get_recorded_notations(environment const & env, name const & n);

/** \brief Declare the result of a closed proof according to its ending. */
environment save_lemma_proved(environment const & env, proof_object const & p, decl_info const & info = decl_info());
/** \brief Declare the statement of \c s as admitted according to the ending of \c s. */
environment save_lemma_admitted(environment const & env, proof_state const & s);

void initialize_declare();
void finalize_declare();
}
