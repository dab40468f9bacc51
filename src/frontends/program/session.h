/*
Copyright (c) 2014 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <string>
#include <vector>
#include "library/io_state.h"
#include "library/declare.h"
#include "library/tactic/tactic.h"
#include "library/program/obligations.h"

namespace obligo {
/**
   \brief Command interpreter for programs with obligations.

   The session owns the current environment, the open sections and the stack of proofs in progress.
   A command that fails throws an exception and leaves the session unchanged.
*/
class session {
    struct section {
        name          m_name;
        local_context m_vars;
        section(name const & n, local_context const & vars):m_name(n), m_vars(vars) {}
    };
    struct open_proof {
        proof_state m_state;
        decl_info   m_info;
        open_proof(proof_state const & s, decl_info const & info):m_state(s), m_info(info) {}
    };
    environment             m_env;
    io_state                m_ios;
    std::vector<section>    m_sections;
    std::vector<open_proof> m_proofs;
    bool                    m_deferred_proofs{false};
    unsigned                m_next_state_id{0};

    local_context get_section_vars() const;
    open_proof & get_open_proof();
    void close(bool opaque);
public:
    session(environment const & env, io_state const & ios);
    explicit session(environment const & env);

    environment const & env() const { return m_env; }
    io_state const & ios() const { return m_ios; }
    template<typename T> void set_option(name const & n, T const & v) { m_ios.set_option(n, v); }
    /** \brief When set, closed proofs are checked when they are declared. */
    void set_deferred_proofs(bool flag) { m_deferred_proofs = flag; }
    void set_obligation_tactic(tactic const & tac);

    /* program commands */
    progress start_program_definition(name const & n, expr const & type, optional<expr> const & body,
                                      universe_context const & uctx, std::vector<obligation_info> const & obls,
                                      decl_info const & info = decl_info(), tactic const & tac = tactic());
    progress start_program_fixpoint(std::vector<mutual_member> const & ms, universe_context const & uctx,
                                    decl_kind kind = decl_kind::Fixpoint, decl_info const & info = decl_info(),
                                    std::vector<std::string> const & notations = std::vector<std::string>(),
                                    tactic const & tac = tactic());
    void obligation(unsigned k, optional<name> const & prog = optional<name>(), tactic const & tac = tactic());
    void next_obligation(optional<name> const & prog = optional<name>(), tactic const & tac = tactic());
    void solve_obligation(unsigned k, optional<name> const & prog = optional<name>(), tactic const & tac = tactic());
    progress solve_obligations(optional<name> const & prog = optional<name>(), tactic const & tac = tactic());
    void solve_all_obligations(tactic const & tac = tactic());
    void show_obligations(optional<name> const & prog = optional<name>());
    std::string show_term(optional<name> const & prog = optional<name>());
    void admit_obligations(optional<name> const & prog = optional<name>());
    void abandon_program(name const & prog);
    void check_program_libraries();
    void import_program_library();

    /* proof commands */
    void start_proof(name const & n, expr const & type, universe_context const & uctx = universe_context(),
                     decl_info const & info = decl_info(decl_scope::Global, decl_kind::Theorem, true));
    bool has_proof() const { return !m_proofs.empty(); }
    proof_state const & get_proof_state() const;
    /** \brief Apply \c t to the first goal of the current proof, return false if the step was unsafe. */
    bool by(tactic const & t);
    void set_endline_tactic(tactic const & t);
    std::vector<expr> set_used_variables(std::vector<name> const & vars);
    /** \brief Close the current proof, the result is opaque. */
    void qed();
    /** \brief Close the current proof, the result is transparent. */
    void defined();
    void admitted();
    void abort();

    /* scopes */
    void begin_section(name const & n);
    expr add_variable(name const & n, expr const & type);
    /** \brief Close the current section, fails if some program has unsolved obligations. */
    void end_section();
};
}
