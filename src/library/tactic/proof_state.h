/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <functional>
#include <memory>
#include <vector>
#include "util/list.h"
#include "util/pair.h"
#include "util/task.h"
#include "kernel/environment.h"
#include "kernel/universe_context.h"
#include "library/exception.h"
#include "library/metavar_context.h"

namespace obligo {
class proof_state;
/** \brief A tactic maps a proof state into a new one, or throws tactic_exception. */
typedef std::function<proof_state(proof_state const &)> tactic;

class tactic_exception : public generic_exception {
public:
    tactic_exception(char const * msg):generic_exception(msg) {}
    tactic_exception(std::string const & msg):generic_exception(msg) {}
    tactic_exception(sstream const & strm):generic_exception(strm) {}
    virtual throwable * clone() const override { return new tactic_exception(m_msg); }
    virtual void rethrow() const override { throw *this; }
};

/** \brief Theorem produced by closing a proof. Admitted entries have no value. */
struct proof_entry {
    name           m_name;
    expr           m_type;
    optional<expr> m_value;
    proof_entry(name const & n, expr const & type, optional<expr> const & v):m_name(n), m_type(type), m_value(v) {}
};

struct proof_output {
    std::vector<proof_entry> m_entries;
    universe_context         m_uctx;
    bool                     m_admitted{false};
};

enum class proof_ending_kind { Regular, End_obligation, End_derive, End_equations };

/** \brief Function that declares the result of a closed proof, the flag is true for opaque proofs. */
typedef std::function<environment(environment const &, proof_output const &, bool)> proof_terminator;

/** \brief What happens when a proof is closed. A Regular proof declares its statement, the other
    kinds hand the result to their terminator. */
class proof_ending {
    proof_ending_kind m_kind;
    name              m_program;
    unsigned          m_idx;
    proof_terminator  m_terminator;
    proof_ending(proof_ending_kind k, name const & prog, unsigned idx, proof_terminator const & fn):
        m_kind(k), m_program(prog), m_idx(idx), m_terminator(fn) {}
public:
    proof_ending():m_kind(proof_ending_kind::Regular), m_idx(0) {}
    /** \brief Ending of the proof of the obligation at position \c idx of the program \c prog. */
    static proof_ending mk_obligation(name const & prog, unsigned idx, proof_terminator const & fn) {
        return proof_ending(proof_ending_kind::End_obligation, prog, idx, fn);
    }
    /** \brief Ending of a proof deriving \c f. */
    static proof_ending mk_derive(name const & f, proof_terminator const & fn) {
        return proof_ending(proof_ending_kind::End_derive, f, 0, fn);
    }
    static proof_ending mk_equations(name const & n, proof_terminator const & fn) {
        return proof_ending(proof_ending_kind::End_equations, n, 0, fn);
    }
    proof_ending_kind kind() const { return m_kind; }
    name const & get_program() const { return m_program; }
    unsigned get_obligation_idx() const { return m_idx; }
    proof_terminator const & get_terminator() const { return m_terminator; }
};

/**
   \brief State of an interactive proof of <tt>name : type</tt>.

   Proof states are values: tactics return new states and never modify the one they receive.
   The root metavariable stands for the whole proof, the goals are the unassigned
   metavariables that remain to be solved.
*/
class proof_state {
    environment             m_env;
    name                    m_name;
    expr                    m_type;
    universe_context        m_uctx;
    local_context           m_section;
    metavar_context         m_mctx;
    expr                    m_root;
    list<expr>              m_goals;
    proof_ending            m_ending;
    std::shared_ptr<tactic> m_endline;
    bool                    m_used_vars_set{false};
    std::vector<expr>       m_used_vars;
public:
    /** \brief Start a proof of \c type, the proof may use the section variables \c section. */
    proof_state(environment const & env, name const & n, expr const & type, universe_context const & uctx,
                local_context const & section = local_context(), proof_ending const & ending = proof_ending());

    environment const & env() const { return m_env; }
    name const & get_name() const { return m_name; }
    expr const & get_type() const { return m_type; }
    universe_context const & get_uctx() const { return m_uctx; }
    local_context const & get_section_context() const { return m_section; }
    metavar_context const & mctx() const { return m_mctx; }
    expr const & get_root() const { return m_root; }
    list<expr> const & goals() const { return m_goals; }
    proof_ending const & get_ending() const { return m_ending; }
    tactic const * get_endline_tactic() const { return m_endline.get(); }
    bool used_variables_set() const { return m_used_vars_set; }
    std::vector<expr> const & get_used_variables() const { return m_used_vars; }

    proof_state set_goals(list<expr> const & gs) const;
    proof_state set_mctx_goals(metavar_context const & mctx, list<expr> const & gs) const;
    proof_state set_uctx(universe_context const & uctx) const;
    proof_state set_env(environment const & env) const;
    proof_state set_endline(tactic const & t) const;
    proof_state set_used_vars(std::vector<expr> const & vs) const;
    proof_state set_mctx(metavar_context const & mctx) const;

    /** \brief Current value of the proof, the unsolved goals appear as metavariables. */
    expr get_proof() const { return m_mctx.instantiate_mvars(m_root); }
};

/** \brief Result of closing a proof, consumed exactly once by the declaration finalizer. */
class proof_object {
    struct cell {
        name               m_name;
        task<proof_output> m_output;
        bool               m_opaque;
        proof_ending       m_ending;
        optional<unsigned> m_state_id;
        bool               m_consumed{false};
        cell(name const & n, task<proof_output> const & out, bool opaque, proof_ending const & e,
             optional<unsigned> const & id):
            m_name(n), m_output(out), m_opaque(opaque), m_ending(e), m_state_id(id) {}
    };
    std::shared_ptr<cell> m_ptr;
public:
    proof_object(name const & n, task<proof_output> const & out, bool opaque, proof_ending const & e,
                 optional<unsigned> const & state_id = optional<unsigned>()):
        m_ptr(std::make_shared<cell>(n, out, opaque, e, state_id)) {}
    name const & get_name() const { return m_ptr->m_name; }
    bool is_opaque() const { return m_ptr->m_opaque; }
    proof_ending const & get_ending() const { return m_ptr->m_ending; }
    /** \brief Identifier of the state a deferred proof was closed in. */
    optional<unsigned> const & get_state_id() const { return m_ptr->m_state_id; }
    bool is_deferred() const { return static_cast<bool>(m_ptr->m_state_id); }
    bool is_consumed() const { return m_ptr->m_consumed; }
    /** \brief Force the proof and mark it as consumed, throws exception if it was already consumed. */
    proof_output const & consume() const;
};

unsigned get_open_goals(proof_state const & s);
/** \brief Apply \c t to the first goal, return the new state and whether the step was safe
    (no admitted placeholder was introduced). Throws tactic_exception if there is no goal. */
pair<proof_state, bool> by(tactic const & t, proof_state const & s);
/** \brief Similar to by, but the endline tactic (if any) is applied to the goals produced by \c t. */
pair<proof_state, bool> by_endline(tactic const & t, proof_state const & s);
proof_state set_endline_tactic(proof_state const & s, tactic const & t);
/** \brief Restrict the section variables the proof may use to \c vars and the variables their types
    depend on. Can only be used once. Returns the new state and the closure. */
pair<proof_state, std::vector<expr>> set_used_variables(proof_state const & s, std::vector<name> const & vars);
/** \brief Remove the metavariables that are not reachable from the root of the proof. */
proof_state compact(proof_state const & s);
/** \brief Refresh the environment, \c env must have been obtained from the proof environment. */
proof_state update_env(proof_state const & s, environment const & env);
/** \brief Return the hypotheses and the type of the i-th goal (starting at 1). */
pair<local_context, expr> get_goal_context(proof_state const & s, unsigned i);
/** \brief Context of the first goal, or the section context and the statement if there is no goal. */
pair<local_context, expr> get_current_goal_context(proof_state const & s);

/** \brief Theorem proved by \c s, throws exception if there are open goals. */
proof_output return_proof(proof_state const & s);
/** \brief Similar to return_proof, the open goals are admitted. */
proof_output return_partial_proof(proof_state const & s);
/** \brief Admitted statement of \c s. */
proof_output return_admitted(proof_state const & s);
proof_object close_proof(proof_state const & s, bool opaque);
/** \brief Close the proof, the proof term is built when the proof object is consumed. */
proof_object close_future_proof(proof_state const & s, bool opaque, unsigned state_id);

void initialize_proof_state();
void finalize_proof_state();
}
