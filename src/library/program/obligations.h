/*
Copyright (c) 2015 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <string>
#include <vector>
#include "util/options.h"
#include "library/declare.h"
#include "library/program/program_state.h"

namespace obligo {
enum class progress_kind { Remain, Dependent, Defined };

/** \brief Outcome of a step of a program: obligations remain, the program is waiting for
    the other members of its mutual group, or it has been declared. */
class progress {
    progress_kind m_kind;
    unsigned      m_remaining;
    name          m_ref;
    progress(progress_kind k, unsigned r, name const & ref):m_kind(k), m_remaining(r), m_ref(ref) {}
public:
    static progress mk_remain(unsigned n) { return progress(progress_kind::Remain, n, name()); }
    static progress mk_dependent() { return progress(progress_kind::Dependent, 0, name()); }
    static progress mk_defined(name const & ref) { return progress(progress_kind::Defined, 0, ref); }
    progress_kind kind() const { return m_kind; }
    bool is_remain() const { return m_kind == progress_kind::Remain; }
    bool is_dependent() const { return m_kind == progress_kind::Dependent; }
    bool is_defined() const { return m_kind == progress_kind::Defined; }
    unsigned get_remaining() const { return m_remaining; }
    name const & get_ref() const { return m_ref; }
};
std::ostream & operator<<(std::ostream & out, progress const & p);

class unknown_obligation_exception : public exception {
    unsigned m_idx;
public:
    unknown_obligation_exception(unsigned idx);
    unsigned get_idx() const { return m_idx; }
    virtual throwable * clone() const override { return new unknown_obligation_exception(m_idx); }
    virtual void rethrow() const override { throw *this; }
};

class unsolved_obligations_exception : public exception {
    std::string       m_what_for;
    std::vector<name> m_programs;
public:
    unsolved_obligations_exception(std::string const & what_for, std::vector<name> const & ps);
    std::vector<name> const & get_programs() const { return m_programs; }
    virtual throwable * clone() const override { return new unsolved_obligations_exception(m_what_for, m_programs); }
    virtual void rethrow() const override { throw *this; }
};

/** \brief Start the program <tt>n : type := body</tt> whose obligations are described by \c obls.
    Without a body, the single obligation <tt>n_obligation</tt> stands for the whole term.
    Obligations that can be solved by their tactic, or the program tactic \c tac, are solved immediately,
    and the program is declared as soon as no obligation remains. */
pair<environment, progress> add_definition(environment const & env, name const & n, expr const & type,
                                           optional<expr> const & body, universe_context const & uctx,
                                           std::vector<obligation_info> const & obls,
                                           decl_info const & info = decl_info(), tactic const & tac = tactic(),
                                           reduce_fn const & reduce = reduce_fn());

/** \brief Member of a mutually recursive program, its body may refer to the other members as constants. */
struct mutual_member {
    name                         m_name;
    expr                         m_type;
    expr                         m_body;
    std::vector<obligation_info> m_obls;
    std::vector<name>            m_args;
    optional<name>               m_struct_arg;
    mutual_member(name const & n, expr const & type, expr const & body,
                  std::vector<obligation_info> const & obls = std::vector<obligation_info>(),
                  std::vector<name> const & args = std::vector<name>(),
                  optional<name> const & struct_arg = optional<name>()):
        m_name(n), m_type(type), m_body(body), m_obls(obls), m_args(args), m_struct_arg(struct_arg) {}
};

/** \brief Start a group of mutually recursive programs, \c kind is decl_kind::Fixpoint or decl_kind::CoFixpoint.
    The group is declared when the obligations of every member are solved. */
pair<environment, progress> add_mutual_definitions(environment const & env, std::vector<mutual_member> const & ms,
                                                   universe_context const & uctx, decl_kind kind,
                                                   decl_info const & info = decl_info(),
                                                   std::vector<std::string> const & notations = std::vector<std::string>(),
                                                   tactic const & tac = tactic(), reduce_fn const & reduce = reduce_fn());

/** \brief Tactic used by the solve commands when no other tactic applies. */
tactic get_obligation_tactic(environment const & env);
environment set_obligation_tactic(environment const & env, tactic const & tac);

/** \brief Start the proof of the obligation \c k (starting at 1) of \c prog, or of the unique program with
    unsolved obligations. When \c tac is provided it is applied to the goal, a failure is ignored.
    Closing the proof with save_lemma_proved declares the obligation. */
proof_state start_obligation(environment const & env, unsigned k, optional<name> const & prog, tactic const & tac = tactic());
/** \brief Similar to start_obligation, for the first unsolved obligation whose dependencies are solved. */
proof_state next_obligation(environment const & env, optional<name> const & prog, tactic const & tac = tactic());

/** \brief Declare the solution \c v of the obligation \c idx of \c p, \c opaque is the closing mode of the
    proof when it was solved interactively. Returns the new environment and program, the registry is not updated. */
pair<environment, program_decl> declare_obligation(environment const & env, program_decl const & p, unsigned idx,
                                                   expr const & v, universe_context const & uctx,
                                                   optional<bool> const & opaque = optional<bool>());
/** \brief Store \c p in the registry and declare it if no obligation remains. */
pair<environment, progress> update_obls(environment const & env, program_decl const & p);

/** \brief Try to solve the unsolved obligations of \c prog (or of the unique open program). */
pair<environment, progress> solve_obligations(environment const & env, optional<name> const & prog,
                                              tactic const & tac = tactic());
environment solve_all_obligations(environment const & env, tactic const & tac = tactic());
/** \brief Try to solve the obligation \c k (starting at 1), nothing happens if it is already solved
    or if the tactic fails. */
environment try_solve_obligation(environment const & env, unsigned k, optional<name> const & prog,
                                 tactic const & tac = tactic());
environment try_solve_obligations(environment const & env, optional<name> const & prog, tactic const & tac = tactic());

/** \brief Report the unsolved obligations of \c prog, or of every program. */
void show_obligations(environment const & env, optional<name> const & prog);
/** \brief Return (and report) the statement and the body of \c prog. */
std::string show_term(environment const & env, optional<name> const & prog);
/** \brief Admit the unsolved obligations of \c prog (or of the unique open program), the program is declared. */
environment admit_obligations(environment const & env, optional<name> const & prog);
/** \brief Throws unsolved_obligations_exception if some program has unsolved obligations. */
void check_solved_obligations(environment const & env, std::string const & what_for);
/** \brief Remove \c prog without declaring it. */
environment abandon_program(environment const & env, name const & prog);

/** \brief Throws exception if the declarations used by program mode are missing. */
void check_program_libraries(environment const & env);
environment import_program_library(environment const & env);

bool get_program_transparent_obligations(options const & opts);
unsigned get_program_max_shown_obligations(options const & opts);

void initialize_obligations();
void finalize_obligations();
}
