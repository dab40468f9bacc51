/*
Copyright (c) 2015 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <vector>
#include "kernel/environment.h"
#include "library/program/program_decl.h"

namespace obligo {
/** \brief Raised when a command that does not name a program is used while zero or several
    programs have unsolved obligations. */
class ambiguous_program_exception : public exception {
    std::vector<name> m_programs;
public:
    ambiguous_program_exception(std::vector<name> const & ps);
    std::vector<name> const & get_programs() const { return m_programs; }
    virtual throwable * clone() const override { return new ambiguous_program_exception(m_programs); }
    virtual void rethrow() const override { throw *this; }
};

/** \brief Number of programs with unsolved obligations. */
unsigned num_pending_programs(environment const & env);
optional<program_decl> find_program(environment const & env, name const & n);
/** \brief Similar to find_program, throws exception if there is no program named \c n. */
program_decl get_program(environment const & env, name const & n);
/** \brief Return the program \c n if provided, otherwise the only program with unsolved obligations.
    Throws ambiguous_program_exception if there is no such program or more than one. */
program_decl get_unique_open_program(environment const & env, optional<name> const & n);
/** \brief First program with unsolved obligations in lexicographical order. */
optional<program_decl> first_pending_program(environment const & env);
/** \brief Programs in lexicographical order. */
std::vector<program_decl> get_programs(environment const & env);

/** \brief Register \c p, throws already_declared_exception if a program or a declaration
    with the same name exists. */
environment add_program(environment const & env, program_decl const & p);
environment replace_program(environment const & env, program_decl const & p);
environment remove_program(environment const & env, name const & n);

void initialize_program_state();
void finalize_program_state();
}
