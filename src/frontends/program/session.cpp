/*
Copyright (c) 2014 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <string>
#include <vector>
#include "util/sstream.h"
#include "kernel/kernel_exception.h"
#include "library/trace.h"
#include "frontends/program/session.h"

namespace obligo {
/* Options and trace classes of the session are active while a command is executed. */
struct scope_command {
    scope_global_ios m_ios;
    scope_trace_env  m_trace;
    scope_command(io_state const & ios):m_ios(ios), m_trace(ios.get_options()) {}
};

session::session(environment const & env, io_state const & ios):m_env(env), m_ios(ios) {}
session::session(environment const & env):session(env, get_global_ios()) {}

local_context session::get_section_vars() const {
    local_context r;
    for (section const & s : m_sections) {
        for (expr const & l : s.m_vars.get_locals())
            r.push_local(l);
    }
    return r;
}

session::open_proof & session::get_open_proof() {
    if (m_proofs.empty())
        throw exception("no proof in progress");
    return m_proofs.back();
}

proof_state const & session::get_proof_state() const {
    if (m_proofs.empty())
        throw exception("no proof in progress");
    return m_proofs.back().m_state;
}

void session::set_obligation_tactic(tactic const & tac) {
    m_env = obligo::set_obligation_tactic(m_env, tac);
}

progress session::start_program_definition(name const & n, expr const & type, optional<expr> const & body,
                                           universe_context const & uctx, std::vector<obligation_info> const & obls,
                                           decl_info const & info, tactic const & tac) {
    scope_command scope(m_ios);
    auto r = add_definition(m_env, n, type, body, uctx, obls, info, tac);
    m_env = r.first;
    return r.second;
}

progress session::start_program_fixpoint(std::vector<mutual_member> const & ms, universe_context const & uctx,
                                         decl_kind kind, decl_info const & info,
                                         std::vector<std::string> const & notations, tactic const & tac) {
    scope_command scope(m_ios);
    auto r = add_mutual_definitions(m_env, ms, uctx, kind, info, notations, tac);
    m_env = r.first;
    return r.second;
}

void session::obligation(unsigned k, optional<name> const & prog, tactic const & tac) {
    scope_command scope(m_ios);
    m_proofs.emplace_back(start_obligation(m_env, k, prog, tac), decl_info());
}

void session::next_obligation(optional<name> const & prog, tactic const & tac) {
    scope_command scope(m_ios);
    m_proofs.emplace_back(obligo::next_obligation(m_env, prog, tac), decl_info());
}

void session::solve_obligation(unsigned k, optional<name> const & prog, tactic const & tac) {
    scope_command scope(m_ios);
    m_env = try_solve_obligation(m_env, k, prog, tac);
}

progress session::solve_obligations(optional<name> const & prog, tactic const & tac) {
    scope_command scope(m_ios);
    auto r = obligo::solve_obligations(m_env, prog, tac);
    m_env = r.first;
    return r.second;
}

void session::solve_all_obligations(tactic const & tac) {
    scope_command scope(m_ios);
    m_env = obligo::solve_all_obligations(m_env, tac);
}

void session::show_obligations(optional<name> const & prog) {
    scope_command scope(m_ios);
    obligo::show_obligations(m_env, prog);
}

std::string session::show_term(optional<name> const & prog) {
    scope_command scope(m_ios);
    return obligo::show_term(m_env, prog);
}

void session::admit_obligations(optional<name> const & prog) {
    scope_command scope(m_ios);
    m_env = obligo::admit_obligations(m_env, prog);
}

void session::abandon_program(name const & prog) {
    scope_command scope(m_ios);
    m_env = obligo::abandon_program(m_env, prog);
}

void session::check_program_libraries() {
    obligo::check_program_libraries(m_env);
}

void session::import_program_library() {
    m_env = obligo::import_program_library(m_env);
}

void session::start_proof(name const & n, expr const & type, universe_context const & uctx, decl_info const & info) {
    if (m_env.contains(n))
        throw already_declared_exception(n);
    m_proofs.emplace_back(proof_state(m_env, n, type, uctx, get_section_vars()), info);
}

bool session::by(tactic const & t) {
    scope_command scope(m_ios);
    open_proof & p = get_open_proof();
    auto r = by_endline(t, update_env(p.m_state, m_env));
    p.m_state = r.first;
    return r.second;
}

void session::set_endline_tactic(tactic const & t) {
    open_proof & p = get_open_proof();
    p.m_state = obligo::set_endline_tactic(p.m_state, t);
}

std::vector<expr> session::set_used_variables(std::vector<name> const & vars) {
    open_proof & p = get_open_proof();
    auto r = obligo::set_used_variables(p.m_state, vars);
    p.m_state = r.first;
    return r.second;
}

void session::close(bool opaque) {
    scope_command scope(m_ios);
    open_proof & p = get_open_proof();
    proof_object obj = m_deferred_proofs ? close_future_proof(p.m_state, opaque, m_next_state_id)
                                         : close_proof(p.m_state, opaque);
    environment new_env = save_lemma_proved(m_env, obj, p.m_info);
    if (m_deferred_proofs)
        m_next_state_id++;
    m_env = new_env;
    m_proofs.pop_back();
}

void session::qed() {
    close(true);
}

void session::defined() {
    close(false);
}

void session::admitted() {
    scope_command scope(m_ios);
    open_proof & p = get_open_proof();
    m_env = save_lemma_admitted(m_env, p.m_state);
    m_proofs.pop_back();
}

void session::abort() {
    get_open_proof();
    m_proofs.pop_back();
}

void session::begin_section(name const & n) {
    m_sections.emplace_back(n, local_context());
}

expr session::add_variable(name const & n, expr const & type) {
    if (m_sections.empty())
        throw exception(sstream() << "variable '" << n << "' must be declared inside a section");
    return m_sections.back().m_vars.mk_local_decl(n, type);
}

void session::end_section() {
    if (m_sections.empty())
        throw exception("there is no section to close");
    if (!m_proofs.empty())
        throw exception(sstream() << "section '" << m_sections.back().m_name << "' contains an unfinished proof");
    check_solved_obligations(m_env, (sstream() << "section " << m_sections.back().m_name).str());
    m_sections.pop_back();
}
}
