/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <algorithm>
#include <vector>
#include "util/name_set.h"
#include "util/sstream.h"
#include "kernel/abstract.h"
#include "kernel/for_each_fn.h"
#include "kernel/type_checker.h"
#include "library/messages.h"
#include "library/sorry.h"
#include "library/trace.h"
#include "library/tactic/tactic.h"
#include "library/tactic/proof_state.h"

namespace obligo {
proof_state::proof_state(environment const & env, name const & n, expr const & type, universe_context const & uctx,
                         local_context const & section, proof_ending const & ending):
    m_env(env), m_name(n), m_type(type), m_uctx(uctx), m_section(section), m_ending(ending) {
    m_root  = m_mctx.mk_metavar_decl(section, type);
    m_goals = list<expr>(m_root);
}

proof_state proof_state::set_goals(list<expr> const & gs) const {
    proof_state r(*this);
    r.m_goals = gs;
    return r;
}

proof_state proof_state::set_mctx_goals(metavar_context const & mctx, list<expr> const & gs) const {
    proof_state r(*this);
    r.m_mctx  = mctx;
    r.m_goals = gs;
    return r;
}

proof_state proof_state::set_uctx(universe_context const & uctx) const {
    proof_state r(*this);
    r.m_uctx = uctx;
    return r;
}

proof_state proof_state::set_env(environment const & env) const {
    proof_state r(*this);
    r.m_env = env;
    return r;
}

proof_state proof_state::set_endline(tactic const & t) const {
    proof_state r(*this);
    r.m_endline = std::make_shared<tactic>(t);
    return r;
}

proof_state proof_state::set_used_vars(std::vector<expr> const & vs) const {
    proof_state r(*this);
    r.m_used_vars_set = true;
    r.m_used_vars     = vs;
    return r;
}

proof_state proof_state::set_mctx(metavar_context const & mctx) const {
    proof_state r(*this);
    r.m_mctx = mctx;
    return r;
}

proof_output const & proof_object::consume() const {
    if (m_ptr->m_consumed)
        throw exception(sstream() << "proof of '" << m_ptr->m_name << "' has already been used");
    m_ptr->m_consumed = true;
    return m_ptr->m_output.get();
}

unsigned get_open_goals(proof_state const & s) {
    return length(s.goals());
}

static list<expr> unassigned(metavar_context const & mctx, list<expr> const & gs) {
    std::vector<expr> r;
    for (expr const & g : gs) {
        if (!mctx.is_assigned(g))
            r.push_back(g);
    }
    return to_list(r);
}

pair<proof_state, bool> by(tactic const & t, proof_state const & s) {
    if (is_nil(s.goals()))
        throw tactic_exception("no goals to be proved");
    expr const & g  = head(s.goals());
    proof_state new_s = t(s.set_goals(list<expr>(g)));
    list<expr> new_gs = append(new_s.goals(), unassigned(new_s.mctx(), tail(s.goals())));
    bool safe = !has_sorry(new_s.mctx().instantiate_mvars(g));
    obligo_trace(name("tactic"), tout() << s.get_name() << ": " << get_open_goals(s) << " goal(s) before, "
                 << length(new_gs) << " after" << (safe ? "" : ", unsafe step") << "\n";);
    return mk_pair(new_s.set_goals(new_gs), safe);
}

pair<proof_state, bool> by_endline(tactic const & t, proof_state const & s) {
    if (tactic const * endline = s.get_endline_tactic())
        return by(then_tactic(t, *endline), s);
    return by(t, s);
}

proof_state set_endline_tactic(proof_state const & s, tactic const & t) {
    return s.set_endline(t);
}

static std::vector<expr> section_closure(local_context const & section, name_set used) {
    std::vector<expr> const & locals = section.get_locals();
    /* the type of a section variable may only refer to the preceding ones */
    for (auto it = locals.rbegin(); it != locals.rend(); ++it) {
        if (used.contains(mlocal_name(*it))) {
            for (expr const & l : locals) {
                if (occurs_local(mlocal_name(l), mlocal_type(*it)))
                    used.insert(mlocal_name(l));
            }
        }
    }
    std::vector<expr> r;
    for (expr const & l : locals) {
        if (used.contains(mlocal_name(l)))
            r.push_back(l);
    }
    return r;
}

pair<proof_state, std::vector<expr>> set_used_variables(proof_state const & s, std::vector<name> const & vars) {
    if (s.used_variables_set())
        throw exception(sstream() << "used section variables of '" << s.get_name() << "' have already been set");
    name_set used;
    for (name const & v : vars) {
        optional<expr> l = s.get_section_context().find_local_by_user_name(v);
        if (!l)
            throw exception(sstream() << "unknown section variable '" << v << "'");
        used.insert(mlocal_name(*l));
    }
    std::vector<expr> closure = section_closure(s.get_section_context(), used);
    return mk_pair(s.set_used_vars(closure), closure);
}

static void collect_metavars(expr const & e, std::vector<name> & todo) {
    if (!has_metavar(e))
        return;
    for_each(e, [&](expr const & c, unsigned) {
            if (!has_metavar(c))
                return false;
            if (is_metavar(c))
                todo.push_back(mlocal_name(c));
            return true;
        });
}

proof_state compact(proof_state const & s) {
    metavar_context const & mctx = s.mctx();
    name_set keep;
    std::vector<name> todo;
    todo.push_back(get_metavar_name(s.get_root()));
    for (expr const & g : s.goals())
        todo.push_back(get_metavar_name(g));
    while (!todo.empty()) {
        name n = todo.back();
        todo.pop_back();
        if (keep.contains(n))
            continue;
        keep.insert(n);
        if (optional<metavar_decl> d = mctx.find_metavar_decl(n))
            collect_metavars(d->get_type(), todo);
        if (optional<expr> v = mctx.get_stored_assignment(n))
            collect_metavars(*v, todo);
    }
    return s.set_mctx(mctx.restrict(keep));
}

proof_state update_env(proof_state const & s, environment const & env) {
    obligo_assert(env.is_descendant(s.env()));
    return s.set_env(env);
}

pair<local_context, expr> get_goal_context(proof_state const & s, unsigned i) {
    unsigned j = 1;
    for (expr const & g : s.goals()) {
        if (i == j) {
            metavar_decl const & d = s.mctx().get_metavar_decl(g);
            return mk_pair(d.get_context(), s.mctx().instantiate_mvars(d.get_type()));
        }
        j++;
    }
    throw exception(sstream() << "no such goal: " << i);
}

pair<local_context, expr> get_current_goal_context(proof_state const & s) {
    if (is_nil(s.goals()))
        return mk_pair(s.get_section_context(), s.get_type());
    return get_goal_context(s, 1);
}

static std::vector<expr> used_section_vars(proof_state const & s, expr const & type, optional<expr> const & val) {
    name_set used;
    for (expr const & l : s.get_section_context().get_locals()) {
        if (occurs_local(mlocal_name(l), type) || (val && occurs_local(mlocal_name(l), *val)))
            used.insert(mlocal_name(l));
    }
    if (s.used_variables_set()) {
        name_set declared;
        for (expr const & l : s.get_used_variables())
            declared.insert(mlocal_name(l));
        used.for_each([&](name const & n) {
                if (!declared.contains(n)) {
                    expr l = *s.get_section_context().find_local(n);
                    throw exception(sstream() << "proof of '" << s.get_name() << "' uses section variable '"
                                    << local_pp_name(l) << "' which was not declared as used");
                }
            });
        return s.get_used_variables();
    }
    return section_closure(s.get_section_context(), used);
}

proof_output return_proof(proof_state const & s) {
    if (unsigned n = get_open_goals(s))
        throw exception(sstream() << "attempt to close the proof of '" << s.get_name() << "' with "
                        << n << " open goal(s)");
    expr proof = s.get_proof();
    if (has_metavar(proof))
        throw exception(sstream() << "proof of '" << s.get_name() << "' contains unassigned metavariables");
    std::vector<expr> vars = used_section_vars(s, s.get_type(), some_expr(proof));
    proof_output r;
    r.m_entries.emplace_back(s.get_name(), Pi(vars, s.get_type()), some_expr(Fun(vars, proof)));
    r.m_uctx     = s.get_uctx();
    r.m_admitted = has_sorry(proof);
    return r;
}

proof_output return_partial_proof(proof_state const & s) {
    if (is_nil(s.goals())) {
        report_message(message(s.get_name(), WARNING, "the proof is complete, nothing to admit"));
        return return_proof(s);
    }
    proof_state new_s = s;
    while (!is_nil(new_s.goals()))
        new_s = by(admit_tactic(), new_s).first;
    return return_proof(new_s);
}

proof_output return_admitted(proof_state const & s) {
    std::vector<expr> vars = used_section_vars(s, s.get_type(), none_expr());
    proof_output r;
    r.m_entries.emplace_back(s.get_name(), Pi(vars, s.get_type()), none_expr());
    r.m_uctx     = s.get_uctx();
    r.m_admitted = true;
    return r;
}

proof_object close_proof(proof_state const & s, bool opaque) {
    return proof_object(s.get_name(), mk_pure_task(return_proof(s)), opaque, s.get_ending());
}

proof_object close_future_proof(proof_state const & s, bool opaque, unsigned state_id) {
    if (unsigned n = get_open_goals(s))
        throw exception(sstream() << "attempt to close the proof of '" << s.get_name() << "' with "
                        << n << " open goal(s)");
    task<proof_output> out = mk_deferred_task<proof_output>([=]() { return return_proof(s); });
    return proof_object(s.get_name(), out, opaque, s.get_ending(), optional<unsigned>(state_id));
}

void initialize_proof_state() {
    register_trace_class(name("tactic"));
}

void finalize_proof_state() {
}
}
