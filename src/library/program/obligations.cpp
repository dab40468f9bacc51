/*
Copyright (c) 2015 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <set>
#include <string>
#include <vector>
#include "util/sstream.h"
#include "kernel/kernel_exception.h"
#include "library/io_state.h"
#include "library/messages.h"
#include "library/sorry.h"
#include "library/trace.h"
#include "library/tactic/tactic.h"
#include "library/program/obligations.h"

#ifndef OBLIGO_DEFAULT_PROGRAM_MAX_SHOWN_OBLIGATIONS
#define OBLIGO_DEFAULT_PROGRAM_MAX_SHOWN_OBLIGATIONS 5
#endif

namespace obligo {
static name * g_transparent_obligations = nullptr;
static name * g_max_shown_obligations   = nullptr;

bool get_program_transparent_obligations(options const & opts) {
    return opts.get_bool(*g_transparent_obligations, false);
}

unsigned get_program_max_shown_obligations(options const & opts) {
    return opts.get_unsigned(*g_max_shown_obligations, OBLIGO_DEFAULT_PROGRAM_MAX_SHOWN_OBLIGATIONS);
}

std::ostream & operator<<(std::ostream & out, progress const & p) {
    switch (p.kind()) {
    case progress_kind::Remain:    out << "remain " << p.get_remaining(); break;
    case progress_kind::Dependent: out << "dependent"; break;
    case progress_kind::Defined:   out << "defined " << p.get_ref(); break;
    }
    return out;
}

unknown_obligation_exception::unknown_obligation_exception(unsigned idx):
    exception(sstream() << "Unknown obligation number " << idx), m_idx(idx) {}

static std::string mk_unsolved_msg(std::string const & what_for, std::vector<name> const & ps) {
    sstream s;
    s << "Unsolved obligations when closing " << what_for << ":";
    bool first = true;
    for (name const & p : ps) {
        s << (first ? " " : ", ") << p;
        first = false;
    }
    return s.str();
}

unsolved_obligations_exception::unsolved_obligations_exception(std::string const & what_for, std::vector<name> const & ps):
    exception(mk_unsolved_msg(what_for, ps)), m_what_for(what_for), m_programs(ps) {}

struct obligation_tactic_ext : public environment_extension {
    tactic m_tactic;
    obligation_tactic_ext() {}
};

struct obligation_tactic_ext_reg {
    unsigned m_ext_id;
    obligation_tactic_ext_reg() {
        m_ext_id = environment::register_extension(std::make_shared<obligation_tactic_ext>());
    }
};

static obligation_tactic_ext_reg * g_ext = nullptr;
static obligation_tactic_ext const & get_extension(environment const & env) {
    return static_cast<obligation_tactic_ext const &>(env.get_extension(g_ext->m_ext_id));
}

tactic get_obligation_tactic(environment const & env) {
    obligation_tactic_ext const & ext = get_extension(env);
    return ext.m_tactic ? ext.m_tactic : mk_default_obligation_tactic();
}

environment set_obligation_tactic(environment const & env, tactic const & tac) {
    obligation_tactic_ext ext = get_extension(env);
    ext.m_tactic = tac;
    return env.update(g_ext->m_ext_id, std::make_shared<obligation_tactic_ext>(ext));
}

static bool is_verbose() {
    return get_verbose(get_global_ios().get_options());
}

static std::string remaining_msg(unsigned n) {
    if (n == 0)
        return "No more obligations remaining";
    else if (n == 1)
        return "1 obligation remaining";
    else
        return (sstream() << n << " obligations remaining").str();
}

static levels param_levels(level_param_names const & ps) {
    std::vector<level> ls;
    for (name const & p : ps)
        ls.push_back(mk_univ_param(p));
    return to_list(ls);
}

static std::set<unsigned> all_obligations(program_decl const & p) {
    std::set<unsigned> r;
    for (unsigned i = 0; i < p.get_obligations().size(); i++)
        r.insert(i);
    return r;
}

static program_decl set_obligation_body(program_decl const & p, unsigned idx, obligation_status const & st,
                                        obligation_body const & b, universe_context const & uctx) {
    std::vector<obligation> obls = p.get_obligations();
    obls[idx] = obls[idx].set_status(st).set_body(b);
    return p.set_obligations(obls).set_uctx(p.get_uctx().merge(uctx));
}

pair<environment, program_decl> declare_obligation(environment const & env, program_decl const & p, unsigned idx,
                                                   expr const & v, universe_context const & uctx,
                                                   optional<bool> const & opaque) {
    obligation const & o  = p.get_obligations()[idx];
    obligation_status st = o.get_status();
    if (opaque) {
        if (st.m_def == obligation_definition_status::Expand) {
            if (*opaque)
                throw obligation_exception(sstream() << "Obligation '" << o.get_name() << "' should be transparent");
        } else {
            st.m_opaque = *opaque;
        }
    }
    if (st.m_def == obligation_definition_status::Expand) {
        obligo_trace(name("program"), tout() << "obligation " << o.get_name() << " expanded\n";);
        return mk_pair(env, set_obligation_body(p, idx, st, obligation_body::mk_term(v), uctx));
    }
    if (get_program_transparent_obligations(get_global_ios().get_options()))
        st.m_opaque = false;
    /* the constant takes every universe parameter of the program */
    universe_context new_uctx = p.get_uctx().merge(uctx);
    environment new_env = register_auxiliary(env, o.get_name(), st.m_opaque, get_obligation_type(p, idx),
                                             some_expr(v), new_uctx);
    expr c = mk_constant(o.get_name(), param_levels(new_uctx.get_level_params()));
    obligation_body b = obligation_body::mk_constant(c, v, !st.m_opaque);
    return mk_pair(new_env, set_obligation_body(p, idx, st, b, uctx));
}

static pair<environment, program_decl> admit_obligation(environment const & env, program_decl const & p, unsigned idx,
                                                        expr const & type, universe_context const & uctx) {
    obligation const & o = p.get_obligations()[idx];
    universe_context new_uctx = p.get_uctx().merge(uctx);
    environment new_env  = register_auxiliary(env, o.get_name(), true, type, none_expr(), new_uctx);
    expr c = mk_constant(o.get_name(), param_levels(new_uctx.get_level_params()));
    return mk_pair(new_env, set_obligation_body(p, idx, o.get_status(), obligation_body::mk_constant(c, c, false), uctx));
}

static pair<environment, progress> finalize_program(environment const & env, program_decl const & p) {
    obligo_trace(name({"program", "finalize"}), tout() << "declaring " << p.get_name() << "\n";);
    std::vector<obligation> const & obls = p.get_obligations();
    expr type = subst_deps(false, obls, all_obligations(p), p.get_type());
    expr body = p.reduce(get_program_body(p));
    decl_info const & info = p.get_info();
    auto r = register_definition(env, p.get_name(), info.m_opaque, type, body, p.get_uctx());
    environment new_env = remove_program(r.first, p.get_name());
    new_env = call_hook(new_env, info.m_hook, hook_data(r.second, get_obligation_terms(p), info.m_scope, p.get_name()));
    return mk_pair(new_env, progress::mk_defined(p.get_name()));
}

static pair<environment, progress> finalize_mutual(environment const & env, program_decl const & p) {
    std::vector<name> const & group = p.get_deps();
    obligo_trace(name({"program", "finalize"}), tout() << "declaring mutual group of " << p.get_name() << "\n";);
    std::vector<fixpoint_member> members;
    std::vector<pair<name, expr>> obls;
    universe_context uctx;
    for (name const & m : group) {
        program_decl q = get_program(env, m);
        fixpoint_info const & fi = *q.get_fixpoint();
        expr type = subst_deps(false, q.get_obligations(), all_obligations(q), q.get_type());
        members.emplace_back(m, type, q.reduce(get_program_body(q)), fi.m_args, fi.m_struct_arg);
        std::vector<pair<name, expr>> q_obls = get_obligation_terms(q);
        obls.insert(obls.end(), q_obls.begin(), q_obls.end());
        uctx = uctx.merge(q.get_uctx());
    }
    decl_info const & info = p.get_info();
    auto r = register_mutually_recursive(env, p.get_fixpoint()->m_kind, members, uctx, p.get_notations());
    environment new_env = r.first;
    for (name const & m : group)
        new_env = remove_program(new_env, m);
    new_env = call_hook(new_env, info.m_hook, hook_data(r.second, obls, info.m_scope, group[0]));
    return mk_pair(new_env, progress::mk_defined(group[0]));
}

pair<environment, progress> update_obls(environment const & env, program_decl const & p) {
    environment new_env = replace_program(env, p);
    unsigned rem = p.get_remaining();
    if (rem > 0) {
        if (is_verbose())
            report_message(message(p.get_name(), INFORMATION, remaining_msg(rem)));
        return mk_pair(new_env, progress::mk_remain(rem));
    }
    if (p.is_fixpoint()) {
        for (name const & m : p.get_deps()) {
            optional<program_decl> q = find_program(new_env, m);
            if (q && q->get_remaining() > 0) {
                obligo_trace(name("program"), tout() << p.get_name() << " is waiting for " << m << "\n";);
                return mk_pair(new_env, progress::mk_dependent());
            }
        }
        return finalize_mutual(new_env, p);
    }
    return finalize_program(new_env, p);
}

/* Tactic used by the automatic pass: the given one, the obligation tactic, or the program tactic. */
static tactic get_auto_tactic(program_decl const & p, obligation const & o, tactic const & tac) {
    if (tac)
        return tac;
    if (o.has_tactic())
        return o.get_tactic();
    return p.get_tactic();
}

static optional<pair<environment, program_decl>> solve_by_tactic(environment const & env, program_decl const & p,
                                                                 unsigned idx, tactic const & tac) {
    typedef optional<pair<environment, program_decl>> result;
    obligation const & o = p.get_obligations()[idx];
    proof_state s(env, o.get_name(), get_obligation_type(p, idx), p.get_uctx());
    try {
        proof_state new_s = by(tac, s).first;
        if (unsigned n = get_open_goals(new_s)) {
            obligo_trace(name({"program", "auto"}), tout() << o.get_name() << ": " << n << " goal(s) left\n";);
            return result();
        }
        proof_output out = return_proof(new_s);
        return result(declare_obligation(env, p, idx, *out.m_entries[0].m_value, out.m_uctx));
    } catch (exception & ex) {
        obligo_trace(name({"program", "auto"}), tout() << "failed to solve " << o.get_name() << "\n" << ex.what() << "\n";);
        return result();
    }
}

/* Solve the obligations in \c todo, in position order, until no progress is made. When \c use_default is
   true the session tactic is used for the obligations without tactic. */
static pair<environment, progress> auto_solve(environment const & env, program_decl const & p0, std::set<unsigned> todo,
                                              tactic const & tac, bool use_default) {
    environment new_env = env;
    program_decl p      = p0;
    bool progress_made  = true;
    while (progress_made) {
        progress_made = false;
        for (unsigned i = 0; i < p.get_obligations().size(); i++) {
            if (!todo.count(i) || p.get_obligations()[i].is_solved() || !is_attemptable(p.get_obligations(), i))
                continue;
            tactic t = get_auto_tactic(p, p.get_obligations()[i], tac);
            if (!t && use_default)
                t = get_obligation_tactic(new_env);
            if (!t)
                continue;
            if (auto r = solve_by_tactic(new_env, p, i, t)) {
                obligo_trace(name({"program", "auto"}), tout() << "solved " << p.get_obligations()[i].get_name() << "\n";);
                new_env = r->first;
                p       = r->second;
                progress_made = true;
                for (unsigned j : dependents(p.get_obligations(), i))
                    todo.insert(j);
            }
        }
    }
    return update_obls(new_env, p);
}

pair<environment, progress> add_definition(environment const & env, name const & n, expr const & type,
                                           optional<expr> const & body, universe_context const & uctx,
                                           std::vector<obligation_info> const & obls,
                                           decl_info const & info, tactic const & tac, reduce_fn const & reduce) {
    if (env.contains(n) || find_program(env, n))
        throw already_declared_exception(n);
    optional<program_decl> p;
    if (!body) {
        name obl_n = n.append_after("_obligation");
        obligation whole(obl_n, type, obligation_location("program"), std::set<unsigned>(),
                         obligation_status(info.m_opaque, obligation_definition_status::Define));
        p = program_decl(n, type, mk_obligation_ref(whole), uctx, std::vector<obligation>({whole}), info, tac, reduce);
    } else if (obls.empty()) {
        obligo_trace(name("program"), tout() << n << " has no obligations\n";);
        environment new_env = declare_definition(env, n, info, type, reduce ? reduce(*body) : *body, uctx);
        return mk_pair(new_env, progress::mk_defined(n));
    } else {
        p = mk_program_decl(n, type, *body, uctx, obls, info, tac, reduce);
    }
    obligo_trace(name("program"), tout() << "program " << n << " with " << p->get_obligations().size()
                 << " obligation(s)\n";);
    environment new_env = add_program(env, *p);
    return auto_solve(new_env, *p, all_obligations(*p), tactic(), false);
}

pair<environment, progress> add_mutual_definitions(environment const & env, std::vector<mutual_member> const & ms,
                                                   universe_context const & uctx, decl_kind kind, decl_info const & info,
                                                   std::vector<std::string> const & notations,
                                                   tactic const & tac, reduce_fn const & reduce) {
    if (ms.empty())
        throw exception("empty group of mutually recursive programs");
    std::vector<name> group;
    bool has_obls = false;
    for (mutual_member const & m : ms) {
        if (env.contains(m.m_name) || find_program(env, m.m_name))
            throw already_declared_exception(m.m_name);
        group.push_back(m.m_name);
        if (!m.m_obls.empty())
            has_obls = true;
    }
    decl_info new_info = info;
    new_info.m_kind    = kind;
    if (!has_obls) {
        std::vector<fixpoint_member> members;
        for (mutual_member const & m : ms)
            members.emplace_back(m.m_name, m.m_type, reduce ? reduce(m.m_body) : m.m_body, m.m_args, m.m_struct_arg);
        environment new_env = declare_mutually_recursive(env, new_info, members, uctx, notations);
        return mk_pair(new_env, progress::mk_defined(group[0]));
    }
    environment new_env = env;
    for (mutual_member const & m : ms) {
        program_decl p = mk_program_decl(m.m_name, m.m_type, m.m_body, uctx, m.m_obls, new_info, tac, reduce)
            .set_fixpoint(fixpoint_info(kind, m.m_args, m.m_struct_arg), group, notations);
        new_env = add_program(new_env, p);
    }
    for (name const & m : group) {
        optional<program_decl> p = find_program(new_env, m);
        if (!p)
            break;
        new_env = auto_solve(new_env, *p, all_obligations(*p), tactic(), false).first;
    }
    if (!find_program(new_env, group[0]))
        return mk_pair(new_env, progress::mk_defined(group[0]));
    unsigned rem = 0;
    for (name const & m : group)
        rem += get_program(new_env, m).get_remaining();
    return mk_pair(new_env, progress::mk_remain(rem));
}

static environment obligation_terminator(environment const & env, name const & prog, unsigned idx,
                                         proof_output const & out, bool opaque) {
    program_decl p = get_program(env, prog);
    if (out.m_entries.size() != 1)
        throw exception(sstream() << "invalid proof of obligation " << idx + 1 << " of '" << prog << "'");
    proof_entry const & entry = out.m_entries[0];
    pair<environment, program_decl> r =
        entry.m_value ? declare_obligation(env, p, idx, *entry.m_value, out.m_uctx, optional<bool>(opaque))
                      : admit_obligation(env, p, idx, entry.m_type, out.m_uctx);
    std::set<unsigned> todo = dependents(r.second.get_obligations(), idx);
    return auto_solve(r.first, r.second, todo, tactic(), false).first;
}

proof_state start_obligation(environment const & env, unsigned k, optional<name> const & prog, tactic const & tac) {
    program_decl p = get_unique_open_program(env, prog);
    std::vector<obligation> const & obls = p.get_obligations();
    if (k == 0 || k > obls.size())
        throw unknown_obligation_exception(k);
    unsigned idx = k - 1;
    obligation const & o = obls[idx];
    if (o.is_solved())
        throw obligation_exception(sstream() << "Obligation " << k << " already solved");
    std::vector<unsigned> rem = deps_remaining(obls, o.get_deps());
    if (!rem.empty()) {
        sstream s;
        s << "Obligations ";
        for (unsigned i = 0; i < rem.size(); i++)
            s << (i == 0 ? "" : ", ") << rem[i] + 1;
        s << " of " << p.get_name() << " remain to be solved first";
        throw obligation_exception(s);
    }
    name pn = p.get_name();
    proof_ending e = proof_ending::mk_obligation(pn, idx, [=](environment const & new_env, proof_output const & out, bool opaque) {
            return obligation_terminator(new_env, pn, idx, out, opaque);
        });
    proof_state s(env, o.get_name(), get_obligation_type(p, idx), p.get_uctx(), local_context(), e);
    if (tac) {
        try {
            s = by(tac, s).first;
        } catch (exception & ex) {
            obligo_trace(name("program"), tout() << "initial tactic failed on " << o.get_name() << "\n" << ex.what() << "\n";);
        }
    }
    return s;
}

proof_state next_obligation(environment const & env, optional<name> const & prog, tactic const & tac) {
    program_decl p = get_unique_open_program(env, prog);
    std::vector<obligation> const & obls = p.get_obligations();
    for (unsigned i = 0; i < obls.size(); i++) {
        if (!obls[i].is_solved() && is_attemptable(obls, i))
            return start_obligation(env, i + 1, optional<name>(p.get_name()), tac);
    }
    throw obligation_exception(sstream() << "No more obligations for " << p.get_name());
}

pair<environment, progress> solve_obligations(environment const & env, optional<name> const & prog, tactic const & tac) {
    program_decl p = get_unique_open_program(env, prog);
    return auto_solve(env, p, all_obligations(p), tac, true);
}

environment solve_all_obligations(environment const & env, tactic const & tac) {
    environment new_env = env;
    for (program_decl const & p : get_programs(env)) {
        optional<program_decl> q = find_program(new_env, p.get_name());
        if (q && q->get_remaining() > 0)
            new_env = auto_solve(new_env, *q, all_obligations(*q), tac, true).first;
    }
    return new_env;
}

environment try_solve_obligation(environment const & env, unsigned k, optional<name> const & prog, tactic const & tac) {
    program_decl p = get_unique_open_program(env, prog);
    std::vector<obligation> const & obls = p.get_obligations();
    if (k == 0 || k > obls.size())
        throw unknown_obligation_exception(k);
    unsigned idx = k - 1;
    if (obls[idx].is_solved() || !is_attemptable(obls, idx))
        return env;
    tactic t = get_auto_tactic(p, obls[idx], tac);
    if (!t)
        t = get_obligation_tactic(env);
    if (auto r = solve_by_tactic(env, p, idx, t))
        return update_obls(r->first, r->second).first;
    return env;
}

environment try_solve_obligations(environment const & env, optional<name> const & prog, tactic const & tac) {
    return solve_obligations(env, prog, tac).first;
}

static void show_obligations_of(program_decl const & p, unsigned max) {
    sstream s;
    s << remaining_msg(p.get_remaining());
    std::vector<obligation> const & obls = p.get_obligations();
    unsigned shown = 0;
    for (unsigned i = 0; i < obls.size() && shown < max; i++) {
        if (obls[i].is_solved())
            continue;
        s << "\nObligation " << i + 1 << " of " << p.get_name() << ": " << get_obligation_type(p, i) << ".";
        shown++;
    }
    report_message(message(p.get_name(), INFORMATION, s.str()));
}

void show_obligations(environment const & env, optional<name> const & prog) {
    unsigned max = get_program_max_shown_obligations(get_global_ios().get_options());
    if (prog) {
        if (optional<program_decl> p = find_program(env, *prog))
            show_obligations_of(*p, max);
        else if (env.contains(*prog))
            report_message(message(*prog, INFORMATION, remaining_msg(0)));
        else
            throw exception(sstream() << "unknown program '" << *prog << "'");
        return;
    }
    bool found = false;
    for (program_decl const & p : get_programs(env)) {
        if (p.get_remaining() > 0) {
            show_obligations_of(p, max);
            found = true;
        }
    }
    if (!found)
        report_message(message(INFORMATION, remaining_msg(0)));
}

std::string show_term(environment const & env, optional<name> const & prog) {
    program_decl p = get_unique_open_program(env, prog);
    std::string r = (sstream() << p.get_name() << " : " << p.get_type() << " :=\n  " << get_program_body(p)).str();
    report_message(message(p.get_name(), INFORMATION, r));
    return r;
}

environment admit_obligations(environment const & env, optional<name> const & prog) {
    program_decl p = get_unique_open_program(env, prog);
    environment new_env = env;
    while (p.get_remaining() > 0) {
        bool progress_made = false;
        for (unsigned i = 0; i < p.get_obligations().size(); i++) {
            if (p.get_obligations()[i].is_solved() || !is_attemptable(p.get_obligations(), i))
                continue;
            auto r  = admit_obligation(new_env, p, i, get_obligation_type(p, i), p.get_uctx());
            new_env = r.first;
            p       = r.second;
            progress_made = true;
        }
        if (!progress_made)
            throw exception(sstream() << "cyclic dependencies between the obligations of '" << p.get_name() << "'");
    }
    return update_obls(new_env, p).first;
}

void check_solved_obligations(environment const & env, std::string const & what_for) {
    std::vector<name> ps;
    for (program_decl const & p : get_programs(env)) {
        if (p.get_remaining() > 0)
            ps.push_back(p.get_name());
    }
    if (!ps.empty())
        throw unsolved_obligations_exception(what_for, ps);
}

environment abandon_program(environment const & env, name const & prog) {
    program_decl p = get_program(env, prog);
    environment new_env = env;
    if (p.is_fixpoint()) {
        for (name const & m : p.get_deps())
            new_env = remove_program(new_env, m);
    } else {
        new_env = remove_program(new_env, prog);
    }
    obligo_trace(name("program"), tout() << "abandoned " << prog << "\n";);
    return new_env;
}

void check_program_libraries(environment const & env) {
    if (!env.contains(get_sorry_ax_name()))
        throw exception(sstream() << "program mode requires '" << get_sorry_ax_name()
                        << "', the program library must be imported");
}

environment import_program_library(environment const & env) {
    if (env.contains(get_sorry_ax_name()))
        return env;
    return env.add(mk_sorry_ax_decl());
}

void initialize_obligations() {
    g_transparent_obligations = new name{"program", "transparent_obligations"};
    g_max_shown_obligations   = new name{"program", "max_shown_obligations"};
    register_option(*g_transparent_obligations, BoolOption, "false",
                    "(program) declare the obligations as transparent definitions");
    register_option(*g_max_shown_obligations, UnsignedOption, "5",
                    "(program) maximum number of obligations displayed by show_obligations");
    register_trace_class(name("program"));
    register_trace_class(name({"program", "auto"}));
    register_trace_class(name({"program", "finalize"}));
    g_ext = new obligation_tactic_ext_reg();
}

void finalize_obligations() {
    delete g_ext;
    delete g_max_shown_obligations;
    delete g_transparent_obligations;
}
}
