/*
Copyright (c) 2014 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <string>
#include <vector>
#include "util/sstream.h"
#include "kernel/instantiate.h"
#include "library/admitted.h"
#include "library/io_state.h"
#include "library/messages.h"
#include "library/trace.h"
#include "library/declare.h"

namespace obligo {
struct notations_ext : public environment_extension {
    name_map<std::vector<std::string>> m_notations;
    notations_ext() {}
};

struct notations_ext_reg {
    unsigned m_ext_id;
    notations_ext_reg() {
        m_ext_id = environment::register_extension(std::make_shared<notations_ext>());
    }
};

static notations_ext_reg * g_ext = nullptr;
static notations_ext const & get_extension(environment const & env) {
    return static_cast<notations_ext const &>(env.get_extension(g_ext->m_ext_id));
}
static environment update(environment const & env, notations_ext const & ext) {
    return env.update(g_ext->m_ext_id, std::make_shared<notations_ext>(ext));
}

std::vector<std::string> get_recorded_notations(environment const & env, name const & n) {
    if (auto r = get_extension(env).m_notations.find(n))
        return *r;
    return std::vector<std::string>();
}

pair<universe_context, name_map<level>> prepare_universe_context(universe_context const & uctx, std::vector<expr> const & es) {
    name_set used;
    for (expr const & e : es)
        collect_univ_params(e, used);
    auto r = uctx.restrict(used).minimize();
    obligo_trace(name("declare"), tout() << "universe context " << uctx << " minimized to " << r.first << "\n";);
    return r;
}

environment call_hook(environment const & env, declaration_hook const & hook, hook_data const & data) {
    if (!hook)
        return env;
    try {
        return hook(env, data);
    } catch (exception & ex) {
        report_message(message(data.m_ref, ERROR, "declaration hook failed", ex.what()));
        return env;
    }
}

static void report_defined(name const & n, char const * what) {
    if (get_verbose(get_global_ios().get_options()))
        report_message(message(n, INFORMATION, (sstream() << n << " is " << what).str()));
}

pair<environment, universe_context> register_definition(environment const & env, name const & n, bool opaque,
                                                        expr const & type, expr const & value,
                                                        universe_context const & uctx) {
    auto p = prepare_universe_context(uctx, {type, value});
    expr new_type  = instantiate_univ_params(type, p.second);
    expr new_value = instantiate_univ_params(value, p.second);
    level_param_names ps = p.first.get_level_params();
    declaration d = opaque ? mk_theorem(n, ps, new_type, new_value) : mk_definition(n, ps, new_type, new_value);
    environment new_env = env.add(d);
    obligo_trace(name("declare"), tout() << (opaque ? "theorem " : "definition ") << n << " : " << new_type << "\n";);
    report_defined(n, "defined");
    return mk_pair(new_env, p.first);
}

environment declare_definition(environment const & env, name const & n, decl_info const & info,
                               expr const & type, expr const & value, universe_context const & uctx,
                               std::vector<pair<name, expr>> const & obls) {
    auto r = register_definition(env, n, info.m_opaque, type, value, uctx);
    return call_hook(r.first, info.m_hook, hook_data(r.second, obls, info.m_scope, n));
}

environment declare_assumption(environment const & env, name const & n, decl_info const & info,
                               expr const & type, universe_context const & uctx) {
    auto p = prepare_universe_context(uctx, {type});
    expr new_type = instantiate_univ_params(type, p.second);
    environment new_env = env.add(mk_axiom(n, p.first.get_level_params(), new_type));
    report_defined(n, "assumed");
    return call_hook(new_env, info.m_hook, hook_data(p.first, std::vector<pair<name, expr>>(), info.m_scope, n));
}

environment declare_admitted(environment const & env, name const & n, expr const & type, universe_context const & uctx) {
    auto p = prepare_universe_context(uctx, {type});
    expr new_type = instantiate_univ_params(type, p.second);
    environment new_env = add_admitted(env, n, p.first.get_level_params(), new_type);
    report_defined(n, "declared");
    return new_env;
}

environment register_auxiliary(environment const & env, name const & n, bool opaque, expr const & type,
                               optional<expr> const & value, universe_context const & uctx) {
    level_param_names ps = uctx.get_level_params();
    environment new_env;
    if (!value) {
        new_env = add_admitted(env, n, ps, type);
        report_defined(n, "declared");
    } else {
        new_env = env.add(opaque ? mk_theorem(n, ps, type, *value) : mk_definition(n, ps, type, *value));
        report_defined(n, "defined");
    }
    obligo_trace(name("declare"), tout() << "auxiliary " << n << " : " << type << "\n";);
    return new_env;
}

static optional<unsigned> get_struct_arg_idx(fixpoint_member const & m) {
    if (!m.m_struct_arg)
        return optional<unsigned>();
    for (unsigned i = 0; i < m.m_args.size(); i++) {
        if (m.m_args[i] == *m.m_struct_arg)
            return optional<unsigned>(i);
    }
    throw exception(sstream() << "'" << *m.m_struct_arg << "' is not an argument of '" << m.m_name << "'");
}

pair<environment, universe_context> register_mutually_recursive(environment const & env, decl_kind k,
                                                                std::vector<fixpoint_member> const & members,
                                                                universe_context const & uctx,
                                                                std::vector<std::string> const & notations) {
    if (members.empty())
        throw exception("empty group of mutually recursive definitions");
    std::vector<expr> es;
    for (fixpoint_member const & m : members) {
        es.push_back(m.m_type);
        es.push_back(m.m_value);
    }
    auto p = prepare_universe_context(uctx, es);
    level_param_names ps = p.first.get_level_params();
    std::vector<declaration> ds;
    for (fixpoint_member const & m : members) {
        optional<unsigned> idx;
        if (k == decl_kind::Fixpoint)
            idx = get_struct_arg_idx(m);
        ds.push_back(mk_recursive_definition(m.m_name, ps, instantiate_univ_params(m.m_type, p.second),
                                             instantiate_univ_params(m.m_value, p.second), idx));
    }
    environment new_env = env.add_mutual(ds);
    if (!notations.empty()) {
        notations_ext ext = get_extension(new_env);
        for (fixpoint_member const & m : members)
            ext.m_notations.insert(m.m_name, notations);
        new_env = update(new_env, ext);
    }
    for (fixpoint_member const & m : members) {
        obligo_trace(name("declare"), tout() << (k == decl_kind::CoFixpoint ? "cofixpoint " : "fixpoint ")
                     << m.m_name << "\n";);
        report_defined(m.m_name, k == decl_kind::CoFixpoint ? "corecursively defined" : "recursively defined");
    }
    return mk_pair(new_env, p.first);
}

environment declare_mutually_recursive(environment const & env, decl_info const & info,
                                       std::vector<fixpoint_member> const & members, universe_context const & uctx,
                                       std::vector<std::string> const & notations,
                                       std::vector<pair<name, expr>> const & obls) {
    auto r = register_mutually_recursive(env, info.m_kind, members, uctx, notations);
    return call_hook(r.first, info.m_hook, hook_data(r.second, obls, info.m_scope, members[0].m_name));
}

environment save_lemma_proved(environment const & env, proof_object const & p, decl_info const & info) {
    proof_output const & out = p.consume();
    proof_ending const & e   = p.get_ending();
    if (e.kind() != proof_ending_kind::Regular) {
        obligo_assert(e.get_terminator());
        /* the universes of an obligation are minimized with its program */
        if (e.kind() == proof_ending_kind::End_obligation)
            return e.get_terminator()(env, out, p.is_opaque());
        /* keep the parameters used by the entries */
        std::vector<expr> es;
        for (proof_entry const & entry : out.m_entries) {
            es.push_back(entry.m_type);
            if (entry.m_value)
                es.push_back(*entry.m_value);
        }
        auto r = prepare_universe_context(out.m_uctx, es);
        proof_output new_out;
        new_out.m_uctx     = r.first;
        new_out.m_admitted = out.m_admitted;
        for (proof_entry const & entry : out.m_entries) {
            optional<expr> v;
            if (entry.m_value)
                v = instantiate_univ_params(*entry.m_value, r.second);
            new_out.m_entries.emplace_back(entry.m_name, instantiate_univ_params(entry.m_type, r.second), v);
        }
        return e.get_terminator()(env, new_out, p.is_opaque());
    }
    decl_info new_info = info;
    new_info.m_opaque  = p.is_opaque();
    environment new_env = env;
    for (proof_entry const & entry : out.m_entries) {
        if (entry.m_value)
            new_env = declare_definition(new_env, entry.m_name, new_info, entry.m_type, *entry.m_value, out.m_uctx);
        else
            new_env = declare_admitted(new_env, entry.m_name, entry.m_type, out.m_uctx);
    }
    return new_env;
}

environment save_lemma_admitted(environment const & env, proof_state const & s) {
    proof_output out = return_admitted(s);
    proof_ending const & e = s.get_ending();
    if (e.kind() != proof_ending_kind::Regular)
        return e.get_terminator()(env, out, true);
    environment new_env = env;
    for (proof_entry const & entry : out.m_entries)
        new_env = declare_admitted(new_env, entry.m_name, entry.m_type, out.m_uctx);
    return new_env;
}

void initialize_declare() {
    g_ext = new notations_ext_reg();
    register_trace_class(name("declare"));
}

void finalize_declare() {
    delete g_ext;
}
}
