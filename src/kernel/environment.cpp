/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <vector>
#include "util/name_set.h"
#include "kernel/kernel_exception.h"
#include "kernel/instantiate.h"
#include "kernel/type_checker.h"
#include "kernel/environment.h"

namespace obligo {
static std::vector<std::shared_ptr<environment_extension const>> * g_initial_extensions = nullptr;
static unsigned g_next_env_id = 0;

environment::environment():
    m_declarations(std::make_shared<declarations>()),
    m_extensions(std::make_shared<extensions>()),
    m_trail(g_next_env_id++) {}

environment::environment(environment const & env, std::shared_ptr<declarations const> const & ds):
    m_declarations(ds), m_extensions(env.m_extensions), m_trail(g_next_env_id++, env.m_trail) {}

environment::environment(environment const & env, std::shared_ptr<extensions const> const & exts):
    m_declarations(env.m_declarations), m_extensions(exts), m_trail(g_next_env_id++, env.m_trail) {}

optional<declaration> environment::find(name const & n) const {
    return m_declarations->find_opt(n);
}

declaration environment::get(name const & n) const {
    if (declaration const * d = m_declarations->find(n))
        return *d;
    throw unknown_constant_exception(n);
}

void environment::check_name(name const & n) const {
    if (contains(n))
        throw already_declared_exception(n);
}

static void check_closed(declaration const & d, expr const & e) {
    if (has_loose_bvars(e))
        throw kernel_exception(sstream() << "invalid declaration '" << d.get_name()
                               << "', it contains loose bound variables");
    if (has_local(e))
        throw kernel_exception(sstream() << "invalid declaration '" << d.get_name()
                               << "', it contains free variables");
    if (has_metavar(e))
        throw kernel_exception(sstream() << "invalid declaration '" << d.get_name()
                               << "', it contains metavariables");
}

static void check_univ_params(declaration const & d, expr const & e) {
    name_set used;
    collect_univ_params(e, used);
    name_set declared;
    for (name const & p : d.get_univ_params()) {
        if (declared.contains(p))
            throw kernel_exception(sstream() << "invalid declaration '" << d.get_name()
                                   << "', duplicate universe parameter '" << p << "'");
        declared.insert(p);
    }
    used.for_each([&](name const & u) {
            if (!declared.contains(u))
                throw undeclared_universe_exception(d.get_name(), u);
        });
}

static void check_type(environment const & env, declaration const & d) {
    check_closed(d, d.get_type());
    check_univ_params(d, d.get_type());
    type_checker tc(env);
    tc.ensure_sort(tc.infer(d.get_type()));
}

static void check_value(environment const & env, declaration const & d) {
    check_closed(d, d.get_value());
    check_univ_params(d, d.get_value());
    type_checker tc(env);
    expr val_type = tc.infer(d.get_value());
    if (!tc.is_def_eq(val_type, d.get_type()))
        throw definition_type_mismatch_exception(d.get_name(), val_type, d.get_type());
}

static void check_recursive_arg(declaration const & d) {
    if (!d.get_recursive_arg())
        return;
    unsigned nargs = 0;
    expr it = d.get_type();
    while (is_pi(it)) {
        nargs++;
        it = binding_body(it);
    }
    if (*d.get_recursive_arg() >= nargs)
        throw kernel_exception(sstream() << "invalid recursive definition '" << d.get_name()
                               << "', structural argument #" << (*d.get_recursive_arg() + 1) << " does not exist");
}

environment environment::add(declaration const & d) const {
    check_name(d.get_name());
    check_type(*this, d);
    if (d.has_value())
        check_value(*this, d);
    auto ds = std::make_shared<declarations>(*m_declarations);
    ds->insert(d.get_name(), d);
    return environment(*this, ds);
}

environment environment::add_mutual(std::vector<declaration> const & ds) const {
    name_set names;
    for (declaration const & d : ds) {
        check_name(d.get_name());
        if (names.contains(d.get_name()))
            throw already_declared_exception(d.get_name());
        names.insert(d.get_name());
        check_type(*this, d);
        check_recursive_arg(d);
    }
    /* The bodies are checked in an environment where every member is an opaque constant. */
    auto tmp_ds = std::make_shared<declarations>(*m_declarations);
    for (declaration const & d : ds)
        tmp_ds->insert(d.get_name(), mk_axiom(d.get_name(), d.get_univ_params(), d.get_type()));
    environment tmp_env(*this, tmp_ds);
    for (declaration const & d : ds) {
        if (d.has_value())
            check_value(tmp_env, d);
    }
    auto new_ds = std::make_shared<declarations>(*m_declarations);
    for (declaration const & d : ds)
        new_ds->insert(d.get_name(), d);
    return environment(*this, new_ds);
}

unsigned environment::register_extension(std::shared_ptr<environment_extension const> const & initial) {
    g_initial_extensions->push_back(initial);
    return g_initial_extensions->size() - 1;
}

environment_extension const & environment::get_extension(unsigned extid) const {
    obligo_assert(extid < g_initial_extensions->size());
    if (extid < m_extensions->size() && (*m_extensions)[extid])
        return *(*m_extensions)[extid];
    return *(*g_initial_extensions)[extid];
}

environment environment::update(unsigned extid, std::shared_ptr<environment_extension const> const & ext) const {
    obligo_assert(extid < g_initial_extensions->size());
    auto exts = std::make_shared<extensions>(*m_extensions);
    if (exts->size() <= extid)
        exts->resize(extid + 1);
    (*exts)[extid] = ext;
    return environment(*this, exts);
}

bool environment::is_descendant(environment const & env) const {
    unsigned id = head(env.m_trail);
    for (unsigned i : m_trail) {
        if (i == id)
            return true;
    }
    return false;
}

void environment::for_each_declaration(std::function<void(declaration const &)> const & f) const {
    m_declarations->for_each([&](name const &, declaration const & d) { f(d); });
}

void initialize_environment() {
    g_initial_extensions = new std::vector<std::shared_ptr<environment_extension const>>();
}

void finalize_environment() {
    delete g_initial_extensions;
}
}
