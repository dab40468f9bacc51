/*
Copyright (c) 2015 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <string>
#include <vector>
#include "util/sstream.h"
#include "kernel/kernel_exception.h"
#include "library/program/program_state.h"

namespace obligo {
static std::string mk_ambiguous_msg(std::vector<name> const & ps) {
    if (ps.empty())
        return "No obligations remaining";
    sstream s;
    s << "More than one program with unsolved obligations:";
    for (name const & p : ps)
        s << " " << p;
    return s.str();
}

ambiguous_program_exception::ambiguous_program_exception(std::vector<name> const & ps):
    exception(mk_ambiguous_msg(ps)), m_programs(ps) {}

typedef rb_map<name, program_decl, name_cmp> program_map;

struct program_ext : public environment_extension {
    program_map m_programs;
    program_ext() {}
};

struct program_ext_reg {
    unsigned m_ext_id;
    program_ext_reg() {
        m_ext_id = environment::register_extension(std::make_shared<program_ext>());
    }
};

static program_ext_reg * g_ext = nullptr;
static program_ext const & get_extension(environment const & env) {
    return static_cast<program_ext const &>(env.get_extension(g_ext->m_ext_id));
}
static environment update(environment const & env, program_ext const & ext) {
    return env.update(g_ext->m_ext_id, std::make_shared<program_ext>(ext));
}

unsigned num_pending_programs(environment const & env) {
    unsigned r = 0;
    get_extension(env).m_programs.for_each([&](name const &, program_decl const & p) {
            if (p.get_remaining() > 0)
                r++;
        });
    return r;
}

optional<program_decl> find_program(environment const & env, name const & n) {
    return get_extension(env).m_programs.find_opt(n);
}

program_decl get_program(environment const & env, name const & n) {
    if (auto p = get_extension(env).m_programs.find(n))
        return *p;
    throw exception(sstream() << "unknown program '" << n << "'");
}

static std::vector<name> get_open_programs(environment const & env) {
    std::vector<name> r;
    get_extension(env).m_programs.for_each([&](name const & n, program_decl const & p) {
            if (p.get_remaining() > 0)
                r.push_back(n);
        });
    return r;
}

program_decl get_unique_open_program(environment const & env, optional<name> const & n) {
    if (n)
        return get_program(env, *n);
    std::vector<name> ps = get_open_programs(env);
    if (ps.size() != 1)
        throw ambiguous_program_exception(ps);
    return get_program(env, ps[0]);
}

optional<program_decl> first_pending_program(environment const & env) {
    std::vector<name> ps = get_open_programs(env);
    if (ps.empty())
        return optional<program_decl>();
    return find_program(env, ps[0]);
}

std::vector<program_decl> get_programs(environment const & env) {
    std::vector<program_decl> r;
    get_extension(env).m_programs.for_each([&](name const &, program_decl const & p) { r.push_back(p); });
    return r;
}

environment add_program(environment const & env, program_decl const & p) {
    program_ext ext = get_extension(env);
    if (ext.m_programs.contains(p.get_name()) || env.contains(p.get_name()))
        throw already_declared_exception(p.get_name());
    ext.m_programs.insert(p.get_name(), p);
    return update(env, ext);
}

environment replace_program(environment const & env, program_decl const & p) {
    program_ext ext = get_extension(env);
    obligo_assert(ext.m_programs.contains(p.get_name()));
    ext.m_programs.insert(p.get_name(), p);
    return update(env, ext);
}

environment remove_program(environment const & env, name const & n) {
    program_ext ext = get_extension(env);
    ext.m_programs.erase(n);
    return update(env, ext);
}

void initialize_program_state() {
    g_ext = new program_ext_reg();
}

void finalize_program_state() {
    delete g_ext;
}
}
