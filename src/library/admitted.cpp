/*
Copyright (c) 2015 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.
*/
#include <vector>
#include "util/name_set.h"
#include "kernel/for_each_fn.h"
#include "library/sorry.h"
#include "library/admitted.h"

namespace obligo {
struct admitted_ext : public environment_extension {
    name_set m_admitted;
    admitted_ext() {}
};

struct admitted_ext_reg {
    unsigned m_ext_id;
    admitted_ext_reg() {
        m_ext_id = environment::register_extension(std::make_shared<admitted_ext>());
    }
};

static admitted_ext_reg * g_ext = nullptr;
static admitted_ext const & get_extension(environment const & env) {
    return static_cast<admitted_ext const &>(env.get_extension(g_ext->m_ext_id));
}
static environment update(environment const & env, admitted_ext const & ext) {
    return env.update(g_ext->m_ext_id, std::make_shared<admitted_ext>(ext));
}

environment add_admitted(environment const & env, name const & n, level_param_names const & ps, expr const & type) {
    environment new_env = env.add(mk_axiom(n, ps, type));
    admitted_ext ext = get_extension(new_env);
    ext.m_admitted.insert(n);
    return update(new_env, ext);
}

bool is_admitted(environment const & env, name const & n) {
    return get_extension(env).m_admitted.contains(n);
}

bool depends_on_admitted(environment const & env, name const & n) {
    admitted_ext const & ext = get_extension(env);
    name_set visited;
    std::vector<name> todo;
    todo.push_back(n);
    while (!todo.empty()) {
        name c = todo.back();
        todo.pop_back();
        if (visited.contains(c))
            continue;
        visited.insert(c);
        if (ext.m_admitted.contains(c) || c == get_sorry_ax_name())
            return true;
        optional<declaration> d = env.find(c);
        if (!d)
            continue;
        auto visit = [&](expr const & e, unsigned) {
            if (is_constant(e) && !visited.contains(const_name(e)))
                todo.push_back(const_name(e));
            return true;
        };
        for_each(d->get_type(), visit);
        if (d->has_value())
            for_each(d->get_value(), visit);
    }
    return false;
}

void initialize_admitted() {
    g_ext = new admitted_ext_reg();
}

void finalize_admitted() {
    delete g_ext;
}
}
