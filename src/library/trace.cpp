/*
Copyright (c) 2015 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <algorithm>
#include <vector>
#include <string>
#include "util/name_set.h"
#include "library/io_state.h"
#include "library/trace.h"

namespace obligo {
static name_set *            g_trace_classes = nullptr;
static name_map<name_set>  * g_trace_aliases = nullptr;
static std::vector<name> *   g_enabled_trace_classes  = nullptr;
static std::vector<name> *   g_disabled_trace_classes = nullptr;
static options const *       g_opts   = nullptr;
static bool                  g_silent = false;
static unsigned              g_depth  = 0;
static null_output_channel * g_null_channel = nullptr;

void register_trace_class(name const & n) {
    register_option(name("trace") + n, BoolOption, "false",
                    "(trace) enable/disable tracing for the given module and submodules");
    g_trace_classes->insert(n);
}

void register_trace_class_alias(name const & n, name const & alias) {
    name_set new_s;
    if (auto s = g_trace_aliases->find(n))
        new_s = *s;
    new_s.insert(alias);
    g_trace_aliases->insert(n, new_s);
}

bool is_trace_enabled() {
    return !g_enabled_trace_classes->empty();
}

static void update_class(std::vector<name> & cs, name const & c) {
    if (std::find(cs.begin(), cs.end(), c) == cs.end()) {
        cs.push_back(c);
    }
}

static bool is_trace_class_set_core(std::vector<name> const & cs, name const & n) {
    for (name const & p : cs) {
        if (is_prefix_of(p, n)) {
            return true;
        }
    }
    return false;
}

static bool is_trace_class_set(std::vector<name> const & cs, name const & n) {
    if (is_trace_class_set_core(cs, n))
        return true;
    auto it = n;
    while (true) {
        if (auto s = g_trace_aliases->find(it)) {
            bool found = false;
            s->for_each([&](name const & alias) {
                    if (!found && is_trace_class_set_core(cs, alias))
                        found = true;
                });
            if (found)
                return true;
        }
        if (it.is_atomic())
            return false;
        it = it.get_prefix();
    }
}

bool is_trace_class_enabled(name const & n) {
    if (!is_trace_enabled())
        return false;
    if (is_trace_class_set(*g_disabled_trace_classes, n))
        return false; // it was explicitly disabled
    return is_trace_class_set(*g_enabled_trace_classes, n);
}

scope_trace_env::scope_trace_env(options const & opts) {
    m_enable_sz  = g_enabled_trace_classes->size();
    m_disable_sz = g_disabled_trace_classes->size();
    m_old_opts   = g_opts;
    name trace("trace");
    if (g_opts != &opts) {
        opts.for_each([&](name const & n) {
                if (is_prefix_of(trace, n) && n != trace) {
                    name cls = n.replace_prefix(trace, name());
                    if (opts.get_bool(n, false))
                        update_class(*g_enabled_trace_classes, cls);
                    else
                        update_class(*g_disabled_trace_classes, cls);
                }
            });
    }
    g_opts = &opts;
}

scope_trace_env::~scope_trace_env() {
    g_opts = m_old_opts;
    g_enabled_trace_classes->resize(m_enable_sz);
    g_disabled_trace_classes->resize(m_disable_sz);
}

void scope_trace_inc_depth::activate() {
    obligo_assert(!m_active);
    m_active = true;
    g_depth++;
}

scope_trace_inc_depth::~scope_trace_inc_depth() {
    if (m_active)
        g_depth--;
}

scope_trace_silent::scope_trace_silent(bool flag) {
    m_old_value = g_silent;
    g_silent    = flag;
}

scope_trace_silent::~scope_trace_silent() {
    g_silent    = m_old_value;
}

std::ostream & tout() {
    if (g_silent)
        return g_null_channel->get_stream();
    return get_global_ios().get_diagnostic_stream();
}

std::ostream & operator<<(std::ostream & out, tdepth const &) {
    out << g_depth << ". ";
    return out;
}

std::ostream & operator<<(std::ostream & out, tclass const & c) {
    out << "[" << c.m_cls << "] ";
    return out;
}

void initialize_trace() {
    g_trace_classes          = new name_set();
    g_trace_aliases          = new name_map<name_set>();
    g_enabled_trace_classes  = new std::vector<name>();
    g_disabled_trace_classes = new std::vector<name>();
    g_null_channel           = new null_output_channel();

    register_trace_class(name{"debug"});
}

void finalize_trace() {
    delete g_null_channel;
    delete g_disabled_trace_classes;
    delete g_enabled_trace_classes;
    delete g_trace_aliases;
    delete g_trace_classes;
}
}
