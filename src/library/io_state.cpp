/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <string>
#include "library/io_state.h"

namespace obligo {
static io_state * g_dummy_ios = nullptr;
static io_state * g_ios       = nullptr;
static name *     g_verbose   = nullptr;

io_state const & get_dummy_ios() {
    return *g_dummy_ios;
}

io_state::io_state():
    m_regular_channel(std::make_shared<stdout_channel>()),
    m_diagnostic_channel(std::make_shared<stderr_channel>()) {
}

io_state::io_state(options const & opts):
    m_options(opts),
    m_regular_channel(std::make_shared<stdout_channel>()),
    m_diagnostic_channel(std::make_shared<stderr_channel>()) {
}

io_state::io_state(io_state const & ios, std::shared_ptr<output_channel> const & r, std::shared_ptr<output_channel> const & d):
    m_options(ios.m_options),
    m_regular_channel(r),
    m_diagnostic_channel(d) {
}

io_state::io_state(io_state const & ios, options const & o):
    m_options(o),
    m_regular_channel(ios.m_regular_channel),
    m_diagnostic_channel(ios.m_diagnostic_channel) {
}

void io_state::set_regular_channel(std::shared_ptr<output_channel> const & out) {
    if (out)
        m_regular_channel = out;
}

void io_state::set_diagnostic_channel(std::shared_ptr<output_channel> const & out) {
    if (out)
        m_diagnostic_channel = out;
}

io_state const & get_global_ios() {
    if (g_ios)
        return *g_ios;
    else
        return get_dummy_ios();
}

scope_global_ios::scope_global_ios(io_state const & ios) {
    m_old_ios = g_ios;
    g_ios     = const_cast<io_state*>(&ios);
}

scope_global_ios::~scope_global_ios() {
    g_ios = m_old_ios;
}

name const & get_verbose_opt_name() {
    return *g_verbose;
}

bool get_verbose(options const & opts) {
    return opts.get_bool(*g_verbose, true);
}

void initialize_io_state() {
    g_verbose   = new name("verbose");
    register_option(*g_verbose, BoolOption, "true", "disable/enable verbose messages");
    g_dummy_ios = new io_state(io_state(), std::make_shared<null_output_channel>(), std::make_shared<null_output_channel>());
}

void finalize_io_state() {
    delete g_dummy_ios;
    delete g_verbose;
}
}
