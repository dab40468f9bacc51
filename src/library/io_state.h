/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <memory>
#include <string>
#include "util/output_channel.h"
#include "util/options.h"

namespace obligo {
/**
   \brief State provided to procedures that need to:
   1- Access user defined options
   2- Produce diagnostic messages
   3- Output results
*/
class io_state {
    options                         m_options;
    std::shared_ptr<output_channel> m_regular_channel;
    std::shared_ptr<output_channel> m_diagnostic_channel;
public:
    io_state();
    io_state(options const & opts);
    io_state(io_state const & ios, std::shared_ptr<output_channel> const & r, std::shared_ptr<output_channel> const & d);
    io_state(io_state const & ios, options const & o);

    options const & get_options() const { return m_options; }
    output_channel & get_regular_channel() const { return *m_regular_channel; }
    output_channel & get_diagnostic_channel() const { return *m_diagnostic_channel; }
    std::ostream & get_regular_stream() const { return m_regular_channel->get_stream(); }
    std::ostream & get_diagnostic_stream() const { return m_diagnostic_channel->get_stream(); }

    void set_regular_channel(std::shared_ptr<output_channel> const & out);
    void set_diagnostic_channel(std::shared_ptr<output_channel> const & out);
    void set_options(options const & opts) { m_options = opts; }
    template<typename T> void set_option(name const & n, T const & v) {
        set_options(get_options().update(n, v));
    }
};

/** \brief Return a dummy io_state that is meant to be used in contexts that require an io_state, but it is not really used */
io_state const & get_dummy_ios();

/** \brief Return reference to the current io_state object. */
io_state const & get_global_ios();

/** \brief Make \c ios the global io_state while this object is alive. */
struct scope_global_ios {
    io_state * m_old_ios;
public:
    scope_global_ios(io_state const & ios);
    ~scope_global_ios();
};

bool get_verbose(options const & opts);
name const & get_verbose_opt_name();

void initialize_io_state();
void finalize_io_state();
}
