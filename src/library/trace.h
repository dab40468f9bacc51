/*
Copyright (c) 2015 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <iostream>
#include "util/options.h"

namespace obligo {
void register_trace_class(name const & n);
void register_trace_class_alias(name const & n, name const & alias);
bool is_trace_enabled();
bool is_trace_class_enabled(name const & n);

#define obligo_is_trace_enabled(CName) (::obligo::is_trace_enabled() && ::obligo::is_trace_class_enabled(CName))

/** \brief Enable the trace classes set in the given options (<tt>trace.CLASS</tt>) while this object is alive. */
class scope_trace_env {
    unsigned        m_enable_sz;
    unsigned        m_disable_sz;
    options const * m_old_opts;
public:
    scope_trace_env(options const & opts);
    ~scope_trace_env();
};

class scope_trace_inc_depth {
    bool m_active{false};
public:
    ~scope_trace_inc_depth();
    void activate();
};

/* Helper object for temporarily silencing trace messages */
class scope_trace_silent {
    bool m_old_value;
public:
    scope_trace_silent(bool flag);
    ~scope_trace_silent();
};

struct tdepth {};
struct tclass { name m_cls; tclass(name const & c):m_cls(c) {} };

std::ostream & tout();
std::ostream & operator<<(std::ostream & out, tdepth const &);
std::ostream & operator<<(std::ostream & out, tclass const &);

#define OBLIGO_MERGE_(a, b)  a##b
#define OBLIGO_LABEL_(a) OBLIGO_MERGE_(unique_name_, a)
#define OBLIGO_UNIQUE_NAME OBLIGO_LABEL_(__LINE__)

#define obligo_trace_inc_depth(CName)                                   \
scope_trace_inc_depth OBLIGO_UNIQUE_NAME;                               \
if (obligo_is_trace_enabled(name(CName)))                               \
    OBLIGO_UNIQUE_NAME.activate();

#define obligo_trace_plain(CName, CODE) {       \
if (obligo_is_trace_enabled(CName)) {           \
    CODE                                        \
}}

#define obligo_trace(CName, CODE) {             \
if (obligo_is_trace_enabled(CName)) {           \
    tout() << tclass(CName); CODE               \
}}

#define obligo_trace_d(CName, CODE) {             \
if (obligo_is_trace_enabled(CName)) {             \
    tout() << tdepth() << tclass(CName); CODE     \
}}

void initialize_trace();
void finalize_trace();
}
