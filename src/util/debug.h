/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <iostream>
#include "util/exception.h"

#ifdef __GNUC__
#define OBLIGO_UNLIKELY(x) (__builtin_expect((x), 0))
#define OBLIGO_LIKELY(x) (__builtin_expect((x), 1))
#else
#define OBLIGO_UNLIKELY(x) (x)
#define OBLIGO_LIKELY(x) (x)
#endif

#ifdef OBLIGO_DEBUG
#define DEBUG_CODE(CODE) CODE
#else
#define DEBUG_CODE(CODE)
#endif

#define obligo_unreachable() {                                          \
        DEBUG_CODE({obligo::notify_assertion_violation(__FILE__, __LINE__, "UNREACHABLE CODE WAS REACHED."); \
                obligo::invoke_debugger();})                            \
        throw obligo::unreachable_reached();                            \
    }

#ifdef OBLIGO_DEBUG
#define obligo_verify(COND) if (OBLIGO_UNLIKELY(!(COND))) { obligo::notify_assertion_violation(__FILE__, __LINE__, #COND); obligo::invoke_debugger(); }
#else
#define obligo_verify(COND) (COND)
#endif

#define obligo_assert(COND) DEBUG_CODE({if (OBLIGO_UNLIKELY(!(COND))) { obligo::notify_assertion_violation(__FILE__, __LINE__, #COND); obligo::invoke_debugger(); }})

#define obligo_assert_eq(A, B) DEBUG_CODE({if (OBLIGO_UNLIKELY(!((A) == (B)))) { \
                obligo::notify_assertion_violation(__FILE__, __LINE__, #A " == " #B); \
                std::cerr << "(" << #A << ") := " << (A) << "\n";       \
                std::cerr << "(" << #B << ") := " << (B) << "\n";       \
                obligo::invoke_debugger(); }})

namespace obligo {
void notify_assertion_violation(char const * file_name, int line, char const * condition);
void enable_debug(char const * tag);
void disable_debug(char const * tag);
bool is_debug_enabled(char const * tag);
void invoke_debugger();
bool has_violations();
void initialize_debug();
void finalize_debug();
}
