/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <set>
#include <string>
#include "util/debug.h"
#include "version.h"

namespace obligo {
static bool                    g_has_violations     = false;
static std::set<std::string> * g_enabled_debug_tags = nullptr;

bool has_violations() {
    return g_has_violations;
}

void notify_assertion_violation(const char * fileName, int line, const char * condition) {
    std::cerr << "Obligo (version " << OBLIGO_VERSION_STRING << ")\n";
    std::cerr << "ASSERTION VIOLATION\n";
    std::cerr << "File: " << fileName << "\n";
    std::cerr << "Line: " << line << "\n";
    std::cerr << condition << "\n";
    std::cerr.flush();
}

void enable_debug(char const * tag) {
    if (g_enabled_debug_tags)
        g_enabled_debug_tags->insert(tag);
}

void disable_debug(char const * tag) {
    if (g_enabled_debug_tags)
        g_enabled_debug_tags->erase(tag);
}

bool is_debug_enabled(const char * tag) {
    return g_enabled_debug_tags && g_enabled_debug_tags->count(tag) > 0;
}

void invoke_debugger() {
    g_has_violations = true;
    throw unreachable_reached();
}

void initialize_debug() {
    g_enabled_debug_tags = new std::set<std::string>();
}

void finalize_debug() {
    delete g_enabled_debug_tags;
    g_enabled_debug_tags = nullptr;
}
}
