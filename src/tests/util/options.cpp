/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <string>
#include "util/debug.h"
#include "util/options.h"
#include "util/init_module.h"
using namespace obligo;

static void tst1() {
    options o;
    obligo_assert(o.empty());
    options o2 = o.update(name({"program", "max_shown"}), 3u).update(name("verbose"), false);
    obligo_assert(o.empty());
    obligo_assert(o2.size() == 2);
    obligo_assert(o2.get_unsigned(name({"program", "max_shown"}), 5) == 3);
    obligo_assert(!o2.get_bool(name("verbose"), true));
    obligo_assert(o2.get_bool(name("unknown"), true));
    obligo_assert(o2.erase(name("verbose")).size() == 1);
}

static void tst2() {
    options o1 = options(name("a"), true).update(name("b"), 1u);
    options o2 = options(name("a"), false);
    options o3 = join(o1, o2);
    obligo_assert(!o3.get_bool(name("a")));
    obligo_assert(o3.get_unsigned(name("b")) == 1);
    obligo_assert(o1.update_if_undef(name("a"), false).get_bool(name("a")));
}

static void tst3() {
    register_option(name({"test", "flag"}), BoolOption, "false", "flag used for testing");
    options o;
    o = set_option_from_string(o, name({"test", "flag"}), "true");
    obligo_assert(o.get_bool(name({"test", "flag"})));
    try {
        set_option_from_string(o, name({"test", "unknown"}), "true");
        obligo_unreachable();
    } catch (option_exception & ex) {
        obligo_assert(std::string(ex.what()) == "unknown option 'test.unknown'");
    }
    try {
        set_option_from_string(o, name({"test", "flag"}), "yes");
        obligo_unreachable();
    } catch (option_exception & ex) {
        obligo_assert(std::string(ex.what()).find("invalid value 'yes'") == 0);
    }
}

int main() {
    initialize_util_module();
    tst1();
    tst2();
    tst3();
    finalize_util_module();
    return has_violations() ? 1 : 0;
}
