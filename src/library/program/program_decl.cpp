/*
Copyright (c) 2015 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <vector>
#include "util/sstream.h"
#include "library/program/program_decl.h"

namespace obligo {
program_decl::program_decl(name const & n, expr const & type, expr const & body, universe_context const & uctx,
                           std::vector<obligation> const & obls, decl_info const & info, tactic const & tac,
                           reduce_fn const & reduce):
    m_name(n), m_type(type), m_body(body), m_uctx(uctx), m_obls(obls), m_remaining(count_remaining(obls)),
    m_info(info), m_tactic(tac), m_reduce(reduce) {}

program_decl program_decl::set_obligations(std::vector<obligation> const & obls) const {
    program_decl r(*this);
    r.m_obls      = obls;
    r.m_remaining = count_remaining(obls);
    return r;
}

program_decl program_decl::set_uctx(universe_context const & uctx) const {
    program_decl r(*this);
    r.m_uctx = uctx;
    return r;
}

program_decl program_decl::set_fixpoint(fixpoint_info const & fi, std::vector<name> const & deps,
                                        std::vector<std::string> const & notations) const {
    program_decl r(*this);
    r.m_fixpoint  = fi;
    r.m_deps      = deps;
    r.m_notations = notations;
    return r;
}

program_decl mk_program_decl(name const & n, expr const & type, expr const & body, universe_context const & uctx,
                             std::vector<obligation_info> const & infos, decl_info const & info,
                             tactic const & tac, reduce_fn const & reduce) {
    std::vector<obligation> obls;
    for (unsigned i = 0; i < infos.size(); i++) {
        obligation_info const & o = infos[i];
        for (unsigned j : o.m_deps) {
            if (j >= infos.size() || j == i)
                throw obligation_exception(sstream() << "invalid dependency " << j << " of obligation " << i + 1
                                           << " of '" << n << "'");
        }
        obls.emplace_back(mk_obligation_name(n, i), o.m_type, o.m_location, o.m_deps, o.m_status, o.m_tactic);
    }
    return program_decl(n, type, body, uctx, obls, info, tac, reduce);
}

static std::set<unsigned> solved(std::vector<obligation> const & obls, std::set<unsigned> const & idxs) {
    std::set<unsigned> r;
    for (unsigned i : idxs) {
        if (obls[i].is_solved())
            r.insert(i);
    }
    return r;
}

expr get_obligation_type(program_decl const & p, unsigned i) {
    std::vector<obligation> const & obls = p.get_obligations();
    return subst_deps(true, obls, solved(obls, dependencies(obls, i)), obls[i].get_type());
}

static std::set<unsigned> all_indices(std::vector<obligation> const & obls) {
    std::set<unsigned> r;
    for (unsigned i = 0; i < obls.size(); i++)
        r.insert(i);
    return r;
}

expr get_program_body(program_decl const & p) {
    std::vector<obligation> const & obls = p.get_obligations();
    return subst_deps(false, obls, solved(obls, all_indices(obls)), p.get_body());
}

std::vector<pair<name, expr>> get_obligation_terms(program_decl const & p) {
    std::vector<pair<name, expr>> r;
    for (obligation const & o : p.get_obligations()) {
        if (o.get_body())
            r.emplace_back(o.get_name(), o.get_body()->get_term(false));
    }
    return r;
}
}
