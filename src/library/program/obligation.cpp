/*
Copyright (c) 2015 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <vector>
#include "util/sstream.h"
#include "kernel/abstract.h"
#include "library/program/obligation.h"

namespace obligo {
std::ostream & operator<<(std::ostream & out, obligation_location const & l) {
    out << l.m_origin;
    if (l.m_line) {
        out << " at " << *l.m_line;
        if (l.m_column)
            out << ":" << *l.m_column;
    }
    return out;
}

obligation obligation::set_body(obligation_body const & b) const {
    if (m_body)
        throw obligation_exception(sstream() << "obligation '" << m_name << "' has already been solved");
    obligation r(*this);
    r.m_body = b;
    return r;
}

obligation obligation::set_status(obligation_status const & st) const {
    obligation r(*this);
    r.m_status = st;
    return r;
}

obligation obligation::set_type(expr const & type) const {
    obligation r(*this);
    r.m_type = type;
    return r;
}

name mk_obligation_name(name const & prog, unsigned idx) {
    return prog.append_after("_obligation").append_after(idx + 1);
}

expr mk_obligation_ref(name const & n, expr const & type) {
    return mk_local(n, n, type);
}

std::set<unsigned> dependencies(std::vector<obligation> const & obls, unsigned i) {
    std::set<unsigned> r;
    std::vector<unsigned> todo(obls[i].get_deps().begin(), obls[i].get_deps().end());
    while (!todo.empty()) {
        unsigned j = todo.back();
        todo.pop_back();
        if (j >= obls.size() || !r.insert(j).second)
            continue;
        for (unsigned k : obls[j].get_deps())
            todo.push_back(k);
    }
    return r;
}

std::set<unsigned> dependents(std::vector<obligation> const & obls, unsigned i) {
    std::set<unsigned> r;
    for (unsigned j = 0; j < obls.size(); j++) {
        if (j != i && obls[j].get_deps().count(i))
            r.insert(j);
    }
    return r;
}

std::vector<obligation_subst_entry> obligation_substitution(bool expand, std::vector<obligation> const & obls,
                                                            std::set<unsigned> const & idxs) {
    std::vector<obligation_subst_entry> r;
    for (unsigned i : idxs) {
        obligation const & o = obls[i];
        if (!o.get_body())
            throw obligation_exception(sstream() << "obligation '" << o.get_name() << "' is not solved");
        r.emplace_back(o.get_name(), o.get_type(), o.get_body()->get_term(expand));
    }
    return r;
}

expr subst_deps(bool expand, std::vector<obligation> const & obls, std::set<unsigned> const & deps, expr const & e) {
    std::vector<obligation_subst_entry> s = obligation_substitution(expand, obls, deps);
    exprs refs, terms;
    for (obligation_subst_entry const & entry : s) {
        refs.push_back(mk_obligation_ref(entry.m_name, entry.m_type));
        terms.push_back(entry.m_term);
    }
    return replace_locals(e, refs, terms);
}

bool is_attemptable(std::vector<obligation> const & obls, unsigned i) {
    for (unsigned j : obls[i].get_deps()) {
        if (!obls[j].is_solved())
            return false;
    }
    return true;
}

std::vector<unsigned> deps_remaining(std::vector<obligation> const & obls, std::set<unsigned> const & deps) {
    std::vector<unsigned> r;
    for (unsigned j : deps) {
        if (!obls[j].is_solved())
            r.push_back(j);
    }
    return r;
}

unsigned count_remaining(std::vector<obligation> const & obls) {
    unsigned r = 0;
    for (obligation const & o : obls) {
        if (!o.is_solved())
            r++;
    }
    return r;
}
}
