/*
Copyright (c) 2016 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <vector>
#include "kernel/expr.h"

namespace obligo {
/** \brief Ordered sequence of hypotheses (locals). The type of a hypothesis may only refer to the
    hypotheses that precede it. */
class local_context {
    std::vector<expr> m_locals;
public:
    local_context() {}
    explicit local_context(std::vector<expr> const & locals):m_locals(locals) {}

    /** \brief Create a new hypothesis with a fresh internal name and the given user facing name. */
    expr mk_local_decl(name const & pp_name, expr const & type);
    /** \brief Add an existing local. */
    void push_local(expr const & l);

    std::vector<expr> const & get_locals() const { return m_locals; }
    unsigned size() const { return m_locals.size(); }
    bool empty() const { return m_locals.empty(); }

    optional<expr> find_local(name const & n) const;
    /** \brief Return the last hypothesis with the given user facing name. */
    optional<expr> find_local_by_user_name(name const & pp_name) const;
    /** \brief Similar to find_local_by_user_name, throws exception if there is no such hypothesis. */
    expr get_local(name const & pp_name) const;
    bool contains(name const & n) const { return static_cast<bool>(find_local(n)); }

    /** \brief Return true iff every local occurring in \c e is in this context. */
    bool well_formed(expr const & e) const;
    /** \brief Return true iff every hypothesis of this context is in \c ctx as well. */
    bool is_subset_of(local_context const & ctx) const;

    friend std::ostream & operator<<(std::ostream & out, local_context const & lctx);
};
}
