/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <memory>
#include "kernel/expr.h"

namespace obligo {
enum class declaration_kind { Definition, Theorem, Axiom };

/** \brief Environment declaration: a constant name, universe parameters, type and (optional) value.

    Theorems are opaque: the type checker never unfolds them. Members of a mutually recursive
    block are not unfolded either, they carry the index of their structural argument. */
class declaration {
    struct cell {
        name               m_name;
        level_param_names  m_params;
        expr               m_type;
        expr               m_value;
        declaration_kind   m_kind;
        bool               m_recursive{false};
        optional<unsigned> m_rec_arg;
        cell(name const & n, level_param_names const & ps, expr const & t, expr const & v, declaration_kind k):
            m_name(n), m_params(ps), m_type(t), m_value(v), m_kind(k) {}
    };
    std::shared_ptr<cell const> m_ptr;
    explicit declaration(std::shared_ptr<cell const> const & c):m_ptr(c) {}
    friend declaration mk_definition(name const & n, level_param_names const & ps, expr const & t, expr const & v);
    friend declaration mk_theorem(name const & n, level_param_names const & ps, expr const & t, expr const & v);
    friend declaration mk_axiom(name const & n, level_param_names const & ps, expr const & t);
    friend declaration mk_recursive_definition(name const & n, level_param_names const & ps, expr const & t,
                                               expr const & v, optional<unsigned> const & rec_arg);
public:
    name const & get_name() const { return m_ptr->m_name; }
    level_param_names const & get_univ_params() const { return m_ptr->m_params; }
    unsigned get_num_univ_params() const { return length(get_univ_params()); }
    expr const & get_type() const { return m_ptr->m_type; }
    expr const & get_value() const { obligo_assert(has_value()); return m_ptr->m_value; }
    declaration_kind kind() const { return m_ptr->m_kind; }

    bool has_value() const { return m_ptr->m_kind != declaration_kind::Axiom; }
    bool is_definition() const { return m_ptr->m_kind == declaration_kind::Definition; }
    bool is_theorem() const { return m_ptr->m_kind == declaration_kind::Theorem; }
    bool is_axiom() const { return m_ptr->m_kind == declaration_kind::Axiom; }
    bool is_opaque() const { return !is_definition(); }
    bool is_recursive() const { return m_ptr->m_recursive; }
    /** \brief Index of the structural argument of a recursive definition. */
    optional<unsigned> const & get_recursive_arg() const { return m_ptr->m_rec_arg; }

    friend bool is_eqp(declaration const & d1, declaration const & d2) { return d1.m_ptr == d2.m_ptr; }
};

inline optional<declaration> none_declaration() { return optional<declaration>(); }
inline optional<declaration> some_declaration(declaration const & d) { return optional<declaration>(d); }

declaration mk_definition(name const & n, level_param_names const & ps, expr const & t, expr const & v);
declaration mk_theorem(name const & n, level_param_names const & ps, expr const & t, expr const & v);
declaration mk_axiom(name const & n, level_param_names const & ps, expr const & t);
declaration mk_recursive_definition(name const & n, level_param_names const & ps, expr const & t,
                                    expr const & v, optional<unsigned> const & rec_arg);
}
