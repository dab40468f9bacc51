/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <algorithm>
#include <string>
#include <vector>
#include "util/debug.h"
#include "kernel/expr.h"

namespace obligo {
struct expr::cell {
    expr_kind m_kind;
    unsigned  m_hash{0};
    unsigned  m_loose_bv_range{0};
    bool      m_has_local{false};
    bool      m_has_metavar{false};
    bool      m_has_univ_param{false};
    unsigned  m_idx{0};
    level     m_level;
    levels    m_levels;
    name      m_name;
    name      m_pp_name;
    expr      m_e1;
    expr      m_e2;
    explicit cell(expr_kind k):m_kind(k) {}
};

static expr * g_Prop = nullptr;
static expr * g_Type = nullptr;

static unsigned hash(unsigned h1, unsigned h2) {
    return h1 * 31 + h2 + 0x9e3779b9u;
}

/* The null cell represents Prop. */
expr::expr() {}

expr_kind expr::kind() const { return m_ptr ? m_ptr->m_kind : expr_kind::Sort; }
unsigned expr::hash() const { return m_ptr ? m_ptr->m_hash : 5; }
unsigned expr::get_loose_bv_range() const { return m_ptr ? m_ptr->m_loose_bv_range : 0; }
bool expr::has_local() const { return m_ptr && m_ptr->m_has_local; }
bool expr::has_metavar() const { return m_ptr && m_ptr->m_has_metavar; }
bool expr::has_univ_param() const { return m_ptr && m_ptr->m_has_univ_param; }

static level * g_zero_level = nullptr;

unsigned var_idx(expr const & e) { obligo_assert(is_var(e)); return e.m_ptr->m_idx; }
level const & sort_level(expr const & e) {
    obligo_assert(is_sort(e));
    return e.m_ptr ? e.m_ptr->m_level : *g_zero_level;
}
name const & const_name(expr const & e) { obligo_assert(is_constant(e)); return e.m_ptr->m_name; }
levels const & const_levels(expr const & e) { obligo_assert(is_constant(e)); return e.m_ptr->m_levels; }
name const & mlocal_name(expr const & e) { obligo_assert(is_mlocal(e)); return e.m_ptr->m_name; }
expr const & mlocal_type(expr const & e) { obligo_assert(is_mlocal(e)); return e.m_ptr->m_e1; }
name const & local_pp_name(expr const & e) { obligo_assert(is_local(e)); return e.m_ptr->m_pp_name; }
expr const & app_fn(expr const & e) { obligo_assert(is_app(e)); return e.m_ptr->m_e1; }
expr const & app_arg(expr const & e) { obligo_assert(is_app(e)); return e.m_ptr->m_e2; }
name const & binding_name(expr const & e) { obligo_assert(is_binding(e)); return e.m_ptr->m_name; }
expr const & binding_domain(expr const & e) { obligo_assert(is_binding(e)); return e.m_ptr->m_e1; }
expr const & binding_body(expr const & e) { obligo_assert(is_binding(e)); return e.m_ptr->m_e2; }

expr mk_var(unsigned idx) {
    auto c = std::make_shared<expr::cell>(expr_kind::Var);
    c->m_idx            = idx;
    c->m_hash           = hash(idx, 3);
    c->m_loose_bv_range = idx + 1;
    return expr(c);
}

expr mk_sort(level const & l) {
    if (is_zero(l))
        return expr();
    auto c = std::make_shared<expr::cell>(expr_kind::Sort);
    c->m_level          = l;
    c->m_hash           = hash(l.hash(), 5);
    c->m_has_univ_param = has_param(l);
    return expr(c);
}

expr mk_constant(name const & n, levels const & ls) {
    auto c = std::make_shared<expr::cell>(expr_kind::Constant);
    c->m_name   = n;
    c->m_levels = ls;
    unsigned h  = n.hash();
    for (level const & l : ls) {
        h = hash(h, l.hash());
        if (has_param(l))
            c->m_has_univ_param = true;
    }
    c->m_hash = h;
    return expr(c);
}

expr mk_local(name const & n, name const & pp_n, expr const & t) {
    auto c = std::make_shared<expr::cell>(expr_kind::Local);
    c->m_name           = n;
    c->m_pp_name        = pp_n;
    c->m_e1             = t;
    c->m_hash           = hash(n.hash(), 23);
    c->m_has_local      = true;
    c->m_has_metavar    = t.has_metavar();
    c->m_has_univ_param = t.has_univ_param();
    return expr(c);
}

expr mk_metavar(name const & n, expr const & t) {
    auto c = std::make_shared<expr::cell>(expr_kind::Meta);
    c->m_name           = n;
    c->m_e1             = t;
    c->m_hash           = hash(n.hash(), 29);
    c->m_has_local      = t.has_local();
    c->m_has_metavar    = true;
    c->m_has_univ_param = t.has_univ_param();
    return expr(c);
}

expr mk_app(expr const & f, expr const & a) {
    auto c = std::make_shared<expr::cell>(expr_kind::App);
    c->m_e1             = f;
    c->m_e2             = a;
    c->m_hash           = hash(f.hash(), a.hash());
    c->m_loose_bv_range = std::max(f.get_loose_bv_range(), a.get_loose_bv_range());
    c->m_has_local      = f.has_local() || a.has_local();
    c->m_has_metavar    = f.has_metavar() || a.has_metavar();
    c->m_has_univ_param = f.has_univ_param() || a.has_univ_param();
    return expr(c);
}

expr mk_app(expr const & f, unsigned num_args, expr const * args) {
    expr r = f;
    for (unsigned i = 0; i < num_args; i++)
        r = mk_app(r, args[i]);
    return r;
}

expr mk_binding(expr_kind k, name const & n, expr const & d, expr const & b) {
    obligo_assert(k == expr_kind::Lambda || k == expr_kind::Pi);
    auto c = std::make_shared<expr::cell>(k);
    c->m_name           = n;
    c->m_e1             = d;
    c->m_e2             = b;
    c->m_hash           = hash(hash(d.hash(), b.hash()), k == expr_kind::Lambda ? 31 : 37);
    unsigned body_range = b.get_loose_bv_range();
    c->m_loose_bv_range = std::max(d.get_loose_bv_range(), body_range > 0 ? body_range - 1 : 0);
    c->m_has_local      = d.has_local() || b.has_local();
    c->m_has_metavar    = d.has_metavar() || b.has_metavar();
    c->m_has_univ_param = d.has_univ_param() || b.has_univ_param();
    return expr(c);
}

expr mk_arrow(expr const & a, expr const & b) {
    obligo_assert(closed(b));
    return mk_pi(name("a"), a, b);
}

expr const & mk_Prop() { return *g_Prop; }
expr const & mk_Type() { return *g_Type; }

bool operator==(expr const & a, expr const & b) {
    if (is_eqp(a, b))
        return true;
    if (a.kind() != b.kind() || a.hash() != b.hash())
        return false;
    switch (a.kind()) {
    case expr_kind::Var:
        return var_idx(a) == var_idx(b);
    case expr_kind::Sort:
        return sort_level(a) == sort_level(b);
    case expr_kind::Constant:
        return const_name(a) == const_name(b) && const_levels(a) == const_levels(b);
    case expr_kind::Local: case expr_kind::Meta:
        return mlocal_name(a) == mlocal_name(b);
    case expr_kind::App:
        return app_fn(a) == app_fn(b) && app_arg(a) == app_arg(b);
    case expr_kind::Lambda: case expr_kind::Pi:
        return binding_domain(a) == binding_domain(b) && binding_body(a) == binding_body(b);
    }
    obligo_unreachable();
}

bool has_loose_bvar(expr const & e, unsigned i) {
    if (i >= e.get_loose_bv_range())
        return false;
    switch (e.kind()) {
    case expr_kind::Var:
        return var_idx(e) == i;
    case expr_kind::Sort: case expr_kind::Constant: case expr_kind::Local: case expr_kind::Meta:
        return false;
    case expr_kind::App:
        return has_loose_bvar(app_fn(e), i) || has_loose_bvar(app_arg(e), i);
    case expr_kind::Lambda: case expr_kind::Pi:
        return has_loose_bvar(binding_domain(e), i) || has_loose_bvar(binding_body(e), i + 1);
    }
    obligo_unreachable();
}

expr const & get_app_fn(expr const & e) {
    expr const * it = &e;
    while (is_app(*it))
        it = &app_fn(*it);
    return *it;
}

expr const & get_app_args(expr const & e, exprs & args) {
    unsigned sz = args.size();
    expr const * it = &e;
    while (is_app(*it)) {
        args.push_back(app_arg(*it));
        it = &app_fn(*it);
    }
    std::reverse(args.begin() + sz, args.end());
    return *it;
}

unsigned get_app_num_args(expr const & e) {
    unsigned n = 0;
    expr const * it = &e;
    while (is_app(*it)) {
        it = &app_fn(*it);
        n++;
    }
    return n;
}

expr update_app(expr const & e, expr const & new_fn, expr const & new_arg) {
    if (is_eqp(app_fn(e), new_fn) && is_eqp(app_arg(e), new_arg))
        return e;
    return mk_app(new_fn, new_arg);
}

expr update_binding(expr const & e, expr const & new_domain, expr const & new_body) {
    if (is_eqp(binding_domain(e), new_domain) && is_eqp(binding_body(e), new_body))
        return e;
    return mk_binding(e.kind(), binding_name(e), new_domain, new_body);
}

expr update_mlocal(expr const & e, expr const & new_type) {
    if (is_eqp(mlocal_type(e), new_type))
        return e;
    if (is_local(e))
        return mk_local(mlocal_name(e), local_pp_name(e), new_type);
    return mk_metavar(mlocal_name(e), new_type);
}

expr update_sort(expr const & e, level const & new_level) {
    if (is_eqp(sort_level(e), new_level))
        return e;
    return mk_sort(new_level);
}

expr update_constant(expr const & e, levels const & new_levels) {
    if (is_eqp(const_levels(e), new_levels))
        return e;
    return mk_constant(const_name(e), new_levels);
}

/* Printer */
class print_expr_fn {
    std::ostream &    m_out;
    std::vector<name> m_names;

    bool is_atomic(expr const & e) {
        switch (e.kind()) {
        case expr_kind::Var: case expr_kind::Constant: case expr_kind::Local: case expr_kind::Meta:
            return true;
        case expr_kind::Sort:
            return is_zero(sort_level(e)) || sort_level(e) == mk_level_one();
        case expr_kind::App: case expr_kind::Lambda: case expr_kind::Pi:
            return false;
        }
        obligo_unreachable();
    }

    void print_child(expr const & e) {
        if (is_atomic(e)) {
            print(e);
        } else {
            m_out << "(";
            print(e);
            m_out << ")";
        }
    }

    void print_sort(expr const & e) {
        level const & l = sort_level(e);
        if (is_zero(l)) {
            m_out << "Prop";
        } else if (l == mk_level_one()) {
            m_out << "Type";
        } else if (is_succ(l)) {
            m_out << "Type.{" << succ_of(l) << "}";
        } else {
            m_out << "Sort.{" << l << "}";
        }
    }

    void print_app(expr const & e) {
        exprs args;
        expr const & f = get_app_args(e, args);
        print_child(f);
        for (expr const & a : args) {
            m_out << " ";
            print_child(a);
        }
    }

    name fresh_binder_name(name const & n) {
        name base = n.is_anonymous() ? name("x") : n;
        name r    = base;
        unsigned i = 1;
        while (std::find(m_names.begin(), m_names.end(), r) != m_names.end()) {
            r = base.append_after(i);
            i++;
        }
        return r;
    }

    void print_binding(expr const & e) {
        if (is_pi(e) && !has_loose_bvar(binding_body(e), 0)) {
            if (is_arrow_lhs_atomic(binding_domain(e)))
                print(binding_domain(e));
            else
                print_child(binding_domain(e));
            m_out << " → ";
            m_names.push_back(name("_"));
            print(binding_body(e));
            m_names.pop_back();
            return;
        }
        m_out << (is_pi(e) ? "Π " : "λ ");
        name n = fresh_binder_name(binding_name(e));
        m_out << "(" << n << " : ";
        print(binding_domain(e));
        m_out << "), ";
        m_names.push_back(n);
        print(binding_body(e));
        m_names.pop_back();
    }

    bool is_arrow_lhs_atomic(expr const & e) {
        return is_atomic(e) || is_app(e);
    }

    void print_const(expr const & e) {
        m_out << const_name(e);
        if (!is_nil(const_levels(e)))
            m_out << ".{" << const_levels(e) << "}";
    }

public:
    print_expr_fn(std::ostream & out):m_out(out) {}

    void print(expr const & e) {
        switch (e.kind()) {
        case expr_kind::Var: {
            unsigned idx = var_idx(e);
            if (idx < m_names.size())
                m_out << m_names[m_names.size() - idx - 1];
            else
                m_out << "#" << idx;
            break;
        }
        case expr_kind::Sort:     print_sort(e); break;
        case expr_kind::Constant: print_const(e); break;
        case expr_kind::Local:    m_out << local_pp_name(e); break;
        case expr_kind::Meta:     m_out << "?" << mlocal_name(e); break;
        case expr_kind::App:      print_app(e); break;
        case expr_kind::Lambda: case expr_kind::Pi:
            print_binding(e);
            break;
        }
    }
};

std::ostream & operator<<(std::ostream & out, expr const & e) {
    print_expr_fn(out).print(e);
    return out;
}

void initialize_expr() {
    g_zero_level = new level();
    g_Prop       = new expr(mk_sort(mk_level_zero()));
    g_Type       = new expr(mk_sort(mk_level_one()));
}

void finalize_expr() {
    delete g_Type;
    delete g_Prop;
    delete g_zero_level;
}
}
