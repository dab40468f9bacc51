/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <algorithm>
#include <string>
#include <vector>
#include "util/sstream.h"
#include "kernel/abstract.h"
#include "kernel/instantiate.h"
#include "kernel/type_checker.h"
#include "library/sorry.h"
#include "library/trace.h"
#include "library/tactic/tactic.h"

namespace obligo {
static expr const & main_goal(proof_state const & s) {
    if (is_nil(s.goals()))
        throw tactic_exception("no goals to be proved");
    return head(s.goals());
}

tactic id_tactic() {
    return [](proof_state const & s) { return s; };
}

tactic fail_tactic(std::string const & msg) {
    return [=](proof_state const &) -> proof_state { throw tactic_exception(msg); };
}

static proof_state intro_core(proof_state const & s, name const & n) {
    expr const & g = main_goal(s);
    metavar_context mctx   = s.mctx();
    metavar_decl const & d = mctx.get_metavar_decl(g);
    type_checker tc(s.env());
    expr type = tc.whnf(mctx.instantiate_mvars(d.get_type()));
    if (!is_pi(type))
        throw tactic_exception(sstream() << "intro tactic failed, Pi expected, goal is\n  " << d.get_type());
    local_context ctx = d.get_context();
    expr h      = ctx.mk_local_decl(n ? n : binding_name(type), binding_domain(type));
    expr new_g  = mctx.mk_metavar_decl(ctx, binding_body_instantiate(type, h));
    mctx.assign(g, Fun(1, &h, new_g));
    return s.set_mctx_goals(mctx, cons(new_g, tail(s.goals())));
}

tactic intro_tactic(name const & n) {
    return [=](proof_state const & s) { return intro_core(s, n); };
}

tactic intros_tactic() {
    return [](proof_state const & s) {
        proof_state r = s;
        while (true) {
            expr const & g = main_goal(r);
            metavar_decl const & d = r.mctx().get_metavar_decl(g);
            type_checker tc(r.env());
            if (!is_pi(tc.whnf(r.mctx().instantiate_mvars(d.get_type()))))
                return r;
            r = intro_core(r, name());
        }
    };
}

/* Add the universe parameters of \c e which are not in the proof context. */
static proof_state add_univ_params(proof_state const & s, expr const & e) {
    name_set ps;
    collect_univ_params(e, ps);
    universe_context uctx = s.get_uctx();
    ps.for_each([&](name const & u) { uctx = uctx.add_param(u); });
    return s.set_uctx(uctx);
}

static proof_state exact_core(proof_state const & s, expr const & e0) {
    expr const & g = main_goal(s);
    metavar_context mctx   = s.mctx();
    metavar_decl const & d = mctx.get_metavar_decl(g);
    expr e = mctx.instantiate_mvars(e0);
    if (!d.get_context().well_formed(e))
        throw tactic_exception(sstream() << "exact tactic failed, term uses hypotheses not in the goal context\n  " << e);
    type_checker tc(s.env());
    expr e_type;
    try {
        e_type = tc.infer(e);
    } catch (exception & ex) {
        throw tactic_exception(sstream() << "exact tactic failed, ill-formed term\n  " << e << "\n" << ex.what());
    }
    expr goal_type = mctx.instantiate_mvars(d.get_type());
    if (!tc.is_def_eq(e_type, goal_type))
        throw tactic_exception(sstream() << "exact tactic failed, term has type\n  " << e_type
                               << "\nbut is expected to have type\n  " << goal_type);
    mctx.assign(g, e);
    return add_univ_params(s, e).set_mctx_goals(mctx, tail(s.goals()));
}

tactic exact_tactic(expr const & e) {
    return [=](proof_state const & s) { return exact_core(s, e); };
}

tactic exact_tactic(term_builder const & fn) {
    return [=](proof_state const & s) {
        metavar_decl const & d = s.mctx().get_metavar_decl(main_goal(s));
        return exact_core(s, fn(d.get_context()));
    };
}

/** \brief First order matching, the metavariables in \c m_new can be assigned. */
class apply_unifier {
    type_checker &          m_tc;
    metavar_context &       m_mctx;
    std::vector<name> const & m_new;

    bool is_new(expr const & e) const {
        if (!is_metavar_app(e))
            return false;
        name const & n = get_metavar_name(e);
        return std::find(m_new.begin(), m_new.end(), n) != m_new.end();
    }

    bool unify_core(expr const & p, expr const & t) {
        if (p == t)
            return true;
        if (is_new(p)) {
            if (m_mctx.is_assigned(p))
                return m_tc.is_def_eq(m_mctx.instantiate_mvars(p), t);
            if (has_loose_bvars(t))
                return false;
            try {
                m_mctx.assign(p, t);
            } catch (exception &) {
                return false;
            }
            return true;
        }
        if (p.kind() == t.kind()) {
            switch (p.kind()) {
            case expr_kind::App: {
                exprs p_args, t_args;
                expr const & p_fn = get_app_args(p, p_args);
                expr const & t_fn = get_app_args(t, t_args);
                if (p_args.size() == t_args.size() && unify_core(p_fn, t_fn)) {
                    bool ok = true;
                    for (unsigned i = 0; i < p_args.size() && ok; i++)
                        ok = unify(p_args[i], t_args[i]);
                    if (ok)
                        return true;
                }
                break;
            }
            case expr_kind::Lambda: case expr_kind::Pi:
                if (unify(binding_domain(p), binding_domain(t)) && unify(binding_body(p), binding_body(t)))
                    return true;
                break;
            default:
                break;
            }
        }
        return m_tc.is_def_eq(m_mctx.instantiate_mvars(p), t);
    }
public:
    apply_unifier(type_checker & tc, metavar_context & mctx, std::vector<name> const & new_mvars):
        m_tc(tc), m_mctx(mctx), m_new(new_mvars) {}

    bool unify(expr const & p, expr const & t) {
        expr new_p = m_mctx.instantiate_mvars(p);
        if (unify_core(new_p, t))
            return true;
        expr p_n = m_tc.whnf(new_p);
        expr t_n = m_tc.whnf(t);
        if (p_n != new_p || t_n != t)
            return unify_core(p_n, t_n);
        return false;
    }
};

static optional<proof_state> try_apply(proof_state const & s, expr const & e, expr const & e_type, unsigned nargs) {
    expr const & g = main_goal(s);
    metavar_context mctx   = s.mctx();
    metavar_decl const & d = mctx.get_metavar_decl(g);
    type_checker tc(s.env());
    expr type = e_type;
    std::vector<expr> new_gs;
    std::vector<name> new_ns;
    for (unsigned i = 0; i < nargs; i++) {
        type = tc.whnf(type);
        expr m = mctx.mk_metavar_decl(d.get_context(), mctx.instantiate_mvars(binding_domain(type)));
        new_gs.push_back(m);
        new_ns.push_back(get_metavar_name(m));
        type = binding_body_instantiate(type, m);
    }
    apply_unifier unifier(tc, mctx, new_ns);
    if (!unifier.unify(type, mctx.instantiate_mvars(d.get_type())))
        return optional<proof_state>();
    mctx.assign(g, mk_app(e, new_gs));
    std::vector<expr> gs;
    for (expr const & m : new_gs) {
        if (!mctx.is_assigned(m))
            gs.push_back(m);
    }
    return optional<proof_state>(add_univ_params(s, e).set_mctx_goals(mctx, append(to_list(gs), tail(s.goals()))));
}

static proof_state apply_core(proof_state const & s, expr const & e) {
    expr const & g = main_goal(s);
    metavar_decl const & d = s.mctx().get_metavar_decl(g);
    if (!d.get_context().well_formed(e))
        throw tactic_exception(sstream() << "apply tactic failed, term uses hypotheses not in the goal context\n  " << e);
    type_checker tc(s.env());
    expr e_type;
    try {
        e_type = tc.infer(e);
    } catch (exception & ex) {
        throw tactic_exception(sstream() << "apply tactic failed, ill-formed term\n  " << e << "\n" << ex.what());
    }
    unsigned nargs = 0;
    expr it = tc.whnf(e_type);
    while (is_pi(it)) {
        nargs++;
        it = tc.whnf(binding_body(it));
    }
    /* try the largest number of arguments first */
    for (unsigned i = nargs + 1; i > 0; i--) {
        if (optional<proof_state> r = try_apply(s, e, e_type, i - 1))
            return *r;
    }
    throw tactic_exception(sstream() << "apply tactic failed, failed to unify\n  " << e_type
                           << "\nwith\n  " << s.mctx().instantiate_mvars(d.get_type()));
}

tactic apply_tactic(expr const & e) {
    return [=](proof_state const & s) { return apply_core(s, e); };
}

tactic apply_tactic(term_builder const & fn) {
    return [=](proof_state const & s) {
        metavar_decl const & d = s.mctx().get_metavar_decl(main_goal(s));
        return apply_core(s, fn(d.get_context()));
    };
}

tactic assumption_tactic() {
    return [](proof_state const & s) {
        expr const & g = main_goal(s);
        metavar_decl const & d = s.mctx().get_metavar_decl(g);
        type_checker tc(s.env());
        expr type = s.mctx().instantiate_mvars(d.get_type());
        std::vector<expr> const & hs = d.get_context().get_locals();
        for (auto it = hs.rbegin(); it != hs.rend(); ++it) {
            if (tc.is_def_eq(mlocal_type(*it), type)) {
                metavar_context mctx = s.mctx();
                mctx.assign(g, *it);
                return s.set_mctx_goals(mctx, tail(s.goals()));
            }
        }
        throw tactic_exception("assumption tactic failed");
    };
}

tactic admit_tactic() {
    return [](proof_state const & s) {
        expr const & g = main_goal(s);
        if (!s.env().contains(get_sorry_ax_name()))
            throw tactic_exception(sstream() << "admit tactic failed, '" << get_sorry_ax_name()
                                   << "' is not available, the program library must be imported");
        metavar_context mctx   = s.mctx();
        metavar_decl const & d = mctx.get_metavar_decl(g);
        type_checker tc(s.env());
        expr type = mctx.instantiate_mvars(d.get_type());
        expr sort = tc.ensure_sort(tc.infer(type));
        mctx.assign(g, mk_sorry(type, sort_level(sort)));
        return s.set_mctx_goals(mctx, tail(s.goals()));
    };
}

/* Apply \c t to each goal in \c gs that is still open. */
static proof_state on_goals(proof_state const & s, list<expr> const & gs, tactic const & t) {
    proof_state r = s;
    std::vector<expr> result;
    for (expr const & g : gs) {
        if (r.mctx().is_assigned(g))
            continue;
        proof_state r1 = t(r.set_goals(list<expr>(g)));
        for (expr const & g1 : r1.goals())
            result.push_back(g1);
        r = r1;
    }
    return r.set_goals(to_list(result));
}

tactic then_tactic(tactic const & t1, tactic const & t2) {
    return [=](proof_state const & s) {
        expr const & g = main_goal(s);
        list<expr> rest = tail(s.goals());
        proof_state s1 = t1(s.set_goals(list<expr>(g)));
        proof_state s2 = on_goals(s1, s1.goals(), t2);
        return s2.set_goals(append(s2.goals(), rest));
    };
}

tactic orelse_tactic(tactic const & t1, tactic const & t2) {
    return [=](proof_state const & s) {
        try {
            return t1(s);
        } catch (tactic_exception & ex) {
            obligo_trace(name("tactic"), tout() << "orelse, first tactic failed: " << ex.what() << "\n";);
            return t2(s);
        }
    };
}

tactic try_tactic(tactic const & t) {
    return orelse_tactic(t, id_tactic());
}

tactic repeat_tactic(tactic const & t, unsigned max) {
    return [=](proof_state const & s) {
        proof_state r = s;
        for (unsigned i = 0; i < max && !is_nil(r.goals()); i++) {
            try {
                proof_state new_r = t(r);
                if (new_r.goals() == r.goals() && new_r.mctx().num_assigned() == r.mctx().num_assigned())
                    return new_r;
                r = new_r;
            } catch (tactic_exception &) {
                return r;
            }
        }
        return r;
    };
}

tactic first_tactic(std::vector<tactic> const & ts) {
    return [=](proof_state const & s) {
        for (tactic const & t : ts) {
            try {
                return t(s);
            } catch (tactic_exception &) {
                continue;
            }
        }
        throw tactic_exception("first tactic failed, no tactic succeeded");
    };
}

tactic all_goals_tactic(tactic const & t) {
    return [=](proof_state const & s) { return on_goals(s, s.goals(), t); };
}

tactic solve_tactic(tactic const & t) {
    return [=](proof_state const & s) {
        expr const & g = main_goal(s);
        list<expr> rest = tail(s.goals());
        proof_state r = t(s.set_goals(list<expr>(g)));
        if (!is_nil(r.goals()))
            throw tactic_exception(sstream() << "solve tactic failed, " << length(r.goals()) << " goal(s) remain");
        return r.set_goals(rest);
    };
}

tactic mk_default_obligation_tactic() {
    return then_tactic(intros_tactic(), try_tactic(assumption_tactic()));
}
}
