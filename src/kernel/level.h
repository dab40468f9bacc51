/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <iostream>
#include <memory>
#include <vector>
#include "util/list.h"
#include "util/name.h"
#include "util/name_map.h"
#include "util/name_set.h"
#include "util/optional.h"

namespace obligo {
/**
   \brief Universe level kinds.

   - Zero         : Prop
   - Succ(l)      : successor
   - Max(l1, l2)  : maximum
   - IMax(l1, l2) : zero if l2 is zero, Max(l1, l2) otherwise
   - Param        : universe parameter
*/
enum class level_kind { Zero, Succ, Max, IMax, Param };

class level {
    struct cell;
    std::shared_ptr<cell const> m_ptr;
    explicit level(std::shared_ptr<cell const> const & c):m_ptr(c) {}
    friend level mk_succ(level const & l);
    friend level mk_max_core(level const & l1, level const & l2);
    friend level mk_imax_core(level const & l1, level const & l2);
    friend level mk_univ_param(name const & n);
public:
    /** \brief Universe zero */
    level();
    level_kind kind() const;
    unsigned hash() const;
    friend bool operator==(level const & l1, level const & l2);
    friend bool operator!=(level const & l1, level const & l2) { return !(l1 == l2); }
    friend bool is_eqp(level const & l1, level const & l2) { return l1.m_ptr == l2.m_ptr; }
    friend level const & succ_of(level const & l);
    friend level const & max_lhs(level const & l);
    friend level const & max_rhs(level const & l);
    friend level const & imax_lhs(level const & l);
    friend level const & imax_rhs(level const & l);
    friend name const & param_id(level const & l);
};

typedef list<level> levels;
typedef list<name>  level_param_names;

level const & mk_level_zero();
level const & mk_level_one();
level mk_succ(level const & l);
level mk_max_core(level const & l1, level const & l2);
level mk_imax_core(level const & l1, level const & l2);
/** \brief Create max(l1, l2), applying basic simplifications. */
level mk_max(level const & l1, level const & l2);
/** \brief Create imax(l1, l2), applying basic simplifications. */
level mk_imax(level const & l1, level const & l2);
level mk_univ_param(name const & n);

inline bool is_zero(level const & l) { return l.kind() == level_kind::Zero; }
inline bool is_succ(level const & l) { return l.kind() == level_kind::Succ; }
inline bool is_max(level const & l) { return l.kind() == level_kind::Max; }
inline bool is_imax(level const & l) { return l.kind() == level_kind::IMax; }
inline bool is_param(level const & l) { return l.kind() == level_kind::Param; }

/** \brief Return true iff \c l is never zero. */
bool is_not_zero(level const & l);

/** \brief Normalize the level (nested max are flattened and sorted, imax are simplified). */
level normalize(level const & l);
/** \brief Return true iff \c l1 and \c l2 denote the same level for every assignment to the parameters. */
bool is_equivalent(level const & l1, level const & l2);

/** \brief Collect the universe parameters occurring in \c l. */
void collect_univ_params(level const & l, name_set & s);
bool has_param(level const & l);

/** \brief Replace the universe parameters \c ps with \c ls. */
level instantiate(level const & l, level_param_names const & ps, levels const & ls);
level instantiate(level const & l, name_map<level> const & s);

std::ostream & operator<<(std::ostream & out, level const & l);
std::ostream & operator<<(std::ostream & out, levels const & ls);

inline optional<level> none_level() { return optional<level>(); }

void initialize_level();
void finalize_level();
}
