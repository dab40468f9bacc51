/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <functional>
#include <memory>
#include <vector>
#include "util/list.h"
#include "util/name_map.h"
#include "kernel/declaration.h"

namespace obligo {
/** \brief Data attached to an environment by modules outside the kernel. */
class environment_extension {
public:
    virtual ~environment_extension() {}
};

/** \brief The global store of declarations. Objects of this class are immutable, every
    operation that changes the environment returns a new one. */
class environment {
    typedef name_map<declaration>                                declarations;
    typedef std::vector<std::shared_ptr<environment_extension const>> extensions;

    std::shared_ptr<declarations const> m_declarations;
    std::shared_ptr<extensions const>   m_extensions;
    /* Identifiers of this environment and of the environments it was derived from. */
    list<unsigned>                      m_trail;

    environment(environment const & env, std::shared_ptr<declarations const> const & ds);
    environment(environment const & env, std::shared_ptr<extensions const> const & exts);
    void check_name(name const & n) const;
public:
    environment();

    optional<declaration> find(name const & n) const;
    /** \brief Return the declaration named \c n, throws unknown_constant_exception if there is none. */
    declaration get(name const & n) const;
    bool contains(name const & n) const { return static_cast<bool>(find(n)); }

    /** \brief Type check \c d and add it, throws kernel_exception if it is not well formed. */
    environment add(declaration const & d) const;
    /** \brief Type check and add a block of mutually recursive definitions. */
    environment add_mutual(std::vector<declaration> const & ds) const;

    /** \brief Register an extension with the given initial value, returns its identifier. */
    static unsigned register_extension(std::shared_ptr<environment_extension const> const & initial);
    environment_extension const & get_extension(unsigned extid) const;
    environment update(unsigned extid, std::shared_ptr<environment_extension const> const & ext) const;

    /** \brief Return true iff this environment was obtained from \c env by a sequence of updates. */
    bool is_descendant(environment const & env) const;

    unsigned get_num_declarations() const { return m_declarations->size(); }
    void for_each_declaration(std::function<void(declaration const &)> const & f) const;
};

void initialize_environment();
void finalize_environment();
}
