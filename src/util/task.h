/*
Copyright (c) 2017 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Gabriel Ebner
*/
#pragma once
#include <exception>
#include <functional>
#include <memory>
#include <utility>
#include "util/debug.h"
#include "util/exception.h"
#include "util/optional.h"

namespace obligo {
/** \brief Raised when a task is forced while it is already being forced. */
class task_cycle_exception : public exception {
public:
    task_cycle_exception():exception("cyclic dependency: task forced while it is being computed") {}
    virtual throwable * clone() const override { return new task_cycle_exception(); }
    virtual void rethrow() const override { throw *this; }
};

/** \brief A value that is either available or computed on demand.
    The computation runs at most once, its result (or the exception it raised) is memoized
    and shared by all copies of the task. */
template<typename T>
class task {
    enum class state { Pending, Running, Done, Failed };
    struct cell {
        state                  m_state;
        std::function<T()>     m_fn;
        optional<T>            m_value;
        std::exception_ptr     m_ex;
    };
    std::shared_ptr<cell> m_ptr;
    explicit task(std::shared_ptr<cell> const & c):m_ptr(c) {}
public:
    task() {}

    /** \brief Return true iff the task was already forced (successfully or not). */
    bool is_finished() const { return m_ptr && (m_ptr->m_state == state::Done || m_ptr->m_state == state::Failed); }
    explicit operator bool() const { return static_cast<bool>(m_ptr); }

    T const & get() const {
        obligo_assert(m_ptr);
        cell & c = *m_ptr;
        switch (c.m_state) {
        case state::Done:
            return *c.m_value;
        case state::Failed:
            std::rethrow_exception(c.m_ex);
        case state::Running:
            throw task_cycle_exception();
        case state::Pending:
            break;
        }
        c.m_state = state::Running;
        try {
            c.m_value = c.m_fn();
            c.m_state = state::Done;
        } catch (...) {
            c.m_ex    = std::current_exception();
            c.m_state = state::Failed;
            c.m_fn    = nullptr;
            throw;
        }
        c.m_fn = nullptr;
        return *c.m_value;
    }

    template<typename U> friend task<U> mk_pure_task(U const & v);
    template<typename U> friend task<U> mk_deferred_task(std::function<U()> const & fn);
};

/** \brief Create a task whose value is already available. */
template<typename T> task<T> mk_pure_task(T const & v) {
    auto c = std::make_shared<typename task<T>::cell>();
    c->m_state = task<T>::state::Done;
    c->m_value = v;
    return task<T>(c);
}

/** \brief Create a task that runs \c fn the first time it is forced. */
template<typename T> task<T> mk_deferred_task(std::function<T()> const & fn) {
    auto c = std::make_shared<typename task<T>::cell>();
    c->m_state = task<T>::state::Pending;
    c->m_fn    = fn;
    return task<T>(c);
}

template<typename T> T const & get(task<T> const & t) { return t.get(); }
}
