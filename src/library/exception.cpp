/*
Copyright (c) 2014 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#include <string>
#include "library/exception.h"

namespace obligo {
char const * nested_exception::what() const noexcept {
    m_what_buffer = m_msg + "\nnested exception message:\n" + m_exception->what();
    return m_what_buffer.c_str();
}

throwable * nested_exception::clone() const {
    return new nested_exception(m_ref, m_msg, *m_exception);
}
}
