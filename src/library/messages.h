/*
Copyright (c) 2016 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Gabriel Ebner
*/
#pragma once
#include <iostream>
#include <string>
#include <vector>
#include "util/name.h"

namespace obligo {
enum message_severity { INFORMATION, WARNING, ERROR };

class message {
    name             m_origin;
    message_severity m_severity;
    std::string      m_caption, m_text;
public:
    message(name const & origin, message_severity severity, std::string const & caption, std::string const & text):
        m_origin(origin), m_severity(severity), m_caption(caption), m_text(text) {}
    message(name const & origin, message_severity severity, std::string const & text):
        message(origin, severity, std::string(), text) {}
    message(message_severity severity, std::string const & text):
        message(name(), severity, std::string(), text) {}

    /** \brief Declaration or command the message is about. */
    name const & get_origin() const { return m_origin; }
    message_severity get_severity() const { return m_severity; }
    std::string const & get_caption() const { return m_caption; }
    std::string const & get_text() const { return m_text; }

    bool is_error() const { return m_severity >= ERROR; }
};

std::ostream & operator<<(std::ostream &, message const &);

/** \brief Messages reported while a scope_message_log is active. */
class message_log {
    std::vector<message> m_messages;
public:
    void add(message const & msg) { m_messages.push_back(msg); }
    std::vector<message> const & get_messages() const { return m_messages; }
    bool empty() const { return m_messages.empty(); }
    unsigned size() const { return m_messages.size(); }
    bool has_errors() const;
    /** \brief Return true iff some message text contains \c s. */
    bool contains(std::string const & s) const;
    void clear() { m_messages.clear(); }
};

/** \brief Redirect the messages reported while this object is alive to the given log. */
class scope_message_log {
    message_log * m_old_log;
public:
    scope_message_log(message_log & log);
    ~scope_message_log();
};

/** \brief Report a message to the active message_log, or print it on the diagnostic channel of the
    global io_state when there is none. */
void report_message(message const & msg);

void initialize_messages();
void finalize_messages();
}
