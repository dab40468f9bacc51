/*
Copyright (c) 2016 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Gabriel Ebner
*/
#include <string>
#include "library/io_state.h"
#include "library/messages.h"

namespace obligo {
static message_log * g_log = nullptr;

std::ostream & operator<<(std::ostream & out, message const & msg) {
    if (msg.get_severity() != INFORMATION) {
        if (msg.get_origin())
            out << msg.get_origin() << ": ";
        switch (msg.get_severity()) {
            case INFORMATION: break;
            case WARNING: out << "warning: "; break;
            case ERROR:   out << "error: ";   break;
        }
        if (!msg.get_caption().empty())
            out << msg.get_caption() << ":\n";
    }
    auto const & text = msg.get_text();
    out << text;
    if (!text.size() || text[text.size() - 1] != '\n')
        out << "\n";
    return out;
}

bool message_log::has_errors() const {
    for (message const & m : m_messages) {
        if (m.is_error())
            return true;
    }
    return false;
}

bool message_log::contains(std::string const & s) const {
    for (message const & m : m_messages) {
        if (m.get_text().find(s) != std::string::npos)
            return true;
    }
    return false;
}

scope_message_log::scope_message_log(message_log & log) {
    m_old_log = g_log;
    g_log     = &log;
}

scope_message_log::~scope_message_log() {
    g_log = m_old_log;
}

void report_message(message const & msg) {
    if (g_log)
        g_log->add(msg);
    else
        get_global_ios().get_diagnostic_stream() << msg;
}

void initialize_messages() {}
void finalize_messages() {}
}
