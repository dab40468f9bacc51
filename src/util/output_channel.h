/*
Copyright (c) 2013 Microsoft Corporation. All rights reserved.
Released under Apache 2.0 license as described in the file LICENSE.

Author: Leonardo de Moura
*/
#pragma once
#include <iostream>
#include <sstream>
#include <string>

namespace obligo {
/** \brief Wrapper for an output stream. */
class output_channel {
public:
    virtual ~output_channel() {}
    virtual std::ostream & get_stream() = 0;
};

class stdout_channel : public output_channel {
public:
    virtual std::ostream & get_stream() override { return std::cout; }
};

class stderr_channel : public output_channel {
public:
    virtual std::ostream & get_stream() override { return std::cerr; }
};

class string_output_channel : public output_channel {
    std::ostringstream m_out;
public:
    virtual std::ostream & get_stream() override { return m_out; }
    std::string str() const { return m_out.str(); }
};

class null_output_channel : public output_channel {
    std::ostringstream m_out;
public:
    virtual std::ostream & get_stream() override { m_out.str(std::string()); return m_out; }
};
}
