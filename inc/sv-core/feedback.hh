#pragma once

#include <iostream>
#include <string>
#include <exception>

namespace sv {

    ///
    // Feedback: prefixed diagnostic lines written to a single feedback stream.
    // Fatal conditions are reported with `error` just before the matching exception is thrown.
    //

    void error(std::string msg);
    void warning(std::string msg);
    void info(std::string msg);
    void more(std::string msg);
    void debug(std::string msg);

    void set_feedback_stream(std::ostream* out);
    std::ostream& feedback_stream();

    void set_debug_feedback(bool enabled);
    bool debug_feedback_enabled();

    ///
    // SvError: base of every exception thrown by this library.
    //

    class SvError: public std::exception {
    private:
        std::string m_msg;
    public:
        explicit SvError(std::string msg)
        :   m_msg(std::move(msg))
        {}
    public:
        char const* what() const noexcept override { return m_msg.c_str(); }
        std::string const& message() const { return m_msg; }
    };

}   // namespace sv
