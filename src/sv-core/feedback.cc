#include "sv-core/feedback.hh"

#include "sv-core/config.hh"

namespace sv {

    static std::ostream* s_feedback_stream = &std::cout;
    static bool s_debug_feedback = (SV_CONFIG_DEBUG_MODE != 0);

    static void help_fb_print(char const* prefix, std::string const& msg) {
        std::ostream& out = *s_feedback_stream;
        out << prefix;
        for (char const c: msg) {
            out << c;
            if (c == '\n') {
                out << "       ";
            }
        }
        out << std::endl;
    }

    void error(std::string msg)     { help_fb_print("ERROR: ", msg); }
    void warning(std::string msg)   { help_fb_print("WARN:  ", msg); }
    void info(std::string msg)      { help_fb_print("INFO:  ", msg); }
    void more(std::string msg)      { help_fb_print("       ", msg); }
    void debug(std::string msg) {
        if (s_debug_feedback) {
            help_fb_print("DEBUG: ", msg);
        }
    }

    void set_feedback_stream(std::ostream* out) {
        s_feedback_stream = (out != nullptr ? out : &std::cout);
    }
    std::ostream& feedback_stream() {
        return *s_feedback_stream;
    }

    void set_debug_feedback(bool enabled) {
        s_debug_feedback = enabled;
    }
    bool debug_feedback_enabled() {
        return s_debug_feedback;
    }

}   // namespace sv
