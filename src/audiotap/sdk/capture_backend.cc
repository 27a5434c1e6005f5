#include <audiotap/sdk/capture_backend.hh>
#include <audiotap/error.hh>

#include <algorithm>
#include <cctype>

namespace audiotap {
    const char* to_string(capture_source src) {
        switch (src) {
            case capture_source::input: return "input";
            case capture_source::loopback: return "loopback";
        }
        return "unknown";
    }

    capture_source parse_capture_source(const std::string& text) {
        std::string s(text);
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (s == "input" || s == "mic" || s == "microphone") {
            return capture_source::input;
        }
        if (s == "loopback" || s == "output" || s == "system") {
            return capture_source::loopback;
        }
        throw config_error("Unknown capture source: " + text);
    }
}
