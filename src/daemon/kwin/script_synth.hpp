#pragma once

#include <map>
#include <string>

// Builds the JavaScript programs injected into KWin's scripting runtime.
// Every interpolated value is emitted as an escaped string literal.

// Address of the object the scripts call back into with callDBus().
struct CallbackAddress {
    std::string service;
    std::string path;
    std::string interface;
};

namespace script_synth {

// Replaces each {{name}} in `tmpl` with a JavaScript string literal holding
// params[name]. Placeholders without a parameter are left as-is.
std::string render(const std::string& tmpl, const std::map<std::string, std::string>& params);

// Double-quoted JavaScript string literal for `value`. Non-ASCII characters
// are emitted as \u escapes.
std::string js_string_literal(const std::string& value);

// Long-lived script: reports every existing window, then forwards
// windowAdded/windowRemoved notifications.
std::string observer_script(const CallbackAddress& addr);

// One-shot script: activates the window whose internalId equals `identity`.
std::string activation_script(const CallbackAddress& addr, const std::string& identity);

} // namespace script_synth
