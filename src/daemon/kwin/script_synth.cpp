#include "kwin/script_synth.hpp"

#include <nlohmann/json.hpp>

namespace script_synth {

namespace {

constexpr const char* LOG_PRELUDE = R"JS(const SERVICE = {{service}};
const PATH = {{path}};
const IFACE = {{interface}};

function log(msg) {
    console.log("plasma-deck", msg);
    callDBus(SERVICE, PATH, IFACE, "Log", msg.toString());
}
)JS";

constexpr const char* OBSERVER_TEMPLATE = R"JS(
function describe(window) {
    return "caption='" + window.caption + "', resourceClass=" + window.resourceClass;
}

function add(window) {
    try {
        callDBus(SERVICE, PATH, IFACE, "WindowAdded",
                 window.internalId.toString(), window.caption, window.resourceClass);
    } catch (e) {
        log("ADD [error] " + describe(window) + ", error=" + e.toString());
    }
}

function remove(window) {
    try {
        callDBus(SERVICE, PATH, IFACE, "WindowRemoved", window.internalId.toString());
    } catch (e) {
        log("REMOVE [error] " + describe(window) + ", error=" + e.toString());
    }
}

log("INIT");

for (const window of workspace.windowList()) {
    add(window);
}

workspace.windowAdded.connect(add);
workspace.windowRemoved.connect(remove);
)JS";

constexpr const char* ACTIVATION_TEMPLATE = R"JS(
const TARGET = {{target}};

for (const win of workspace.windowList()) {
    const id = win.internalId.toString();
    log(id + " == " + TARGET);
    if (id === TARGET) {
        workspace.activeWindow = win;
    }
}
)JS";

std::map<std::string, std::string> address_params(const CallbackAddress& addr) {
    return {
        {"service", addr.service},
        {"path", addr.path},
        {"interface", addr.interface},
    };
}

} // namespace

std::string js_string_literal(const std::string& value) {
    // JSON string syntax is a subset of JS string syntax; ensure_ascii also
    // escapes U+2028/U+2029, which older engines reject inside literals.
    return nlohmann::json(value).dump(-1, ' ', true, nlohmann::json::error_handler_t::replace);
}

std::string render(const std::string& tmpl, const std::map<std::string, std::string>& params) {
    std::string out;
    out.reserve(tmpl.size());

    size_t pos = 0;
    while (pos < tmpl.size()) {
        auto open = tmpl.find("{{", pos);
        if (open == std::string::npos) break;
        auto close = tmpl.find("}}", open + 2);
        if (close == std::string::npos) break;

        out.append(tmpl, pos, open - pos);
        auto name = tmpl.substr(open + 2, close - open - 2);
        auto it = params.find(name);
        if (it != params.end()) {
            out += js_string_literal(it->second);
        } else {
            out.append(tmpl, open, close + 2 - open);
        }
        pos = close + 2;
    }
    out.append(tmpl, pos, std::string::npos);
    return out;
}

std::string observer_script(const CallbackAddress& addr) {
    return render(std::string(LOG_PRELUDE) + OBSERVER_TEMPLATE, address_params(addr));
}

std::string activation_script(const CallbackAddress& addr, const std::string& identity) {
    auto params = address_params(addr);
    params["target"] = identity;
    return render(std::string(LOG_PRELUDE) + ACTIVATION_TEMPLATE, params);
}

} // namespace script_synth
