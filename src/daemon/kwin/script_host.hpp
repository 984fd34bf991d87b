#pragma once

#include "platform/scripting_backend.hpp"

#include <expected>
#include <string>

struct LoadedScript {
    int id = -1;
    std::string source;
    std::string path; // temp file handed to the host, removed by unload()
};

// Hands script source to the remote host through a temp file and drives
// the run/stop/unload cycle. unload() must be called exactly once for every
// script load() returned.
class ScriptHost {
public:
    explicit ScriptHost(ScriptingBackend& backend, std::string temp_dir = {});

    ScriptHost(const ScriptHost&) = delete;
    ScriptHost& operator=(const ScriptHost&) = delete;

    std::expected<LoadedScript, ScriptError> load(const std::string& source);

    // Returns once the host has started the script; long-lived scripts keep
    // running afterwards.
    std::expected<void, ScriptError> run(const LoadedScript& script);

    std::expected<void, ScriptError> stop(const LoadedScript& script);

    // Unregisters the script on the host and deletes its temp file. The file
    // is deleted even when the host call fails.
    std::expected<void, ScriptError> unload(LoadedScript& script);

private:
    std::expected<std::string, ScriptError> write_temp_file(const std::string& source);

    ScriptingBackend& backend_;
    std::string temp_dir_;
};
