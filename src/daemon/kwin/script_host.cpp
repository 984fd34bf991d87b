#include "kwin/script_host.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <print>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

std::string to_string(const ScriptError& err) {
    switch (err.kind) {
        case ScriptErrorKind::TransportUnavailable:
            return "transport unavailable: " + err.message;
        case ScriptErrorKind::HostRejected:
            return "host rejected: " + err.message;
        case ScriptErrorKind::ResourceExhausted:
            return "resource exhausted: " + err.message;
    }
    return err.message;
}

ScriptHost::ScriptHost(ScriptingBackend& backend, std::string temp_dir)
    : backend_(backend), temp_dir_(std::move(temp_dir)) {
    if (temp_dir_.empty()) {
        std::error_code ec;
        auto tmp = fs::temp_directory_path(ec);
        temp_dir_ = ec ? "/tmp" : tmp.string();
    }
}

std::expected<std::string, ScriptError> ScriptHost::write_temp_file(const std::string& source) {
    auto path = (fs::path(temp_dir_) / "plasma-deck-XXXXXX.js").string();
    // mkstemps needs a mutable char*
    std::vector<char> tmpl(path.begin(), path.end());
    tmpl.push_back('\0');

    int fd = ::mkstemps(tmpl.data(), 3);
    if (fd < 0) {
        return std::unexpected(ScriptError{ScriptErrorKind::ResourceExhausted,
                                           std::string("mkstemps: ") + std::strerror(errno)});
    }
    path.assign(tmpl.data());

    size_t written = 0;
    while (written < source.size()) {
        ssize_t n = ::write(fd, source.data() + written, source.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            auto msg = std::string("write ") + path + ": " + std::strerror(errno);
            ::close(fd);
            ::unlink(path.c_str());
            return std::unexpected(ScriptError{ScriptErrorKind::ResourceExhausted, msg});
        }
        written += static_cast<size_t>(n);
    }

    if (::close(fd) < 0) {
        auto msg = std::string("close ") + path + ": " + std::strerror(errno);
        ::unlink(path.c_str());
        return std::unexpected(ScriptError{ScriptErrorKind::ResourceExhausted, msg});
    }
    return path;
}

std::expected<LoadedScript, ScriptError> ScriptHost::load(const std::string& source) {
    auto path = write_temp_file(source);
    if (!path) return std::unexpected(path.error());

    auto id = backend_.load_script(*path);
    if (!id) {
        ::unlink(path->c_str());
        return std::unexpected(id.error());
    }

    return LoadedScript{.id = *id, .source = source, .path = std::move(*path)};
}

std::expected<void, ScriptError> ScriptHost::run(const LoadedScript& script) {
    return backend_.run(script.id);
}

std::expected<void, ScriptError> ScriptHost::stop(const LoadedScript& script) {
    return backend_.stop(script.id);
}

std::expected<void, ScriptError> ScriptHost::unload(LoadedScript& script) {
    if (script.path.empty()) {
        return std::unexpected(ScriptError{ScriptErrorKind::HostRejected, "script is not loaded"});
    }

    auto res = backend_.unload_script(script.path);

    if (::unlink(script.path.c_str()) < 0 && errno != ENOENT) {
        std::println(stderr, "kwin: failed to remove {}: {}", script.path, std::strerror(errno));
    }
    script.path.clear();
    script.id = -1;
    return res;
}
