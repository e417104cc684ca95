/**
 * @file bootstrap.cpp
 * @brief Guard bootstrap source and interpreter argument list.
 * @author Dimitris Kafetzis
 */

#include "runner/bootstrap.hpp"

namespace code_sandbox {

namespace {

constexpr std::string_view kBootstrap = R"PY(
import builtins, json, os, sys, traceback

sys.path[:] = [p for p in sys.path if p]
_allowed = frozenset(n for n in sys.argv[1].split(",") if n)
_blocked = frozenset(n for n in sys.argv[2].split(",") if n)
_status = os.fdopen(3, "w", encoding="utf-8")
_source = sys.stdin.buffer.read().decode("utf-8", "replace")
sys.stdin.close()
_import = builtins.__import__

def _guarded_import(name, globals=None, locals=None, fromlist=(), level=0):
    if level != 0 or name.partition(".")[0] not in _allowed:
        raise ImportError("Import of '%s' is not allowed" % name)
    return _import(name, globals, locals, fromlist, level)

_builtins = {k: v for k, v in vars(builtins).items() if k not in _blocked}
_builtins["__import__"] = _guarded_import
_namespace = {"__builtins__": _builtins, "__name__": "__main__"}

def _report(exc):
    frames = [f for f in traceback.extract_tb(exc.__traceback__) if f.filename == "<user_code>"]
    lines = ["Traceback (most recent call last):\n"] if frames else []
    lines += traceback.format_list(frames)
    lines += traceback.format_exception_only(type(exc), exc)
    sys.stderr.write("".join(lines))
    _status.write(json.dumps({"error_type": type(exc).__name__, "error": str(exc)[:4096]}))

_exit_code = 0
try:
    exec(compile(_source, "<user_code>", "exec"), _namespace)
except SystemExit as exc:
    if exc.code not in (None, 0):
        _exit_code = 1
        _report(exc)
except BaseException as exc:
    _exit_code = 1
    try:
        _report(exc)
    except BaseException:
        os._exit(1)

try:
    sys.stdout.flush()
    sys.stderr.flush()
    _status.close()
finally:
    os._exit(_exit_code)
)PY";

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ',';
        out += item;
    }
    return out;
}

}  // namespace

std::string_view guard_bootstrap() noexcept {
    return kBootstrap;
}

std::vector<std::string> bootstrap_arguments(const SecurityPolicy& policy) {
    return {
        "-u", "-s", "-S", "-B", "-X", "utf8",
        "-c", std::string(guard_bootstrap()),
        join(policy.allowed_modules()),
        join(policy.blocked_builtins()),
    };
}

}  // namespace code_sandbox
