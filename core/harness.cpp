#include "core/harness.hpp"

#include <set>

namespace core {

namespace {

const constexpr char* kHarnessTemplate = R"PY(import ast
import builtins
import io
import json
import os
import resource
import signal
import sys
import types

SOLUTION_FILE = "@SOLUTION_FILE@"
ALLOWED_BUILTINS = @ALLOWED_BUILTINS@
ALLOWED_MODULES = frozenset(@ALLOWED_MODULES@)
HIDDEN_ATTRIBUTES = frozenset(@HIDDEN_ATTRIBUTES@)
DENIED_ATTRIBUTES = frozenset(@DENIED_ATTRIBUTES@)
PUBLIC_DUNDERS = frozenset(@PUBLIC_DUNDERS@)
REPORT_KINDS = frozenset(["value", "definitionError", "nameError", "typeError",
                          "zeroDivision", "runtimeError", "internalError"])
MAX_DEPTH = 64
MAX_RESULT_SIZE = 16 * 1024 * 1024

PROXIES = {}


def result(kind, message=None, value=None):
    out = {"kind": kind}
    if message is not None:
        out["message"] = message
    if value is not None:
        out["value"] = value
    return out


def describe(exc):
    text = str(exc)
    name = type(exc).__name__
    return "%s: %s" % (name, text) if text else name


def module_allowed(name):
    return name.split(".")[0] in ALLOWED_MODULES


def attribute_allowed(name):
    if name in DENIED_ATTRIBUTES:
        return False
    if name in PUBLIC_DUNDERS or name.strip("_") == "":
        return True
    return not name.startswith("_")


def forbidden_names(tree):
    match_class = getattr(ast, "MatchClass", ())
    for node in ast.walk(tree):
        if isinstance(node, ast.Name):
            names = [node.id]
        elif isinstance(node, ast.Attribute):
            names = [node.attr]
        elif isinstance(node, ast.alias):
            names = node.name.split(".")
        elif isinstance(node, match_class):
            names = list(node.kwd_attrs)
        else:
            continue
        for name in names:
            if not attribute_allowed(name):
                yield getattr(node, "lineno", None), name


# Allowed modules are never handed out: the solution gets a copy holding
# their public attributes, where submodules are copies as well and modules
# outside the allow-list are missing.
def fill_proxy(proxy, module):
    for attr, value in list(vars(module).items()):
        if attr.startswith("_"):
            continue
        if "%s.%s" % (module.__name__, attr) in HIDDEN_ATTRIBUTES:
            continue
        if isinstance(value, types.ModuleType):
            if not module_allowed(value.__name__):
                continue
            value = module_proxy(value)
        setattr(proxy, attr, value)


def module_proxy(module):
    proxy = PROXIES.get(module.__name__)
    if proxy is None:
        proxy = types.ModuleType(module.__name__)
        PROXIES[module.__name__] = proxy
        fill_proxy(proxy, module)
    return proxy


def guarded_import(name, globals=None, locals=None, fromlist=(), level=0):
    if level != 0 or not module_allowed(name):
        raise ImportError("import of '%s' is not allowed" % name)
    module = builtins.__import__(name, None, None, fromlist, 0)
    parts = name.split(".")
    for i in range(1, len(parts) + 1):
        package = sys.modules[".".join(parts[:i])]
        fill_proxy(module_proxy(package), package)
    return module_proxy(module)


def restricted_builtins():
    table = {}
    for name in ALLOWED_BUILTINS:
        if hasattr(builtins, name):
            table[name] = getattr(builtins, name)
    table["__import__"] = guarded_import
    return table


def json_key(key):
    if isinstance(key, str):
        return key
    if key is True:
        return "true"
    if key is False:
        return "false"
    if key is None:
        return "null"
    if isinstance(key, int):
        return str(key)
    if isinstance(key, float):
        if key != key or key in (float("inf"), float("-inf")):
            raise ValueError("the returned value contains a non-finite key")
        return repr(key)
    raise TypeError("a key of type '%s' cannot be graded" % type(key).__name__)


def to_json(value, depth=0):
    if depth > MAX_DEPTH:
        raise ValueError("the returned value is nested too deeply")
    if value is None or isinstance(value, (bool, str, int)):
        return value
    if isinstance(value, float):
        if value != value or value in (float("inf"), float("-inf")):
            raise ValueError("the returned value contains a non-finite number")
        return value
    if isinstance(value, (list, tuple)):
        return [to_json(item, depth + 1) for item in value]
    if isinstance(value, (set, frozenset)):
        items = [to_json(item, depth + 1) for item in value]
        return sorted(items, key=lambda item: json.dumps(item, sort_keys=True))
    if isinstance(value, dict):
        out = {}
        for key, item in value.items():
            name = json_key(key)
            if name in out:
                raise ValueError("the returned value has the key '%s' twice" %
                                 name)
            out[name] = to_json(item, depth + 1)
        return out
    raise TypeError("a value of type '%s' cannot be graded" %
                    type(value).__name__)


def resolve(namespace, entry_point):
    target = namespace.get(entry_point)
    if target is None:
        holder = namespace.get("Solution")
        if isinstance(holder, type) and hasattr(holder, entry_point):
            target = getattr(holder(), entry_point)
    return target


def run_solution(source, request):
    entry_point = request.get("entryPoint") or ""
    try:
        tree = ast.parse(source, SOLUTION_FILE)
        code = compile(tree, SOLUTION_FILE, "exec")
    except SyntaxError as exc:
        return result("definitionError",
                      "Syntax error at line %s: %s" % (exc.lineno, exc.msg))
    except ValueError as exc:
        return result("definitionError", "Invalid source: %s" % exc)
    refused = sorted(forbidden_names(tree), key=lambda item: item[0] or 0)
    if refused:
        lineno, name = refused[0]
        where = " at line %s" % lineno if lineno is not None else ""
        return result("definitionError",
                      "Access to '%s' is not allowed%s" % (name, where))

    namespace = {"__builtins__": restricted_builtins(), "__name__": "solution"}
    try:
        exec(code, namespace)
        target = resolve(namespace, entry_point)
    except BaseException as exc:
        return result("definitionError",
                      "Error while loading the solution: " + describe(exc))
    if target is None:
        return result("definitionError",
                      "Function '%s' is not defined" % entry_point)
    if not callable(target):
        return result("definitionError", "'%s' is not callable" % entry_point)
    if request.get("probe"):
        return result("value", value="null")

    try:
        arguments = json.loads(request.get("arguments") or "{}")
    except ValueError as exc:
        return result("internalError",
                      "cannot decode the arguments: " + describe(exc))
    try:
        value = target(**arguments)
    except NameError as exc:
        return result("nameError", describe(exc))
    except TypeError as exc:
        return result("typeError", describe(exc))
    except ZeroDivisionError as exc:
        return result("zeroDivision", describe(exc))
    except BaseException as exc:
        return result("runtimeError", describe(exc))

    try:
        payload = json.dumps(to_json(value), allow_nan=False)
    except (TypeError, ValueError, RecursionError) as exc:
        return result("runtimeError", "Cannot grade the returned value: %s" % exc)
    return result("value", value=payload)


# Runs in the forked worker. The report file is not reachable from here: fd 0
# and fd 1 point to /dev/null and the only way out is the channel.
def worker(source, request, channel):
    status = 1
    try:
        devnull = os.open(os.devnull, os.O_RDWR)
        os.dup2(devnull, 0)
        os.dup2(devnull, 1)
        os.close(devnull)
        resource.setrlimit(resource.RLIMIT_NPROC, (0, 0))
        sys.stdin = io.StringIO()
        sys.stdout = io.StringIO()
        data = json.dumps(run_solution(source, request)).encode("utf-8")
        while data:
            data = data[os.write(channel, data):]
        status = 0
    except BaseException as exc:
        sys.stderr.write("the worker failed: %s\n" % describe(exc))
    finally:
        os._exit(status)


def read_channel(channel):
    chunks = []
    size = 0
    while True:
        chunk = os.read(channel, 65536)
        if not chunk:
            break
        size += len(chunk)
        if size > MAX_RESULT_SIZE:
            return None
        chunks.append(chunk)
    return b"".join(chunks)


def checked(data):
    try:
        out = json.loads(data.decode("utf-8"))
    except ValueError:
        return None
    if not isinstance(out, dict) or out.get("kind") not in REPORT_KINDS:
        return None
    for field in ("message", "value"):
        if field in out and not isinstance(out[field], str):
            return None
    return result(out["kind"], out.get("message"), out.get("value"))


def exit_like(status):
    if os.WIFSIGNALED(status):
        sig = os.WTERMSIG(status)
        if sig not in (signal.SIGKILL, signal.SIGSTOP):
            signal.signal(sig, signal.SIG_DFL)
        os.kill(os.getpid(), sig)
    os._exit(os.WEXITSTATUS(status) if os.WIFEXITED(status) else 1)


def report(out):
    data = json.dumps(out).encode("utf-8")
    written = 0
    while written < len(data):
        written += os.write(1, data[written:])
    os.ftruncate(1, written)


def main():
    try:
        request = json.loads(sys.stdin.read())
        with open(SOLUTION_FILE, encoding="utf-8") as handle:
            source = handle.read()
    except (OSError, ValueError) as exc:
        report(result("internalError",
                      "cannot read the invocation: " + describe(exc)))
        return

    channel_in, channel_out = os.pipe()
    pid = os.fork()
    if pid == 0:
        os.close(channel_in)
        worker(source, request, channel_out)
    os.close(channel_out)
    data = read_channel(channel_in)
    os.close(channel_in)
    _, status = os.waitpid(pid, 0)
    if not os.WIFEXITED(status) or os.WEXITSTATUS(status) != 0:
        exit_like(status)
    out = checked(data) if data else None
    if out is None:
        report(result("internalError", "the worker sent no valid result"))
        return
    report(out)


main()
)PY";

std::string PythonList(const std::set<std::string>& names) {
  std::string list = "[";
  for (const std::string& name : names) {
    if (list.size() > 1) list += ", ";
    list += "\"" + name + "\"";
  }
  return list + "]";
}

void ReplaceAll(std::string* text, const std::string& key,
                const std::string& value) {
  size_t pos = 0;
  while ((pos = text->find(key, pos)) != std::string::npos) {
    text->replace(pos, key.size(), value);
    pos += value.size();
  }
}

}  // namespace

std::string HarnessSource(const Capabilities& caps) {
  std::string source = kHarnessTemplate;
  ReplaceAll(&source, "@SOLUTION_FILE@", kSolutionFile);
  ReplaceAll(&source, "@ALLOWED_BUILTINS@", PythonList(caps.builtins));
  ReplaceAll(&source, "@ALLOWED_MODULES@", PythonList(caps.modules));
  ReplaceAll(&source, "@PUBLIC_DUNDERS@", PythonList(caps.public_dunders));
  ReplaceAll(&source, "@HIDDEN_ATTRIBUTES@",
             PythonList(caps.hidden_attributes));
  ReplaceAll(&source, "@DENIED_ATTRIBUTES@",
             PythonList(caps.denied_attributes));
  return source;
}

}  // namespace core
