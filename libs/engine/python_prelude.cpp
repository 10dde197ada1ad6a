/**
 * @file python_prelude.cpp
 * @brief Python host prelude: attribute gate and audit hook, builtin/import allowlists,
 *        input replay, limits
 */

#include "preludes.hpp"

namespace secbox::engine {

namespace {

constexpr std::string_view kPythonPrelude = R"PY(
import ast as _ast
import builtins as _builtins
import dis as _dis
import json as _json
import math as _math
import operator as _operator
import os as _os
import signal as _signal
import sys as _sys
import traceback as _traceback
import types as _types

_NETWORK_MODULES = {
    "socket", "ssl", "http", "urllib", "urllib3", "requests", "httplib",
    "ftplib", "smtplib", "poplib", "imaplib", "telnetlib", "xmlrpc", "asyncio",
}

_SAFE_BUILTINS = (
    "abs", "all", "any", "ascii", "bin", "bool", "bytearray", "bytes", "callable",
    "chr", "classmethod", "complex", "delattr", "dict", "dir", "divmod",
    "enumerate", "filter", "float", "format", "frozenset", "getattr", "hasattr",
    "hash", "hex", "id", "int", "isinstance", "issubclass", "iter", "len", "list",
    "map", "max", "min", "next", "object", "oct", "ord", "pow", "print",
    "property", "range", "repr", "reversed", "round", "set", "setattr", "slice",
    "sorted", "staticmethod", "str", "sum", "super", "tuple", "type", "zip",
    "__build_class__", "NotImplemented", "Ellipsis", "True", "False", "None",
)

# Interpreter frame and code links; together with every "_" name they are the
# paths from guest objects back to this module's globals and the real builtins.
_FRAME_ATTRIBUTES = frozenset((
    "tb_frame", "tb_next", "f_back", "f_globals", "f_locals", "f_builtins", "f_code",
    "gi_frame", "gi_code", "cr_frame", "cr_code", "ag_frame", "ag_code",
))

_ATTRIBUTE_OPCODES = frozenset((
    "LOAD_ATTR", "LOAD_METHOD", "LOAD_SUPER_ATTR", "STORE_ATTR", "DELETE_ATTR", "IMPORT_FROM",
))
_NAME_OPCODES = frozenset(("LOAD_NAME", "LOAD_GLOBAL", "LOAD_FROM_DICT_OR_GLOBALS", "IMPORT_NAME"))

# Modules whose runtime code generation never carries guest source
_TRUSTED_CODEGEN = frozenset((
    "collections", "dataclasses", "importlib._bootstrap", "importlib._bootstrap_external",
    "_frozen_importlib", "_frozen_importlib_external",
))

_control = _os.fdopen(3, "w", buffering=1, encoding="utf-8")


def _send(event, **fields):
    fields["event"] = event
    _control.write(_json.dumps(fields) + "\n")
    _control.flush()


class _WallClockExceeded(BaseException):
    pass


class _SandboxViolation(Exception):
    pass


def _hidden(name):
    return isinstance(name, str) and (name.startswith("_") or name in _FRAME_ATTRIBUTES)


def _check_tree(tree):
    found = []
    for node in _ast.walk(tree):
        if isinstance(node, _ast.Attribute) and _hidden(node.attr):
            found.append(((node.lineno, node.end_col_offset),
                          "Access to attribute '%s' is not allowed in the sandbox (line %d)" % (node.attr, node.lineno)))
        if isinstance(node, _ast.ImportFrom):
            for alias in node.names:
                if _hidden(alias.name):
                    found.append(((node.lineno, node.col_offset),
                                  "Import of name '%s' is not allowed in the sandbox (line %d)" % (alias.name, node.lineno)))
    if found:
        raise _SandboxViolation(min(found)[1])


def _code_violation(code):
    """First hidden attribute or name `code` touches, as a message, or None."""
    for instruction in _dis.get_instructions(code):
        if not isinstance(instruction.argval, str) or not _hidden(instruction.argval):
            continue
        if instruction.opname in _ATTRIBUTE_OPCODES:
            return "Access to attribute '%s' is not allowed in the sandbox" % instruction.argval
        if instruction.opname in _NAME_OPCODES:
            return "Access to name '%s' is not allowed in the sandbox" % instruction.argval
    for constant in code.co_consts:
        if isinstance(constant, _types.CodeType):
            found = _code_violation(constant)
            if found is not None:
                return found
    return None


_auditing = [False]


def _audit(event, args):
    # Source compiled or code executed on the guest's behalf (typing's string
    # annotations, eval inside allowed modules) passes the same gate, and may
    # not name hidden globals of whatever namespace it is evaluated in
    if event not in ("compile", "exec") or _auditing[0]:
        return
    try:
        caller = _sys._getframe(1).f_globals.get("__name__")
    except ValueError:
        caller = None
    if caller in _TRUSTED_CODEGEN:
        return
    _auditing[0] = True
    try:
        if event == "compile":
            source = args[0]
            if isinstance(source, _ast.AST):
                _check_tree(source)
            elif isinstance(source, (str, bytes)):
                try:
                    tree = _ast.parse(source)
                except (SyntaxError, ValueError):
                    return
                _check_tree(tree)
        elif args and isinstance(args[0], _types.CodeType) and args[0].co_filename != "<sandbox>":
            message = _code_violation(args[0])
            if message is not None:
                raise _SandboxViolation(message)
    finally:
        _auditing[0] = False


def _guard_getattr(obj, name, *default):
    if _hidden(name):
        raise AttributeError("Access to attribute '%s' is not allowed in the sandbox" % name)
    return _builtins.getattr(obj, name, *default)


def _guard_setattr(obj, name, value):
    if _hidden(name):
        raise AttributeError("Access to attribute '%s' is not allowed in the sandbox" % name)
    _builtins.setattr(obj, name, value)


def _guard_delattr(obj, name):
    if _hidden(name):
        raise AttributeError("Access to attribute '%s' is not allowed in the sandbox" % name)
    _builtins.delattr(obj, name)


def _guard_hasattr(obj, name):
    return not _hidden(name) and _builtins.hasattr(obj, name)


def _guard_dotted(name):
    if isinstance(name, str):
        for part in name.split("."):
            if _hidden(part):
                raise AttributeError("Access to attribute '%s' is not allowed in the sandbox" % part)


def _guard_attrgetter(attr, *attrs):
    for name in (attr,) + attrs:
        _guard_dotted(name)
    return _operator.attrgetter(attr, *attrs)


def _guard_methodcaller(name, *args, **kwargs):
    _guard_dotted(name)
    return _operator.methodcaller(name, *args, **kwargs)


# Public names that resolve attributes from strings: replaced with guarded
# versions, or withheld (None) where a guest subclass could reach the original
_VIEW_OVERRIDES = {
    "operator": {"attrgetter": _guard_attrgetter, "methodcaller": _guard_methodcaller},
    "string": {"Formatter": None},
}


def _public_view(module, views):
    """Module of the public names of `module`; foreign modules it imported are left out."""
    key = module.__name__
    if key in views:
        return views[key]
    view = _types.ModuleType(key)
    views[key] = view
    package = key + "."
    overrides = _VIEW_OVERRIDES.get(key, {})
    for name in dir(module):
        if _hidden(name):
            continue
        if name in overrides:
            if overrides[name] is not None:
                setattr(view, name, overrides[name])
            continue
        try:
            value = getattr(module, name)
        except AttributeError:
            continue
        if isinstance(value, _types.ModuleType):
            if not value.__name__.startswith(package):
                continue
            value = _public_view(value, views)
        setattr(view, name, value)
    return view


def _on_alarm(signum, frame):
    raise _WallClockExceeded()


def _frame_depth():
    depth = 0
    frame = _sys._getframe()
    while frame is not None:
        depth += 1
        frame = frame.f_back
    return depth


def _convert(value):
    if value is None or isinstance(value, (bool, int, str)):
        return value
    if isinstance(value, float):
        return value if _math.isfinite(value) else repr(value)
    try:
        text = _json.dumps(value, allow_nan=False)
    except (TypeError, ValueError, RecursionError, OverflowError):
        return repr(value)
    if len(text) > 65536:
        return repr(value)[:1024] + "..."
    return _json.loads(text)


def _variables(namespace, hidden):
    values = {}
    for name, value in namespace.items():
        if name.startswith("_") or any(name.startswith(prefix) for prefix in hidden):
            continue
        if type(value).__name__ == "module":
            continue
        try:
            values[name] = _convert(value)
        except Exception as error:
            values[name] = "<unrepresentable: %s>" % type(error).__name__
    return values


def _main():
    with open(_sys.argv[1], encoding="utf-8") as handle:
        payload = _json.load(handle)

    code = payload["code"]
    inputs = list(payload.get("inputs", []))
    allowed = set(payload.get("allowedModules", []))
    hidden = list(payload.get("hiddenPrefixes", []))
    real_import = _builtins.__import__
    views = {}

    def guarded_import(name, globals=None, locals=None, fromlist=(), level=0):
        root = name.split(".")[0]
        if level != 0 or root not in allowed:
            if root in _NETWORK_MODULES:
                _send("network", target=root)
            raise ImportError("Import of module '%s' is not allowed in the sandbox" % name)
        return _public_view(real_import(name, globals, locals, fromlist, level), views)

    def replay_input(prompt=""):
        text = str(prompt)
        if not inputs:
            _sys.stdout.write(text)
            raise EOFError("EOF when reading a line")
        value = str(inputs.pop(0))
        _sys.stdout.write(text + value + "\n")
        return value

    safe = {name: getattr(_builtins, name) for name in _SAFE_BUILTINS if hasattr(_builtins, name)}
    for name, value in vars(_builtins).items():
        if isinstance(value, type) and issubclass(value, BaseException):
            safe[name] = value
    safe["__import__"] = guarded_import
    safe["input"] = replay_input
    safe["getattr"] = _guard_getattr
    safe["setattr"] = _guard_setattr
    safe["delattr"] = _guard_delattr
    safe["hasattr"] = _guard_hasattr

    tree = _ast.parse(code, "<sandbox>", "exec")
    try:
        _check_tree(tree)
    except _SandboxViolation as violation:
        _send("fault", kind="SecurityViolation", message="SecurityError: %s" % violation)
        return 1

    namespace = {"__builtins__": safe, "__name__": "__main__"}
    program = compile(tree, "<sandbox>", "exec")

    wall_ms = int(payload.get("maxWallClockMs", 0))
    if wall_ms > 0:
        _signal.signal(_signal.SIGALRM, _on_alarm)
        _signal.setitimer(_signal.ITIMER_REAL, wall_ms / 1000.0)

    _sys.setrecursionlimit(int(payload.get("maxRecursionDepth", 100)) + _frame_depth() + 50)
    _sys.addaudithook(_audit)
    _send("ready")
    fault = None
    try:
        exec(program, namespace)
    except _WallClockExceeded:
        fault = ("ResourceExceeded", "Wall-clock time limit exceeded")
    except _SandboxViolation as violation:
        fault = ("SecurityViolation", "SecurityError: %s" % violation)
    except RecursionError:
        fault = ("ResourceExceeded", "Maximum recursion depth exceeded")
    except MemoryError:
        fault = ("ResourceExceeded", "Memory limit exceeded")
    except SystemExit as stop:
        if stop.code not in (None, 0):
            fault = ("RuntimeFault", "SystemExit: %s" % stop.code)
    except BaseException as error:
        lines = _traceback.format_exception_only(type(error), error)
        fault = ("RuntimeFault", "".join(lines).strip())
    finally:
        _signal.setitimer(_signal.ITIMER_REAL, 0)
        _sys.setrecursionlimit(1000)
        _sys.stdout.flush()

    if fault is not None:
        _send("fault", kind=fault[0], message=fault[1])
        return 1
    if payload.get("inspectVariables", True):
        _send("variables", values=_variables(namespace, hidden))
    return 0


try:
    _status = _main()
except SyntaxError as error:
    _send("fault", kind="RuntimeFault", message="".join(_traceback.format_exception_only(type(error), error)).strip())
    _status = 1
_sys.stdout.flush()
_os._exit(_status)
)PY";

}  // namespace

std::string_view python_prelude() noexcept
{
    return kPythonPrelude;
}

}  // namespace secbox::engine
