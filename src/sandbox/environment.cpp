#include "sandbox/environment.h"
#include <cstdio>
#include <sstream>

namespace pysandbox {
namespace sandbox {

RestrictedEnvironment EnvironmentBuilder::build(const utils::SandboxConfig& config) {
    RestrictedEnvironment env;

    env.safeBuiltins = {
        "abs", "all", "any", "bin", "bool", "bytearray", "bytes", "chr",
        "complex", "dict", "divmod", "enumerate", "filter", "float", "format",
        "frozenset", "hex", "int", "isinstance", "issubclass", "len", "list",
        "map", "max", "min", "oct", "ord", "pow", "print", "range", "repr",
        "reversed", "round", "set", "slice", "sorted", "str", "sum", "tuple",
        "type", "zip",
        // class statements and iteration protocols
        "__build_class__", "object", "iter", "next", "callable", "hash",
        "super", "property", "staticmethod", "classmethod",
        // exceptions learners raise and catch
        "Exception", "ArithmeticError", "AssertionError", "AttributeError",
        "IndexError", "KeyError", "LookupError", "NameError",
        "NotImplementedError", "OverflowError", "RecursionError",
        "RuntimeError", "StopIteration", "TypeError", "ValueError",
        "ZeroDivisionError"
    };

    env.preloadedModules = {
        "math", "random", "datetime", "collections", "itertools",
        "functools", "operator", "string", "re", "json"
    };
    env.importAllowlist = env.preloadedModules;

    // Both build attribute lookups from runtime strings.
    env.hiddenAttributes["operator"] = {"attrgetter", "methodcaller"};
    env.hiddenAttributes["string"] = {"Formatter"};

    env.recursionLimit = config.recursionLimit;
    env.maxOutputBytes = config.maxOutputSize;
    return env;
}

std::string EnvironmentBuilder::pythonStringLiteral(const std::string& value) {
    std::string out = "'";
    for (unsigned char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\'': out += "\\'"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20 || c >= 0x7f) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\x%02x", c);
                    out += buf;
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    out += "'";
    return out;
}

std::string EnvironmentBuilder::pythonTuple(const std::vector<std::string>& values) {
    std::ostringstream out;
    out << "(";
    for (size_t i = 0; i < values.size(); i++) {
        if (i > 0) out << ", ";
        out << pythonStringLiteral(values[i]);
    }
    if (values.size() == 1) out << ",";
    out << ")";
    return out.str();
}

std::string EnvironmentBuilder::renderPrelude(const RestrictedEnvironment& env) {
    std::ostringstream py;

    py << "import builtins as _builtins\n";
    py << "import types as _types\n";
    py << "\n";
    py << "_SAFE_BUILTINS = " << pythonTuple(env.safeBuiltins) << "\n";
    py << "_PRELOADED_MODULES = " << pythonTuple(env.preloadedModules) << "\n";
    py << "_IMPORT_ALLOWLIST = frozenset(" << pythonTuple(env.importAllowlist) << ")\n";
    py << "_HIDDEN_ATTRIBUTES = {\n";
    for (const auto& [module, attrs] : env.hiddenAttributes) {
        py << "    " << pythonStringLiteral(module) << ": frozenset(" << pythonTuple(attrs) << "),\n";
    }
    py << "}\n";
    py << "_REAL_MODULES = {}\n";
    py << "for _name in sorted(set(_PRELOADED_MODULES) | _IMPORT_ALLOWLIST):\n";
    py << "    _REAL_MODULES[_name] = __import__(_name)\n";
    py << "\n";
    py << "\n";
    py << "class SandboxSecurityError(Exception):\n";
    py << "    pass\n";
    py << "\n";
    py << "\n";
    // Fresh module objects carrying public, non-module attributes only, so
    // neither private helpers (random._os) nor submodules are reachable.
    py << "def _public_view(name):\n";
    py << "    module = _REAL_MODULES[name]\n";
    py << "    hidden = _HIDDEN_ATTRIBUTES.get(name, frozenset())\n";
    py << "    view = _types.ModuleType(name)\n";
    py << "    for attr in dir(module):\n";
    py << "        if attr.startswith('_') or attr in hidden:\n";
    py << "            continue\n";
    py << "        value = getattr(module, attr)\n";
    py << "        if isinstance(value, _types.ModuleType):\n";
    py << "            continue\n";
    py << "        setattr(view, attr, value)\n";
    py << "    return view\n";
    py << "\n";
    py << "\n";
    py << "def _build_namespace(violations):\n";
    py << "    views = {}\n";
    py << "\n";
    py << "    def _view(name):\n";
    py << "        if name not in views:\n";
    py << "            views[name] = _public_view(name)\n";
    py << "        return views[name]\n";
    py << "\n";
    py << "    def _restricted_import(name, globals=None, locals=None, fromlist=(), level=0):\n";
    py << "        if level != 0 or name not in _IMPORT_ALLOWLIST:\n";
    py << "            violations.append(name or '.')\n";
    py << "            raise SandboxSecurityError(\"Import of module '%s' is not allowed\" % (name or '.'))\n";
    py << "        return _view(name)\n";
    py << "\n";
    py << "    safe = {}\n";
    py << "    for name in _SAFE_BUILTINS:\n";
    py << "        if hasattr(_builtins, name):\n";
    py << "            safe[name] = getattr(_builtins, name)\n";
    py << "    safe['__import__'] = _restricted_import\n";
    py << "    namespace = {'__builtins__': safe, '__name__': '__main__', '__doc__': None}\n";
    py << "    for name in _PRELOADED_MODULES:\n";
    py << "        namespace[name] = _view(name)\n";
    py << "    return namespace\n";

    return py.str();
}

}
}
