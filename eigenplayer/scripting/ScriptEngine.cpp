#include "scripting/ScriptEngine.hpp"
#include "core/Core.hpp"
#include "core/Logger.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/embed.h>
#include <pybind11/stl.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

namespace py = pybind11;

namespace EigenPlayer {

namespace {

py::object ToPython(const PropertyValue& value) {
    return std::visit([](const auto& v) -> py::object {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, EqBandList>) {
            py::list bands;
            for (const auto& band : v) {
                bands.append(py::make_tuple(band.frequency, band.q, band.gainDb, band.type));
            }
            return bands;
        } else {
            return py::cast(v);
        }
    }, value);
}

/**
 * @brief Volume is held to [0, 1] like the volume command does
 */
float ToFloatProperty(const std::string& name, const py::handle& value) {
    const double v = value.cast<double>();
    if (name != "volume") {
        return static_cast<float>(v);
    }
    if (!std::isfinite(v)) {
        throw py::value_error("volume must be a finite number");
    }
    return std::clamp(static_cast<float>(v), 0.0f, 1.0f);
}

/**
 * @brief Convert a Python value to a property value
 *
 * Python ints become floats unless the target property is an int, so
 * core.set_property("volume", 1) keeps volume a float.
 */
PropertyValue FromPython(const Core& core, const std::string& name, const py::handle& value) {
    if (py::isinstance<py::bool_>(value)) {
        return value.cast<bool>();
    }
    if (py::isinstance<py::int_>(value)) {
        if (core.GetInt(name)) {
            return value.cast<int>();
        }
        return ToFloatProperty(name, value);
    }
    if (py::isinstance<py::float_>(value)) {
        return ToFloatProperty(name, value);
    }
    if (py::isinstance<py::str>(value)) {
        return value.cast<std::string>();
    }
    if (py::isinstance<py::list>(value) || py::isinstance<py::tuple>(value)) {
        StringList list;
        for (const auto& item : value) {
            if (!py::isinstance<py::str>(item)) {
                throw py::type_error("property lists may only contain strings");
            }
            list.push_back(item.cast<std::string>());
        }
        return list;
    }
    throw py::type_error("unsupported property type '" +
                         std::string(py::str(py::type::of(value).attr("__name__"))) + "'");
}

template<typename T>
py::object OptionalToPython(const std::optional<T>& value) {
    if (!value) {
        return py::none();
    }
    return py::cast(*value);
}

} // namespace

// ============================================================================
// Module Definition
// ============================================================================

PYBIND11_EMBEDDED_MODULE(eigenplayer, m) {
    m.doc() = "EigenPlayer scripting interface";

    py::class_<Core, std::unique_ptr<Core, py::nodelete>>(m, "Core")
        .def("execute_command",
             [](Core& core, const std::string& name, const std::vector<std::string>& params) {
                 return core.ExecuteCommand(name, params);
             },
             py::arg("name"), py::arg("params") = std::vector<std::string>{},
             "Run a player command, returns False if it is unknown")
        .def("set_property",
             [](Core& core, const std::string& name, const py::object& value) {
                 return core.SetProperty(name, FromPython(core, name, value));
             },
             py::arg("name"), py::arg("value"))
        .def("get_property",
             [](const Core& core, const std::string& name) -> py::object {
                 auto value = core.GetProperty(name);
                 return value ? ToPython(*value) : py::none();
             },
             py::arg("name"))
        .def("get_string",
             [](const Core& core, const std::string& name) { return OptionalToPython(core.GetString(name)); })
        .def("get_bool",
             [](const Core& core, const std::string& name) { return OptionalToPython(core.GetBool(name)); })
        .def("get_float",
             [](const Core& core, const std::string& name) { return OptionalToPython(core.GetFloat(name)); })
        .def("get_int",
             [](const Core& core, const std::string& name) { return OptionalToPython(core.GetInt(name)); })
        .def("get_string_list",
             [](const Core& core, const std::string& name) { return OptionalToPython(core.GetStringList(name)); })
        .def("property_names", &Core::GetPropertyNames)
        .def("command_names", &Core::GetCommandNames);
}

ScriptEngine::ScriptEngine(Core& core)
    : m_core(core) {
}

ScriptEngine::~ScriptEngine() {
    if (m_initialized) {
        Shutdown();
    }
}

bool ScriptEngine::Initialize() {
    if (m_initialized) {
        m_lastError = "Script engine already initialized";
        return false;
    }

    try {
        if (!Py_IsInitialized()) {
            py::initialize_interpreter();
            m_ownsInterpreter = true;
        }

        m_globals = std::make_shared<py::dict>();
        (*m_globals)["__builtins__"] = py::module_::import("builtins");
        (*m_globals)["__name__"] = "__main__";

        auto module = py::module_::import("eigenplayer");
        (*m_globals)["eigenplayer"] = module;
        (*m_globals)["core"] = py::cast(&m_core, py::return_value_policy::reference);
    } catch (const py::error_already_set& e) {
        m_lastError = std::string("Python initialization failed: ") + e.what();
        EIGENPLAYER_LOG_ERROR("{}", m_lastError);
        m_globals.reset();
        if (m_ownsInterpreter) {
            py::finalize_interpreter();
            m_ownsInterpreter = false;
        }
        return false;
    }

    m_initialized = true;
    EIGENPLAYER_LOG_INFO("Script engine initialized (Python {})", Py_GetVersion());
    return true;
}

void ScriptEngine::Shutdown() {
    if (!m_initialized) {
        return;
    }

    m_globals.reset();
    if (m_ownsInterpreter) {
        py::finalize_interpreter();
        m_ownsInterpreter = false;
    }
    m_initialized = false;
}

ScriptResult ScriptEngine::RunScript(const std::string& source) {
    if (!m_initialized) {
        return Fail("Script engine not initialized");
    }

    try {
        py::exec(source, *m_globals);
    } catch (const py::error_already_set& e) {
        return Fail(e.what());
    } catch (const std::exception& e) {
        // C++ exceptions thrown from inside a property callback
        return Fail(std::string("Script raised a C++ exception: ") + e.what());
    }
    return ScriptResult{true, ""};
}

ScriptResult ScriptEngine::RunFile(const std::filesystem::path& path) {
    if (!m_initialized) {
        return Fail("Script engine not initialized");
    }

    std::ifstream file(path);
    if (!file) {
        return Fail("Cannot open script file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    EIGENPLAYER_LOG_INFO("Running script '{}'", path.string());
    (*m_globals)["__file__"] = path.string();
    return RunScript(buffer.str());
}

ScriptResult ScriptEngine::Fail(std::string message) {
    m_lastError = std::move(message);
    EIGENPLAYER_LOG_ERROR("Script error: {}", m_lastError);
    return ScriptResult{false, m_lastError};
}

} // namespace EigenPlayer
