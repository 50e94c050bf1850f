// PyBind11 bindings for the TALE session layer.
// Exposes sessions, configuration and the engine registry to a Python
// host (for example an MCP tool server), and adapts any Python object
// implementing the Jericho-style environment API into a GameEngine.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "engine/engine_registry.hpp"
#include "engine/game_engine.hpp"
#include "engine/transition.hpp"
#include "log/log.hpp"
#include "session/game_session.hpp"
#include "session/inventory_parser.hpp"
#include "session/session_config.hpp"
#include "session/session_error.hpp"
#include "session/session_host.hpp"
#include "session/text_utils.hpp"

#include <any>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;

namespace {

// ─── Python Engine Adapter ─────────────────────────────────────
// Wraps an environment object exposing reset(), step(action),
// get_valid_actions(), get_dictionary(), get_state() and
// set_state(state). Transitions are read by attribute: observation,
// score, moves, and optionally reward, done, inventory. Python
// exceptions surface as EngineError. State objects are kept as
// py::object and handed back untouched.

class PyGameEngine : public tale::GameEngine {
public:
    explicit PyGameEngine(py::object env) : env_(std::move(env)) {}

    tale::Transition reset() override { return toTransition(call("reset")); }

    tale::Transition step(const std::string& action) override {
        return toTransition(call("step", action));
    }

    std::vector<std::string> validActions() override {
        return toStrings(call("get_valid_actions"));
    }

    std::vector<std::string> dictionary() override {
        return toStrings(call("get_dictionary"));
    }

    tale::EngineSnapshot getState() override {
        return tale::EngineSnapshot(std::any(call("get_state")));
    }

    void setState(const tale::EngineSnapshot& snapshot) override {
        call("set_state", snapshot.as<py::object>());
    }

private:
    template <typename... Args>
    py::object call(const char* method, Args&&... args) {
        try {
            return env_.attr(method)(std::forward<Args>(args)...);
        } catch (py::error_already_set& e) {
            throw tale::EngineError(std::string(method) + ": " + e.what());
        } catch (const py::cast_error& e) {
            throw tale::EngineError(std::string(method) + ": " + e.what());
        }
    }

    static std::string str(py::handle h) { return py::str(h).cast<std::string>(); }

    static std::vector<std::string> toStrings(py::handle seq) {
        std::vector<std::string> out;
        if (seq.is_none()) return out;
        for (py::handle item : seq) {
            out.push_back(str(item));
        }
        return out;
    }

    static tale::Transition toTransition(py::handle obj) {
        try {
            tale::Transition t;
            t.observation = str(obj.attr("observation"));
            t.score = obj.attr("score").cast<int>();
            t.moves = obj.attr("moves").cast<int>();
            t.reward = py::getattr(obj, "reward", py::int_(0)).cast<int>();
            t.done = py::getattr(obj, "done", py::bool_(false)).cast<bool>();
            t.inventory = toStrings(py::getattr(obj, "inventory", py::none()));
            return t;
        } catch (py::error_already_set& e) {
            throw tale::EngineError(std::string("malformed transition: ") + e.what());
        } catch (const py::cast_error& e) {
            throw tale::EngineError(std::string("malformed transition: ") + e.what());
        }
    }

    py::object env_;
};

tale::EngineRegistry::Factory wrapFactory(py::function factory) {
    return [factory]() -> std::unique_ptr<tale::GameEngine> {
        return std::make_unique<PyGameEngine>(factory());
    };
}

} // namespace

PYBIND11_MODULE(tale_bindings, m) {
    m.doc() = "TALE text-adventure session layer. Save slots live in memory "
              "only and are lost when the process exits.";

    py::register_exception<tale::EngineError>(m, "EngineError", PyExc_RuntimeError);
    py::register_exception<tale::SessionError>(m, "SessionError", PyExc_RuntimeError);

    // ── LogLevel ──
    py::enum_<tale::log::Level>(m, "LogLevel")
        .value("TRACE", tale::log::Level::TRACE)
        .value("INFO", tale::log::Level::INFO)
        .value("WARN", tale::log::Level::WARN)
        .value("ERROR", tale::log::Level::ERR)
        .value("OFF", tale::log::Level::OFF);

    m.def("set_log_level", &tale::log::setLevel);
    m.def("set_log_file", &tale::log::setFile);
    m.def("close_log_file", &tale::log::closeFile);

    // ── Transition ──
    py::class_<tale::Transition>(m, "Transition")
        .def(py::init<>())
        .def_readwrite("observation", &tale::Transition::observation)
        .def_readwrite("score", &tale::Transition::score)
        .def_readwrite("moves", &tale::Transition::moves)
        .def_readwrite("reward", &tale::Transition::reward)
        .def_readwrite("done", &tale::Transition::done)
        .def_readwrite("inventory", &tale::Transition::inventory);

    // ── SessionConfig ──
    py::class_<tale::SessionConfig>(m, "SessionConfig")
        .def(py::init<>())
        .def_readwrite("game", &tale::SessionConfig::game)
        .def_readwrite("history_limit", &tale::SessionConfig::history_limit)
        .def_readwrite("recent_actions", &tale::SessionConfig::recent_actions)
        .def_readwrite("excerpt_length", &tale::SessionConfig::excerpt_length)
        .def_readwrite("vocabulary_prefix", &tale::SessionConfig::vocabulary_prefix)
        .def_readwrite("log_level", &tale::SessionConfig::log_level)
        .def_static("from_environment", &tale::SessionConfig::fromEnvironment)
        .def("validate", &tale::SessionConfig::validate);

    // ── EngineRegistry ──
    py::class_<tale::EngineRegistry>(m, "EngineRegistry")
        .def(py::init<>())
        .def("register_game", [](tale::EngineRegistry& self, const std::string& name,
                                 py::function factory) {
            self.registerGame(name, wrapFactory(std::move(factory)));
        }, py::arg("name"), py::arg("factory"))
        .def("remove", &tale::EngineRegistry::remove)
        .def("contains", &tale::EngineRegistry::contains)
        .def("available_games", &tale::EngineRegistry::availableGames);

    // ── GameSession ──
    py::class_<tale::GameSession>(m, "GameSession")
        .def(py::init([](py::object env, const tale::SessionConfig& config) {
            return std::make_unique<tale::GameSession>(
                std::make_unique<PyGameEngine>(std::move(env)), config);
        }), py::arg("env"), py::arg("config") = tale::SessionConfig{})
        .def_property_readonly("game_name", &tale::GameSession::gameName)
        .def_property_readonly("current_location", &tale::GameSession::currentLocation)
        .def_property_readonly("current_transition", &tale::GameSession::currentTransition)
        .def("take_action", &tale::GameSession::takeAction, py::arg("action"))
        .def("memory", &tale::GameSession::getMemorySummary)
        .def("get_map", &tale::GameSession::getMap)
        .def("inventory", &tale::GameSession::getInventory)
        .def("valid_actions", &tale::GameSession::getValidActions)
        .def("check_vocabulary", &tale::GameSession::checkVocabulary, py::arg("word"))
        .def("save", &tale::GameSession::save, py::arg("slot_name"),
             "Save to an in-memory slot. Slots do not survive the process.")
        .def("load", &tale::GameSession::load, py::arg("slot_name"))
        .def("slot_names", [](const tale::GameSession& self) {
            return self.slots().names();
        });

    // ── SessionHost ──
    // Tool-named entry points for a dispatch server; the session is
    // created lazily from the configured game.
    py::class_<tale::SessionHost>(m, "SessionHost")
        .def(py::init<tale::EngineRegistry, tale::SessionConfig>(),
             py::arg("registry"), py::arg("config") = tale::SessionConfig::fromEnvironment())
        .def("has_session", &tale::SessionHost::hasSession)
        .def("restart", &tale::SessionHost::restart)
        .def("play_action", &tale::SessionHost::playAction, py::arg("action"))
        .def("memory", &tale::SessionHost::memory)
        .def("get_map", &tale::SessionHost::map)
        .def("inventory", &tale::SessionHost::inventory)
        .def("valid_actions", &tale::SessionHost::validActions)
        .def("check_vocabulary", &tale::SessionHost::checkVocabulary, py::arg("word"))
        .def("save_state", &tale::SessionHost::saveState, py::arg("slot_name"),
             "Save to an in-memory slot. Slots do not survive the process.")
        .def("load_state", &tale::SessionHost::loadState, py::arg("slot_name"))
        .def("list_available_games", [](const tale::SessionHost& self) {
            return self.registry().availableGames();
        });

    m.def("parse_item_name", &tale::parseItemName, py::arg("descriptor"));
    m.def("extract_location", &tale::text::extractLocation, py::arg("observation"));
}
