#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include <spdlog/spdlog.h>

#include "errors.hpp"
#include "metrics.hpp"
#include "model.hpp"

namespace py = pybind11;

PYBIND11_MODULE(cleaning_cpp, m)
{
    m.doc() = "Reactive cleaning robots simulation core";

    py::register_exception<InvalidConfigurationError>(
        m, "InvalidConfigurationError", PyExc_ValueError);
    py::register_exception<OutOfRangeError>(
        m, "OutOfRangeError", PyExc_IndexError);

    // ---------------- Enums ----------------
    py::enum_<SamplingMode>(m, "SamplingMode")
        .value("WithoutReplacement", SamplingMode::WithoutReplacement)
        .value("WithReplacement",    SamplingMode::WithReplacement);

    py::enum_<AgentKind>(m, "AgentKind")
        .value("Cleaner", AgentKind::Cleaner);

    py::enum_<ModelStatus>(m, "ModelStatus")
        .value("Running",    ModelStatus::Running)
        .value("Terminated", ModelStatus::Terminated);

    // ---------------- Parameters ----------------
    py::class_<Parameters>(m, "Parameters")
        .def(py::init<>())
        .def_readwrite("n",             &Parameters::n)
        .def_readwrite("width",         &Parameters::width)
        .def_readwrite("height",        &Parameters::height)
        .def_readwrite("dirty_percent", &Parameters::dirty_percent)
        .def_readwrite("max_steps",     &Parameters::max_steps)
        .def_readwrite("seed",          &Parameters::seed)
        .def_readwrite("torus",         &Parameters::torus)
        .def_readwrite("sampling",      &Parameters::sampling)
        .def("__repr__", [](const Parameters& p) { return "Parameters(" + describe(p) + ")"; });

    // ---------------- Agent ----------------
    py::class_<Agent>(m, "Agent")
        .def_property_readonly("id",    &Agent::id)
        .def_property_readonly("moves", &Agent::moves)
        .def_property_readonly("kind",  &Agent::kind)
        .def_property_readonly("pos",
             [](const Agent& a) { return py::make_tuple(a.cell().x, a.cell().y); });

    py::class_<MetricsSnapshot>(m, "MetricsSnapshot")
        .def_readonly("step",          &MetricsSnapshot::step)
        .def_readonly("dirty_count",   &MetricsSnapshot::dirty_count)
        .def_readonly("percent_clean", &MetricsSnapshot::percent_clean)
        .def_readonly("total_moves",   &MetricsSnapshot::total_moves);

    // ---------------- Model ----------------
    py::class_<Model>(m, "Model")
        .def(py::init<const Parameters&>(), py::arg("params"))

        .def(py::init([](int n, int width, int height, int dirty_percent,
                         int max_steps, std::optional<std::uint64_t> seed, bool torus) {
                 Parameters p;
                 p.n = n;
                 p.width = width;
                 p.height = height;
                 p.dirty_percent = dirty_percent;
                 p.max_steps = max_steps;
                 p.seed = seed;
                 p.torus = torus;
                 return Model(p);
             }),
             py::arg("n"), py::arg("width"), py::arg("height"),
             py::arg("dirty_percent"), py::arg("max_steps"),
             py::arg("seed") = py::none(), py::arg("torus") = false)

        .def("tick", &Model::tick)
        .def("step", &Model::tick)
        .def("run",  &Model::run)

        .def_property_readonly("running",       &Model::running)
        .def_property_readonly("status",        &Model::status)
        .def_property_readonly("current_step",  &Model::current_step)
        .def_property_readonly("max_steps",     &Model::max_steps)
        .def_property_readonly("dirty_count",   &Model::dirty_count)
        .def_property_readonly("seed",          &Model::seed)
        // by value: edits on the Python side never reach the running model
        .def_property_readonly("parameters",
             [](const Model& model) { return Parameters(model.parameters()); })
        .def_property_readonly("agents",        &Model::agents, py::return_value_policy::reference_internal)
        .def_property_readonly("history",       &Model::history)

        .def("percent_clean", &Model::percent_clean)
        .def("total_moves",   &Model::total_moves)

        .def("shape",
             [](const Model& model) {
                 return py::make_tuple(model.grid().getHeight(), model.grid().getWidth());
             })

        // ZERO-COPY read-only NumPy view of the dirt layer, (height, width), 1 = dirty.
        // Writes would bypass the dirty counter, so the array is not writeable.
        .def("dirt",
            [](Model& model) {
                const DirtState& d = model.dirt();
                py::array_t<uint8_t> view(
                    {static_cast<py::ssize_t>(d.getHeight()), static_cast<py::ssize_t>(d.getWidth())},
                    {static_cast<py::ssize_t>(sizeof(uint8_t) * d.getWidth()),
                     static_cast<py::ssize_t>(sizeof(uint8_t))},
                    d.raw().data(),
                    py::cast(&model)
                );
                view.attr("setflags")(py::arg("write") = false);
                return view;
            })

        // (n, 2) array of (x, y)
        .def("agent_positions",
            [](const Model& model) {
                const auto& agents = model.agents();
                py::array_t<int> out({static_cast<py::ssize_t>(agents.size()), py::ssize_t{2}});
                auto view = out.mutable_unchecked<2>();
                for (std::size_t i = 0; i < agents.size(); ++i)
                {
                    view(i, 0) = agents[i].cell().x;
                    view(i, 1) = agents[i].cell().y;
                }
                return out;
            });

    // ---------------- Read surface ----------------
    m.def("percent_clean",  &percent_clean,  py::arg("model"));
    m.def("total_moves",    &total_moves,    py::arg("model"));
    m.def("agent_kind",     &agent_kind,     py::arg("agent"));
    m.def("agent_position", &agent_position, py::arg("agent"));

    m.def("set_log_level",
          [](const std::string& level) { spdlog::set_level(spdlog::level::from_str(level)); },
          py::arg("level"),
          "trace, debug, info, warn, err, critical or off");
}
