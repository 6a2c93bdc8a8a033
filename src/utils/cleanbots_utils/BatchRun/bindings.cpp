#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>

#include "batch_run.hpp"

namespace py = pybind11;

/* ------------------ pybind ------------------ */
PYBIND11_MODULE(batch_run_cpp, m) {
    m.doc() = "Seeded batch runs of the cleaning model";

    // Parameters type and the InvalidConfigurationError translator live in cleaning_cpp
    py::module_ cleaning = py::module_::import("cleaning_cpp");
    m.attr("InvalidConfigurationError") = cleaning.attr("InvalidConfigurationError");

    m.def(
        "run_batch",
        [](const Parameters& base, const std::vector<std::uint64_t>& seeds) {
            BatchResult r = run_batch(base, seeds);
            py::dict out;
            out["seeds"] = r.seeds;
            out["percent_clean"] = r.percent_clean;
            out["total_moves"] = r.total_moves;
            out["steps_to_clean"] = r.steps_to_clean;
            return out;
        },
        py::arg("params"),
        py::arg("seeds"),
        "One model per seed; returns per-step PercentClean and TotalMoves matrices"
    );

    m.def(
        "summarize",
        [](const Parameters& base, const std::vector<std::uint64_t>& seeds) {
            BatchSummary s = summarize(run_batch(base, seeds));
            py::dict out;
            out["mean_percent_clean"] = s.mean_percent_clean;
            out["var_percent_clean"] = s.var_percent_clean;
            out["mean_total_moves"] = s.mean_total_moves;
            out["mean_steps_to_clean"] = s.mean_steps_to_clean;
            out["clean_fraction"] = s.clean_fraction;
            return out;
        },
        py::arg("params"),
        py::arg("seeds"),
        "Across-seed mean and variance of the run series"
    );
}
