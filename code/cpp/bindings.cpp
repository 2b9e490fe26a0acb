/**
 * @file bindings.cpp
 * @brief pybind11 bindings exposing the decay-analysis pipeline to Python.
 *
 * The module name is ``room_acoustics``. It provides Python access to:
 * - ::IRTrimmer, ::SchroederIntegrator, ::LeastSquaresFitter (pipeline stages)
 * - ::DecayTimeCalculator (EDT/T20/T30 via @c calculate )
 * - ::INRCalculator (INR/LIR/LN via @c calculate , with an optional plot callable)
 *
 * Implementation notes
 * --------------------
 * * NumPy arrays are converted to STL containers where needed.
 * * Only 1-D NumPy inputs are accepted (double precision).
 * * The C++ exception hierarchy is mirrored as Python exceptions deriving from
 *   ``room_acoustics.AcousticsError`` (itself a ``RuntimeError``).
 */

#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <string>
#include "acoustics_config.hpp"
#include "acoustics_errors.hpp"
#include "decay_time_calculator.hpp"
#include "inr_calculator.hpp"
#include "ir_trimmer.hpp"
#include "least_squares_fitter.hpp"
#include "schroeder_integrator.hpp"

namespace py = pybind11;

/**
 * @brief Convert a 1-D NumPy (double) array to a std::vector<double>.
 * @param array Input NumPy array (must be 1-D).
 * @return std::vector<double> holding a copy of the data.
 * @throws std::runtime_error if the array is not 1-D.
 */
std::vector<double> numpy_to_vector(py::array_t<double> array) {
    py::buffer_info buf = array.request();
    if (buf.ndim != 1) {
        throw std::runtime_error("Number of dimensions must be 1");
    }
    auto *ptr = static_cast<double *>(buf.ptr);
    return std::vector<double>(ptr, ptr + buf.size);
}

PYBIND11_MODULE(room_acoustics, m) {
    m.doc() = "Room-acoustics decay parameters (EDT, T20, T30, INR)";

    // ---------------------------------------------------------------------
    // Exceptions
    // ---------------------------------------------------------------------
    auto& base = py::register_exception<AcousticsError>(m, "AcousticsError", PyExc_RuntimeError);
    py::register_exception<DegenerateInputError>(m, "DegenerateInputError", base.ptr());
    py::register_exception<InsufficientWindowError>(m, "InsufficientWindowError", base.ptr());
    py::register_exception<SingularFitError>(m, "SingularFitError", base.ptr());
    py::register_exception<InvalidSlopeError>(m, "InvalidSlopeError", base.ptr());
    py::register_exception<NumericDomainError>(m, "NumericDomainError", base.ptr());

    // ---------------------------------------------------------------------
    // Configuration and result types
    // ---------------------------------------------------------------------
    py::class_<DecayWindow>(m, "DecayWindow")
        .def(py::init([](const std::string& name, double lo_db, double hi_db) {
            return DecayWindow{name, lo_db, hi_db};
        }), py::arg("name"), py::arg("lo_db"), py::arg("hi_db"))
        .def_readwrite("name", &DecayWindow::name)
        .def_readwrite("lo_db", &DecayWindow::lo_db)
        .def_readwrite("hi_db", &DecayWindow::hi_db);

    py::class_<DecayAnalysisConfig>(m, "DecayAnalysisConfig")
        .def(py::init<>())
        .def_readwrite("trim_offset", &DecayAnalysisConfig::trim_offset)
        .def_readwrite("noise_tail_fraction", &DecayAnalysisConfig::noise_tail_fraction)
        .def_readwrite("decay_range_db", &DecayAnalysisConfig::decay_range_db)
        .def_readwrite("min_window_coverage", &DecayAnalysisConfig::min_window_coverage)
        .def_readwrite("edt", &DecayAnalysisConfig::edt)
        .def_readwrite("t20", &DecayAnalysisConfig::t20)
        .def_readwrite("t30", &DecayAnalysisConfig::t30);

    py::class_<DecayParameters>(m, "DecayParameters")
        .def_readonly("edt", &DecayParameters::edt)
        .def_readonly("t20", &DecayParameters::t20)
        .def_readonly("t30", &DecayParameters::t30);

    py::class_<AcousticMetrics>(m, "AcousticMetrics")
        .def_readonly("inr", &AcousticMetrics::inr)
        .def_readonly("lir", &AcousticMetrics::lir)
        .def_readonly("ln", &AcousticMetrics::ln)
        .def_readonly("decay", &AcousticMetrics::decay);

    py::class_<DecayPlot>(m, "DecayPlot")
        .def_readonly("time", &DecayPlot::time)
        .def_readonly("raw_db", &DecayPlot::raw_db)
        .def_readonly("schroeder_db", &DecayPlot::schroeder_db)
        .def_readonly("ln", &DecayPlot::ln)
        .def_readonly("lir", &DecayPlot::lir);

    // ---------------------------------------------------------------------
    // Pipeline stages
    // ---------------------------------------------------------------------
    py::class_<IRTrimmer>(m, "IRTrimmer")
        .def_static("trim", [](py::array_t<double> array, std::size_t offset) {
            return IRTrimmer::trim(numpy_to_vector(array), offset);
        }, py::arg("signal"), py::arg("offset") = TRIM_OFFSET_SAMPLES);

    py::class_<SchroederIntegrator>(m, "SchroederIntegrator")
        .def_static("integrate", [](py::array_t<double> array, std::size_t t, double C, double rms) {
            return SchroederIntegrator::integrate(numpy_to_vector(array), t, C, rms);
        }, py::arg("energy"), py::arg("t"), py::arg("C") = 0.0, py::arg("rms") = 0.0);

    py::class_<LeastSquaresFitter::Result>(m, "LineFit")
        .def_readonly("slope", &LeastSquaresFitter::Result::slope)
        .def_readonly("intercept", &LeastSquaresFitter::Result::intercept)
        .def_readonly("fitted_line", &LeastSquaresFitter::Result::fitted_line);

    py::class_<LeastSquaresFitter>(m, "LeastSquaresFitter")
        .def_static("fit", [](py::array_t<double> x, py::array_t<double> y) {
            return LeastSquaresFitter::fit(numpy_to_vector(x), numpy_to_vector(y));
        });

    // ---------------------------------------------------------------------
    // Calculators
    // ---------------------------------------------------------------------
    py::class_<DecayTimeCalculator>(m, "DecayTimeCalculator")
        .def_static("calculate", [](py::array_t<double> curve_db, double fs, const DecayAnalysisConfig& config) {
            return DecayTimeCalculator::calculate(numpy_to_vector(curve_db), fs, config);
        }, py::arg("curve_db"), py::arg("fs"), py::arg("config") = DecayAnalysisConfig{})
        .def_static("decay_time", [](py::array_t<double> curve_db, double fs, const DecayWindow& window,
                                     const DecayAnalysisConfig& config) {
            return DecayTimeCalculator::decay_time(numpy_to_vector(curve_db), fs, window, config);
        }, py::arg("curve_db"), py::arg("fs"), py::arg("window"), py::arg("config") = DecayAnalysisConfig{})
        .def_static("from_energy", [](py::array_t<double> energy, double fs, std::size_t t, double C, double rms,
                                      const DecayAnalysisConfig& config) {
            return DecayTimeCalculator::from_energy(numpy_to_vector(energy), fs, t, C, rms, config);
        }, py::arg("energy"), py::arg("fs"), py::arg("t"), py::arg("C") = 0.0, py::arg("rms") = 0.0,
           py::arg("config") = DecayAnalysisConfig{});

    py::class_<INRCalculator>(m, "INRCalculator")
        .def_static("calculate", [](py::array_t<double> array, double fs, py::object plot,
                                    const DecayAnalysisConfig& config) {
            DecayPlotHook hook;
            if (!plot.is_none()) {
                hook = [plot](const DecayPlot& data) { plot(data); };
            }
            return INRCalculator::calculate(numpy_to_vector(array), fs, hook, config);
        }, py::arg("signal"), py::arg("fs"), py::arg("plot") = py::none(),
           py::arg("config") = DecayAnalysisConfig{});
}
