#include <pybind11/pybind11.h>
#include <pybind11/stl.h> // For automatic string conversion
#include <pybind11/numpy.h> // For numpy array support

#include <stdexcept>
#include <string>

#include "types.hpp"
#include "Array2D.hpp"
#include "Grid.hpp"
#include "Log.hpp"
#include "Parameters.hpp"
#include "States.hpp"
#include "Topography.hpp"

#include "reconstruct/Reconstructor.hpp"
#include "reconstruct/PiecewiseConstant.hpp"
#include "reconstruct/Minmod.hpp"
#include "reconstruct/Stages.hpp"

namespace py = pybind11;
using namespace swash;

namespace {

    using DoubleArray = py::array_t<double, py::array::c_style | py::array::forcecast>;

    // Zero-copy, writable view on C++-owned memory; `base` keeps the owner alive
    py::array_t<double> as_numpy(Array2D& arr, py::handle base) {
        return py::array_t<double>(
            {static_cast<py::ssize_t>(arr.rows()), static_cast<py::ssize_t>(arr.cols())},
            {static_cast<py::ssize_t>(sizeof(double) * arr.cols()), static_cast<py::ssize_t>(sizeof(double))},
            arr.data(), base);
    }

    // Same view with NumPy's write flag cleared, for data the caller must not modify
    py::array_t<double> as_readonly_numpy(Array2D& arr, py::handle base) {
        py::array_t<double> view = as_numpy(arr, base);
        view.attr("setflags")(py::arg("write") = false);
        return view;
    }

    Array2D from_numpy(const DoubleArray& data, const std::string& name) {
        if (data.ndim() != 2) {
            throw std::invalid_argument(name + ": expected a 2D array, got ndim=" + std::to_string(data.ndim()));
        }
        const int rows = static_cast<int>(data.shape(0));
        const int cols = static_cast<int>(data.shape(1));
        Array2D out(rows, cols);
        auto r = data.unchecked<2>();
        for (int j = 0; j < rows; ++j) {
            for (int i = 0; i < cols; ++i) {
                out(j, i) = r(j, i);
            }
        }
        return out;
    }
}

PYBIND11_MODULE(_core, m) {
    m.doc() = "swash: positivity-preserving reconstruction for the 2D shallow-water equations";

    // ------------------------------------------
    // 1. Point values
    py::class_<Conserved>(m, "Conserved")
        .def(py::init<double, double, double>(), py::arg("w"), py::arg("hu"), py::arg("hv"))
        // We use lambdas to access the union members safely
        .def_property_readonly("w",  [](const Conserved& q){ return q.w; })
        .def_property_readonly("hu", [](const Conserved& q){ return q.hu; })
        .def_property_readonly("hv", [](const Conserved& q){ return q.hv; })
        .def("__repr__", [](const Conserved& q) {
            return "<Conserved w=" + std::to_string(q.w) +
                   " hu=" + std::to_string(q.hu) +
                   " hv=" + std::to_string(q.hv) + ">";
        });

    py::class_<Primitive>(m, "Primitive")
        .def(py::init<double, double, double>(), py::arg("h"), py::arg("u"), py::arg("v"))
        .def_readwrite("h", &Primitive::h)
        .def_readwrite("u", &Primitive::u)
        .def_readwrite("v", &Primitive::v)
        .def_static("from_conserved", &Primitive::from_conserved,
                    py::arg("q"), py::arg("b"), py::arg("drytol"))
        .def("to_conserved", &Primitive::to_conserved, py::arg("b"))
        .def("__repr__", [](const Primitive& p) {
            return "<Primitive h=" + std::to_string(p.h) +
                   " u=" + std::to_string(p.u) +
                   " v=" + std::to_string(p.v) + ">";
        });

    // ------------------------------------------
    // 2. Configuration and logging
    py::class_<Parameters>(m, "Parameters")
        .def(py::init([](double theta, double drytol, double tol) {
                 Parameters p(theta, drytol, tol);
                 p.validate();
                 return p;
             }),
             py::arg("theta") = 1.3, py::arg("drytol") = 1e-4, py::arg("tol") = 1e-12)
        .def_readonly("theta", &Parameters::theta)
        .def_readonly("drytol", &Parameters::drytol)
        .def_readonly("tol", &Parameters::tol)
        .def("__repr__", [](const Parameters& p) {
            return "<Parameters theta=" + std::to_string(p.theta) +
                   " drytol=" + std::to_string(p.drytol) +
                   " tol=" + std::to_string(p.tol) + ">";
        });

    py::enum_<LogProfile>(m, "LogProfile")
        .value("quiet", LogProfile::quiet)
        .value("normal", LogProfile::normal)
        .value("debug", LogProfile::debug)
        .export_values();

    m.def("set_log_level", [](const std::string& level) {
        bool valid = false;
        LogProfile profile = parse_log_profile(level, &valid);
        if (!valid) {
            throw std::invalid_argument("unknown log level '" + level + "' (quiet, normal, debug)");
        }
        global_log_profile = profile;
    }, py::arg("level"));
    m.def("get_log_level", []() { return std::string(log_profile_name(global_log_profile)); });

    // ------------------------------------------
    // 3. Grid and topography
    py::class_<Grid>(m, "Grid")
        .def(py::init<int, int, int, double, double>(),
             py::arg("nx"), py::arg("ny"), py::arg("ngh") = 2, py::arg("dx") = 1.0, py::arg("dy") = 1.0)
        .def_readonly("nx", &Grid::nx)
        .def_readonly("ny", &Grid::ny)
        .def_readonly("ngh", &Grid::ngh)
        .def_readonly("dx", &Grid::dx)
        .def_readonly("dy", &Grid::dy);

    py::class_<Topography>(m, "Topography")
        .def(py::init([](const Grid& grid, DoubleArray cntr, DoubleArray xfcntr, DoubleArray yfcntr) {
                 return Topography(grid, from_numpy(cntr, "topo.cntr"),
                                   from_numpy(xfcntr, "topo.xfcntr"), from_numpy(yfcntr, "topo.yfcntr"));
             }),
             py::arg("grid"), py::arg("cntr"), py::arg("xfcntr"), py::arg("yfcntr"))
        .def_static("from_vertices", [](const Grid& grid, DoubleArray vert) {
                 return Topography::from_vertices(grid, from_numpy(vert, "topo.vert"));
             }, py::arg("grid"), py::arg("vert"))
        .def_property_readonly("cntr",   [](py::object self) { return as_readonly_numpy(self.cast<Topography&>().cntr, self); })
        .def_property_readonly("xfcntr", [](py::object self) { return as_readonly_numpy(self.cast<Topography&>().xfcntr, self); })
        .def_property_readonly("yfcntr", [](py::object self) { return as_readonly_numpy(self.cast<Topography&>().yfcntr, self); });

    // ------------------------------------------
    // 4. State containers (arrays are views, writes go straight to C++ memory)
    py::class_<WHUHV>(m, "WHUHV")
        .def_property_readonly("w",  [](py::object self) { return as_numpy(self.cast<WHUHV&>().w, self); })
        .def_property_readonly("hu", [](py::object self) { return as_numpy(self.cast<WHUHV&>().hu, self); })
        .def_property_readonly("hv", [](py::object self) { return as_numpy(self.cast<WHUHV&>().hv, self); });

    py::class_<HUV>(m, "HUV")
        .def_property_readonly("h", [](py::object self) { return as_numpy(self.cast<HUV&>().h, self); })
        .def_property_readonly("u", [](py::object self) { return as_numpy(self.cast<HUV&>().u, self); })
        .def_property_readonly("v", [](py::object self) { return as_numpy(self.cast<HUV&>().v, self); });

    py::class_<FaceState>(m, "FaceState")
        .def_readonly("Q", &FaceState::Q)
        .def_readonly("U", &FaceState::U);

    py::class_<FacePair>(m, "FacePair")
        .def_readonly("minus", &FacePair::minus)
        .def_readonly("plus", &FacePair::plus);

    py::class_<Faces>(m, "Faces")
        .def_readonly("x", &Faces::x)
        .def_readonly("y", &Faces::y);

    py::class_<Slopes>(m, "Slopes")
        .def_readonly("x", &Slopes::x)
        .def_readonly("y", &Slopes::y);

    py::class_<States>(m, "States")
        .def(py::init<const Grid&>(), py::arg("grid"))
        .def_readonly("Q", &States::Q)
        .def_readonly("U", &States::U)
        .def_readonly("slp", &States::slp)
        .def_readonly("face", &States::face)
        .def("check", &States::check, py::arg("grid"));

    // ------------------------------------------
    // 5. Bind Reconstructors
    py::class_<Reconstructor, std::shared_ptr<Reconstructor>>(m, "Reconstructor")
        .def_property_readonly("params", &Reconstructor::params)
        .def("reconstruct", &Reconstructor::reconstruct,
             py::arg("states"), py::arg("grid"), py::arg("topo"),
             "Overwrite states.U and the face states from states.Q");

    py::class_<PiecewiseConstantReconstructor, Reconstructor, std::shared_ptr<PiecewiseConstantReconstructor>>(m, "PiecewiseConstantReconstructor")
        .def(py::init<const Parameters&>(), py::arg("params") = Parameters());

    py::class_<MinmodReconstructor, Reconstructor, std::shared_ptr<MinmodReconstructor>>(m, "MinmodReconstructor")
        .def(py::init<const Parameters&>(), py::arg("params") = Parameters());

    // ------------------------------------------
    // 6. Individual stages
    py::class_<DepthCorrection>(m, "DepthCorrection")
        .def_readonly("x_pairs", &DepthCorrection::x_pairs)
        .def_readonly("y_pairs", &DepthCorrection::y_pairs)
        .def_readonly("boundary", &DepthCorrection::boundary);

    m.def("minmod_slope", &minmod_slope,
          py::arg("states"), py::arg("grid"), py::arg("theta"), py::arg("tol"));
    m.def("get_discontinuous_cnsrv_q", &get_discontinuous_cnsrv_q,
          py::arg("states"), py::arg("grid"));
    m.def("correct_negative_depth", &correct_negative_depth,
          py::arg("states"), py::arg("grid"), py::arg("topo"), py::arg("tol"));
    m.def("decompose_variables", &decompose_variables,
          py::arg("states"), py::arg("grid"), py::arg("topo"), py::arg("drytol"));
}
