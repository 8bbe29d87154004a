#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include "clouds.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace py = pybind11;

namespace {

// Zero-copy (width, depth, height) view on a field owned by `self`.
py::array_t<uint8_t> fieldView(const CloudAutomaton& c, const CellField& f, py::handle self)
{
    const Dimensions& d = c.dimensions();
    return py::array_t<uint8_t>(
        {d.width, d.depth, d.height},
        {sizeof(uint8_t) * d.depth * d.height,
         sizeof(uint8_t) * d.height,
         sizeof(uint8_t)},
        f.data(),
        self
    );
}

void warnDiagnostic(const std::string& message)
{
    py::gil_scoped_acquire gil;
    if (PyErr_WarnEx(PyExc_RuntimeWarning, message.c_str(), 1) != 0)
        throw py::error_already_set();
}

} // namespace

PYBIND11_MODULE(clouds3D_cpp, m)
{
    m.doc() = "Cellular automaton cloud simulation C++ backend";

    // ---------------- Errors ----------------
    py::register_exception<InvalidDimension>(m, "InvalidDimension", PyExc_ValueError);
    py::register_exception<UnsupportedBackend>(m, "UnsupportedBackend", PyExc_ValueError);

    // ---------------- CloudAutomaton ----------------
    py::class_<CloudAutomaton>(m, "CloudAutomaton")
        .def(py::init([](int width, int depth, int height,
                         const std::string& device, py::object seed) {
                 std::unique_ptr<CloudAutomaton> c;
                 if (seed.is_none())
                     c.reset(new CloudAutomaton(width, depth, height, device));
                 else
                     c.reset(new CloudAutomaton(width, depth, height, device,
                                                seed.cast<std::uint32_t>()));
                 c->setDiagnosticSink(warnDiagnostic);
                 return c;
             }),
             py::arg("width"), py::arg("depth"), py::arg("height"),
             py::arg("device") = "cpu", py::arg("seed") = py::none())

        .def("init_elliptic_probabilities",
             py::overload_cast<double, double, double, double, double, double,
                               long, long, long, double, double>(&CloudAutomaton::initElliptic),
             py::arg("c_x"), py::arg("c_y"), py::arg("c_z"),
             py::arg("f_x"), py::arg("f_y"), py::arg("f_z"),
             py::arg("P_hum0"), py::arg("P_act0"), py::arg("P_ext0"),
             py::arg("radius") = 1.0, py::arg("overlap") = 1.0)

        .def("step", &CloudAutomaton::step)
        .def("simulate", &CloudAutomaton::simulate, py::arg("n_iterations"))

        .def("shape",
             [](const CloudAutomaton& c) {
                 const Dimensions& d = c.dimensions();
                 return py::make_tuple(d.width, d.depth, d.height);
             })

        .def_property_readonly("device", &CloudAutomaton::device)

        // (N, 3) copy of the cloud cell coordinates
        .def("get_cloud_positions",
             [](const CloudAutomaton& c) {
                 const std::vector<CellPosition> pos = c.getCloudPositions();
                 py::array_t<int> out({static_cast<py::ssize_t>(pos.size()),
                                       static_cast<py::ssize_t>(3)});
                 auto r = out.mutable_unchecked<2>();
                 for (py::ssize_t n = 0; n < static_cast<py::ssize_t>(pos.size()); ++n) {
                     r(n, 0) = pos[n].x;
                     r(n, 1) = pos[n].y;
                     r(n, 2) = pos[n].z;
                 }
                 return out;
             })

        .def("cloud_bounds",
             [](const CloudAutomaton& c) -> py::object {
                 const CloudBounds b = c.cloudBounds();
                 if (b.empty) return py::none();
                 return py::make_tuple(py::make_tuple(b.min.x, b.min.y, b.min.z),
                                       py::make_tuple(b.max.x, b.max.y, b.max.z));
             })

        .def("count_cloud", &CloudAutomaton::countCloud)

        // ZERO-COPY NumPy views
        .def("cloud",
             [](py::object self) {
                 const CloudAutomaton& c = self.cast<const CloudAutomaton&>();
                 return fieldView(c, c.cloud(), self);
             })
        .def("humidity",
             [](py::object self) {
                 const CloudAutomaton& c = self.cast<const CloudAutomaton&>();
                 return fieldView(c, c.humidity(), self);
             })
        .def("activation",
             [](py::object self) {
                 const CloudAutomaton& c = self.cast<const CloudAutomaton&>();
                 return fieldView(c, c.activation(), self);
             });
}
