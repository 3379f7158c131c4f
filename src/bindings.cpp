#include <pybind11/pybind11.h>
#include <pybind11/functional.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include <cpl_error.h>

#include "rastermath/rastermath.hpp"

namespace py = pybind11;
namespace rm = rastermath;

namespace {

rm::NumericType dtype_to_numeric(const py::array& array) {
    std::string name = py::str(array.dtype().attr("name"));
    try {
        return rm::numeric_type_from_name(name);
    } catch (const std::invalid_argument&) {
        if (name.rfind("int", 0) == 0 || name.rfind("uint", 0) == 0) {
            CPLError(CE_Warning, CPLE_AppDefined,
                     "Numpy type %s is not recognized by GDAL, int32 is used instead", name.c_str());
            return rm::NumericType::Int32;
        }
        throw;
    }
}

py::array to_numpy(const rm::Matrix& matrix) {
    std::vector<ssize_t> shape;
    if (matrix.ndim() == 1) {
        shape = {static_cast<ssize_t>(matrix.rows())};
    } else {
        shape = {static_cast<ssize_t>(matrix.rows()), static_cast<ssize_t>(matrix.cols())};
    }

    py::array_t<double> values(shape);
    std::copy(matrix.data(), matrix.data() + matrix.size(), values.mutable_data());
    return values.attr("astype")(rm::numeric_type_name(matrix.type()));
}

rm::Matrix from_numpy(const py::object& object) {
    py::array array = py::array::ensure(object);
    if (!array) throw std::invalid_argument("Block function must return an array");

    rm::NumericType type = dtype_to_numeric(array);
    auto values = py::array_t<double, py::array::c_style | py::array::forcecast>::ensure(array);

    std::vector<double> data(values.data(), values.data() + values.size());
    if (values.ndim() == 1) {
        return rm::Matrix::vector(std::move(data), type);
    }
    if (values.ndim() == 2) {
        return rm::Matrix(static_cast<size_t>(values.shape(0)), static_cast<size_t>(values.shape(1)),
                          std::move(data), type);
    }
    throw std::invalid_argument("Block function must return a 1-D or 2-D array");
}

rm::FunctionArgs to_args(const py::kwargs& kwargs) {
    rm::FunctionArgs args;
    for (const auto& item : kwargs) {
        std::string key = py::str(item.first);
        py::handle value = item.second;
        if (py::isinstance<py::bool_>(value)) {
            args.set(key, value.cast<bool>());
        } else if (py::isinstance<py::int_>(value)) {
            args.set(key, value.cast<int64_t>());
        } else if (py::isinstance<py::float_>(value)) {
            args.set(key, value.cast<double>());
        } else if (py::isinstance<py::str>(value)) {
            args.set(key, value.cast<std::string>());
        } else {
            throw std::invalid_argument("Unsupported type for function argument " + key);
        }
    }
    return args;
}

py::dict to_kwargs(const rm::FunctionArgs& args) {
    py::dict kwargs;
    for (const auto& [name, value] : args) {
        std::visit([&kwargs, &name](const auto& v) { kwargs[py::str(name)] = py::cast(v); }, value);
    }
    return kwargs;
}

rm::BlockFunction wrap_callable(py::function fn) {
    return [fn](const rm::Matrix& input, const rm::FunctionArgs& args) {
        return from_numpy(fn(to_numpy(input), **to_kwargs(args)));
    };
}

std::string callable_name(const py::function& fn) {
    return py::str(py::getattr(fn, "__name__", py::str("function")));
}

} // namespace

PYBIND11_MODULE(_rastermath_cpp, m) {
    m.doc() = "rastermath C++ backend: block-wise raster processing";
    m.attr("__version__") = rm::VERSION;

    auto base = py::register_exception<rm::Error>(m, "RasterMathError");
    py::register_exception<rm::OpenFailure>(m, "OpenFailure", base.ptr());
    py::register_exception<rm::ExtentMismatch>(m, "ExtentMismatch", base.ptr());
    py::register_exception<rm::AllocationFailure>(m, "AllocationFailure", base.ptr());
    py::register_exception<rm::BandOverflow>(m, "BandOverflow", base.ptr());
    py::register_exception<rm::ShapeMismatch>(m, "ShapeMismatch", base.ptr());
    py::register_exception<rm::FunctionFailure>(m, "FunctionFailure", base.ptr());
    py::register_exception<rm::RasterIOError>(m, "RasterIOError", base.ptr());

    py::class_<rm::Window>(m, "Window")
        .def_readonly("col", &rm::Window::col)
        .def_readonly("row", &rm::Window::row)
        .def_readonly("width", &rm::Window::width)
        .def_readonly("height", &rm::Window::height)
        .def("__repr__", [](const rm::Window& w) {
            return "Window(col=" + std::to_string(w.col) + ", row=" + std::to_string(w.row) +
                   ", width=" + std::to_string(w.width) + ", height=" + std::to_string(w.height) + ")";
        });

    py::class_<rm::BlockGrid>(m, "BlockGrid")
        .def(py::init<int, int, int, int>(),
             py::arg("width"), py::arg("height"), py::arg("block_width"), py::arg("block_height"))
        .def("__len__", &rm::BlockGrid::size)
        .def("__iter__", [](const rm::BlockGrid& grid) {
            return py::make_iterator(grid.begin(), grid.end());
        }, py::keep_alive<0, 1>())
        .def("window_at", &rm::BlockGrid::window_at, py::arg("col"), py::arg("row"));

    m.def("raster_type_for", [](double min_value, double max_value, bool integral) {
        return static_cast<int>(rm::raster_type_for(min_value, max_value, integral));
    }, py::arg("min_value"), py::arg("max_value"), py::arg("integral") = true);
    m.def("gdal_type_from_numpy", [](const std::string& name) {
        return static_cast<int>(rm::to_gdal(rm::numeric_type_from_name(name)));
    }, py::arg("dtype_name"));
    m.def("numpy_type_from_gdal", [](int code) {
        return rm::numeric_type_name(rm::from_gdal(static_cast<GDALDataType>(code)));
    }, py::arg("gdal_type"));
    m.def("otb_type_name", [](int code) {
        return rm::otb_type_name(static_cast<GDALDataType>(code));
    }, py::arg("gdal_type"));

    py::enum_<rm::RunState>(m, "RunState")
        .value("Idle", rm::RunState::Idle)
        .value("Running", rm::RunState::Running)
        .value("Completed", rm::RunState::Completed)
        .value("Cancelled", rm::RunState::Cancelled)
        .value("Failed", rm::RunState::Failed);

    py::class_<rm::OutputReport>(m, "OutputReport")
        .def_readonly("path", &rm::OutputReport::path)
        .def_readonly("function_name", &rm::OutputReport::function_name)
        .def_readonly("band_count", &rm::OutputReport::band_count)
        .def_property_readonly("data_type", [](const rm::OutputReport& r) {
            return static_cast<int>(r.data_type);
        })
        .def_readonly("nodata", &rm::OutputReport::nodata);

    py::class_<rm::RunSummary>(m, "RunSummary")
        .def_readonly("state", &rm::RunSummary::state)
        .def_readonly("windows_processed", &rm::RunSummary::windows_processed)
        .def_readonly("total_windows", &rm::RunSummary::total_windows)
        .def_readonly("outputs", &rm::RunSummary::outputs);

    py::class_<rm::BlockProcessingEngine>(m, "Engine")
        .def(py::init([](const std::string& raster, const std::string& mask,
                         std::optional<uint32_t> seed, int block_width, int block_height) {
            auto options = rm::EngineOptions::from_config();
            if (seed) options.seed = *seed;
            if (block_width > 0) options.block_width = block_width;
            if (block_height > 0) options.block_height = block_height;
            return std::make_unique<rm::BlockProcessingEngine>(raster, mask, options);
        }), py::arg("in_raster"), py::arg("in_mask_raster") = "", py::arg("seed") = py::none(),
            py::arg("block_width") = 0, py::arg("block_height") = 0)
        .def("add_function", [](rm::BlockProcessingEngine& engine, py::function fn,
                                const std::string& out_raster, std::optional<int> out_n_band,
                                std::optional<int> out_gdal_dt, std::optional<double> out_nodata,
                                bool value_range, py::kwargs kwargs) {
            rm::OutputRequest request;
            request.path = out_raster;
            request.band_count = out_n_band;
            if (out_gdal_dt) request.data_type = static_cast<GDALDataType>(*out_gdal_dt);
            request.nodata = out_nodata;
            request.args = to_args(kwargs);
            if (value_range) request.type_policy = rm::TypePolicy::ValueRange;

            const auto& spec = engine.add_function(callable_name(fn), wrap_callable(fn),
                                                   std::move(request));
            return py::make_tuple(spec.band_count, static_cast<int>(spec.data_type));
        }, py::arg("function"), py::arg("out_raster"), py::arg("out_n_band") = py::none(),
           py::arg("out_gdal_dt") = py::none(), py::arg("out_nodata") = py::none(),
           py::arg("value_range") = false)
        .def("run", [](rm::BlockProcessingEngine& engine, bool verbose,
                       std::optional<py::function> cancel) {
            rm::TermProgress progress;
            engine.set_progress(verbose ? &progress : nullptr);
            if (cancel) {
                py::function hook = *cancel;
                engine.set_cancel_hook([hook]() { return hook().cast<bool>(); });
            }
            return engine.run();
        }, py::arg("verbose") = false, py::arg("cancel") = py::none())
        .def("random_block", [](rm::BlockProcessingEngine& engine) {
            return to_numpy(engine.random_block());
        })
        .def_property_readonly("state", &rm::BlockProcessingEngine::state)
        .def_property_readonly("position", &rm::BlockProcessingEngine::position)
        .def_property_readonly("total_windows", &rm::BlockProcessingEngine::total_windows)
        .def_property_readonly("nodata", &rm::BlockProcessingEngine::nodata);

    m.def("extract_samples", [](const std::string& raster, const std::vector<std::string>& labels,
                                bool get_coords, bool only_coords) {
        rm::ExtractionOptions options;
        options.with_coords = get_coords;
        options.only_coords = only_coords;
        rm::SampleSet samples = rm::extract_samples(raster, labels, options);

        py::array_t<int> coords({static_cast<ssize_t>(samples.coords.size()), ssize_t{2}});
        auto c = coords.mutable_unchecked<2>();
        for (size_t i = 0; i < samples.coords.size(); i++) {
            c(i, 0) = samples.coords[i][0];
            c(i, 1) = samples.coords[i][1];
        }
        if (only_coords) return py::object(coords);

        py::list result;
        result.append(to_numpy(samples.values));
        for (const auto& field : samples.labels) result.append(py::array(py::cast(field)));
        if (get_coords) result.append(coords);
        return py::object(result);
    }, py::arg("in_raster"), py::arg("label_rasters"), py::arg("get_coords") = false,
       py::arg("only_coords") = false);
}
