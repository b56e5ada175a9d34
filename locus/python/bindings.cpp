#include <filesystem>
#include <iterator>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "locus/locus.hpp"

namespace py = pybind11;

namespace {

py::bytes read_bytes(const locus::Resource& resource) {
    auto stream = resource.open_stream();
    std::string content((std::istreambuf_iterator<char>(*stream)), std::istreambuf_iterator<char>());
    return py::bytes(content);
}

} // anonymous namespace

PYBIND11_MODULE(pylocus, m) {
    m.doc() = "Pluggable resource resolution - Python bindings";

    // Error codes
    py::enum_<locus::ErrorCode>(m, "ErrorCode")
        .value("NotFound", locus::ErrorCode::NotFound)
        .value("Unresolvable", locus::ErrorCode::Unresolvable)
        .value("MalformedLocation", locus::ErrorCode::MalformedLocation)
        .value("AdapterFailure", locus::ErrorCode::AdapterFailure)
        .value("IOError", locus::ErrorCode::IOError)
        .value("ConfigError", locus::ErrorCode::ConfigError)
        .export_values();

    // LocusError exception
    py::register_exception<locus::LocusError>(m, "LocusError");

    // Resource: queries only, content is returned as bytes
    py::class_<locus::Resource, locus::ResourcePtr>(m, "Resource")
        .def("exists", &locus::Resource::exists)
        .def("readable", &locus::Resource::readable)
        .def("is_open", &locus::Resource::is_open)
        .def("is_file", &locus::Resource::is_file)
        .def("url", [](const locus::Resource& r) { return r.get_url().to_string(); })
        .def("uri", &locus::Resource::get_uri)
        .def("file", [](const locus::Resource& r) { return r.get_file().string(); })
        .def("content_length", &locus::Resource::content_length)
        .def("last_modified", &locus::Resource::last_modified)
        .def("create_relative", &locus::Resource::create_relative, py::arg("relative_path"))
        .def("filename", &locus::Resource::filename)
        .def("description", &locus::Resource::description)
        .def("read", &read_bytes, "Read the whole content")
        .def("__eq__", [](const locus::Resource& a, const locus::Resource& b) { return a == b; })
        .def("__hash__", &locus::Resource::hash)
        .def("__str__", &locus::Resource::description)
        .def("__repr__", [](const locus::Resource& r) {
            return "Resource('" + r.description() + "')";
        });

    // DefaultResourceLoader class
    py::class_<locus::DefaultResourceLoader>(m, "DefaultResourceLoader")
        .def(py::init<>())
        .def(py::init([](const std::vector<std::string>& roots) {
            std::vector<std::filesystem::path> paths(roots.begin(), roots.end());
            return std::make_unique<locus::DefaultResourceLoader>(locus::ClassPath(paths));
        }), py::arg("class_path"))
        .def("get_resource", &locus::DefaultResourceLoader::get_resource, py::arg("location"))
        .def("add_alias", [](locus::DefaultResourceLoader& loader, const std::string& prefix, const std::string& target) {
            loader.add_protocol_resolver(std::make_shared<locus::PrefixProtocolResolver>(prefix, target));
        }, py::arg("prefix"), py::arg("target"), "Rewrite a location prefix before resolution")
        .def("add_protocol_resolver", [](locus::DefaultResourceLoader& loader, py::function fn) {
            // Python callables return None for locations they do not handle
            loader.add_protocol_resolver([fn](const std::string& location, locus::ResourceLoader&) -> locus::ResourcePtr {
                py::gil_scoped_acquire gil;
                py::object result = fn(location);
                if (result.is_none()) {
                    return nullptr;
                }
                return result.cast<locus::ResourcePtr>();
            });
        }, py::arg("resolver"))
        .def("resolver_count", [](const locus::DefaultResourceLoader& loader) {
            return loader.protocol_resolvers().size();
        })
        .def("class_path", [](const locus::DefaultResourceLoader& loader) {
            return loader.class_path().to_string();
        });

    // FileSystemResourceLoader class
    py::class_<locus::FileSystemResourceLoader, locus::DefaultResourceLoader>(m, "FileSystemResourceLoader")
        .def(py::init<>())
        .def(py::init([](const std::vector<std::string>& roots) {
            std::vector<std::filesystem::path> paths(roots.begin(), roots.end());
            return std::make_unique<locus::FileSystemResourceLoader>(locus::ClassPath(paths));
        }), py::arg("class_path"));

    // load_config: YAML config -> configured loader
    m.def("load_config", [](const std::string& config_path) {
        return locus::LoaderConfig::from_file(config_path).create_loader();
    }, py::arg("config_path"), "Create a loader from a YAML config file");
}
