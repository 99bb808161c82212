#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "../src/WordHasher.hpp"
#include "../src/core/GeoWordsError.hpp"
#include "../src/io/WordListLoader.hpp"

namespace py = pybind11;
using namespace GeoWords;

PYBIND11_MODULE(geowords, m) {
    m.doc() = "Python bindings for GeoWords - coordinates to word addresses";

    py::register_exception<GeoWordsError>(m, "GeoWordsError", PyExc_ValueError);
    py::register_exception<UnknownWordError>(m, "UnknownWordError", PyExc_ValueError);

    py::class_<BaseWordLists, std::shared_ptr<BaseWordLists>>(m, "WordLists");

    m.def("load_word_lists", [](const std::string& directory) {
        auto lists = WordListLoader::loadBaseWordLists(
            directory.empty() ? WordListConfig::defaults() : WordListConfig::fromDirectory(directory));
        // pybind11 holders cannot be const
        return std::const_pointer_cast<BaseWordLists>(lists);
    }, py::arg("directory") = "");

    py::class_<WordHasher>(m, "WordHasher")
        .def(py::init([](std::shared_ptr<BaseWordLists> lists, std::optional<std::string> key) {
            return WordHasher(std::move(lists), std::move(key));
        }), py::arg("lists"), py::arg("key") = py::none())
        .def("encode", py::overload_cast<double, double, size_t>(&WordHasher::encode, py::const_),
             py::arg("lat"), py::arg("lon"), py::arg("words") = 3)
        .def("encode_string", py::overload_cast<const std::string&, size_t>(&WordHasher::encode, py::const_),
             py::arg("coordinates"), py::arg("words") = 3)
        .def("three_words", &WordHasher::threeWords)
        .def("four_words", &WordHasher::fourWords)
        .def("six_words", &WordHasher::sixWords)
        .def("decode", py::overload_cast<const std::string&>(&WordHasher::decode, py::const_),
             py::arg("address"))
        .def("decode", py::overload_cast<const std::string&, size_t>(&WordHasher::decode, py::const_),
             py::arg("address"), py::arg("words"))
        .def_property_readonly("has_key", &WordHasher::hasKey)
        .def("__repr__", [](const WordHasher& self) {
            return std::string("WordHasher(keyed=") + (self.hasKey() ? "True" : "False") + ")";
        });

    // Add version information
    m.attr("__version__") = "1.0.0";
}
