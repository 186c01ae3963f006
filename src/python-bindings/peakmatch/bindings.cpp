#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

#include "pybind11/eigen.h"
#include "pybind11/pybind11.h"
#include "pybind11/stl.h"

#include "assignment/assignment.hpp"
#include "assignment/assignment_serialize.hpp"
#include "proximity/proximity.hpp"
#include "reconcile/reconcile.hpp"
#include "records/records.hpp"
#include "records/records_files.hpp"
#include "records/records_serialize.hpp"
#include "score_matrix/score_matrix.hpp"
#include "spectral/spectral.hpp"
#include "utils/compression.hpp"

namespace py = pybind11;

namespace PythonAPI {
Spectral::Tolerance make_tolerance(std::optional<double> mz_tol,
                                   std::optional<double> ppm) {
    Spectral::Tolerance tolerance = {mz_tol, ppm};
    if (!mz_tol && !ppm) {
        tolerance = Spectral::absolute_tolerance(Spectral::DEFAULT_MZ_TOLERANCE);
    }
    return tolerance;
}

ScoreMatrix::Parameters make_parameters(double w_ms, double w_rt,
                                        double w_lmax,
                                        std::optional<double> mz_tol,
                                        std::optional<double> ppm,
                                        double rt_sigma, double lmax_sigma,
                                        bool normalize_spectra) {
    ScoreMatrix::Parameters parameters;
    parameters.weights = {w_ms, w_rt, w_lmax};
    parameters.tolerance = make_tolerance(mz_tol, ppm);
    parameters.rt_sigma = rt_sigma;
    parameters.lmax_sigma = lmax_sigma;
    parameters.normalize_spectra = normalize_spectra;
    ScoreMatrix::validate(parameters);
    return parameters;
}

Assignment::Strategy parse_strategy(const std::string &name) {
    auto strategy = Assignment::parse_strategy(name);
    if (!strategy) {
        std::ostringstream error_stream;
        error_stream << "unknown solver '" << name
                     << "'. choose between 'exact' (default) and 'greedy'";
        throw std::invalid_argument(error_stream.str());
    }
    return strategy.value();
}

double cosine_similarity(const Records::Spectrum &predicted,
                         const Records::Spectrum &observed,
                         std::optional<double> mz_tol,
                         std::optional<double> ppm, bool normalize) {
    return Spectral::cosine_similarity(predicted, observed,
                                       make_tolerance(mz_tol, ppm), normalize);
}

ScoreMatrix::Matrix build_score_matrix(
    const std::vector<Records::PredictedRecord> &predicted,
    const std::vector<Records::ObservedRecord> &observed,
    const ScoreMatrix::Parameters &parameters, size_t max_threads) {
    pybind11::gil_scoped_release release;
    if (max_threads == 0) {
        max_threads = std::thread::hardware_concurrency();
    }
    if (max_threads > 1) {
        return ScoreMatrix::build_parallel(predicted, observed, parameters,
                                           max_threads);
    }
    return ScoreMatrix::build_serial(predicted, observed, parameters);
}

Assignment::Result solve(const ScoreMatrix::Matrix &score_matrix,
                         std::string &solver_name) {
    auto solver = Assignment::make_solver(parse_strategy(solver_name));
    pybind11::gil_scoped_release release;
    return solver->solve(score_matrix);
}

Reconcile::Result reconcile(
    const std::vector<Records::PredictedRecord> &predicted,
    const std::vector<Records::ObservedRecord> &observed,
    const ScoreMatrix::Parameters &parameters, std::string &solver_name,
    size_t max_threads) {
    auto solver = Assignment::make_solver(parse_strategy(solver_name));
    pybind11::gil_scoped_release release;
    if (max_threads == 0) {
        max_threads = std::thread::hardware_concurrency();
    }
    return Reconcile::reconcile(predicted, observed, parameters, *solver,
                                max_threads);
}

std::vector<Records::PredictedRecord> read_predicted_tsv(
    std::string &input_file) {
    std::ifstream stream;
    stream.open(input_file);
    if (!stream) {
        std::ostringstream error_stream;
        error_stream << "error: couldn't open input file " << input_file;
        throw std::invalid_argument(error_stream.str());
    }
    std::vector<Records::PredictedRecord> records;
    if (!Records::Files::Tsv::read_predicted(stream, &records)) {
        std::ostringstream error_stream;
        error_stream << "error: couldn't read the predicted records from "
                     << input_file;
        throw std::invalid_argument(error_stream.str());
    }
    return records;
}

std::vector<Records::ObservedRecord> read_observed_tsv(
    std::string &input_file) {
    std::ifstream stream;
    stream.open(input_file);
    if (!stream) {
        std::ostringstream error_stream;
        error_stream << "error: couldn't open input file " << input_file;
        throw std::invalid_argument(error_stream.str());
    }
    std::vector<Records::ObservedRecord> records;
    if (!Records::Files::Tsv::read_observed(stream, &records)) {
        std::ostringstream error_stream;
        error_stream << "error: couldn't read the observed records from "
                     << input_file;
        throw std::invalid_argument(error_stream.str());
    }
    return records;
}

void write_predicted_records(
    const std::vector<Records::PredictedRecord> &records,
    std::string &output_file) {
    pybind11::gil_scoped_release release;
    Compression::DeflateStream stream;
    stream.open(output_file);
    if (!stream) {
        pybind11::gil_scoped_acquire acquire;
        std::ostringstream error_stream;
        error_stream << "error: couldn't open output file " << output_file;
        throw std::invalid_argument(error_stream.str());
    }
    if (!Records::Serialize::write_predicted_records(stream, records)) {
        pybind11::gil_scoped_acquire acquire;
        std::ostringstream error_stream;
        error_stream << "error: couldn't write the records into the output file "
                     << output_file;
        throw std::invalid_argument(error_stream.str());
    }
}

std::vector<Records::PredictedRecord> read_predicted_records(
    std::string &input_file) {
    pybind11::gil_scoped_release release;
    Compression::InflateStream stream;
    stream.open(input_file);
    if (!stream) {
        pybind11::gil_scoped_acquire acquire;
        std::ostringstream error_stream;
        error_stream << "error: couldn't open input file " << input_file;
        throw std::invalid_argument(error_stream.str());
    }
    std::vector<Records::PredictedRecord> records;
    if (!Records::Serialize::read_predicted_records(stream, &records)) {
        pybind11::gil_scoped_acquire acquire;
        std::ostringstream error_stream;
        error_stream << "error: couldn't read the records from the input file "
                     << input_file;
        throw std::invalid_argument(error_stream.str());
    }
    return records;
}

void write_observed_records(const std::vector<Records::ObservedRecord> &records,
                            std::string &output_file) {
    pybind11::gil_scoped_release release;
    Compression::DeflateStream stream;
    stream.open(output_file);
    if (!stream) {
        pybind11::gil_scoped_acquire acquire;
        std::ostringstream error_stream;
        error_stream << "error: couldn't open output file " << output_file;
        throw std::invalid_argument(error_stream.str());
    }
    if (!Records::Serialize::write_observed_records(stream, records)) {
        pybind11::gil_scoped_acquire acquire;
        std::ostringstream error_stream;
        error_stream << "error: couldn't write the records into the output file "
                     << output_file;
        throw std::invalid_argument(error_stream.str());
    }
}

std::vector<Records::ObservedRecord> read_observed_records(
    std::string &input_file) {
    pybind11::gil_scoped_release release;
    Compression::InflateStream stream;
    stream.open(input_file);
    if (!stream) {
        pybind11::gil_scoped_acquire acquire;
        std::ostringstream error_stream;
        error_stream << "error: couldn't open input file " << input_file;
        throw std::invalid_argument(error_stream.str());
    }
    std::vector<Records::ObservedRecord> records;
    if (!Records::Serialize::read_observed_records(stream, &records)) {
        pybind11::gil_scoped_acquire acquire;
        std::ostringstream error_stream;
        error_stream << "error: couldn't read the records from the input file "
                     << input_file;
        throw std::invalid_argument(error_stream.str());
    }
    return records;
}

void write_assignment(const Assignment::Result &result,
                      std::string &output_file) {
    pybind11::gil_scoped_release release;
    Compression::DeflateStream stream;
    stream.open(output_file);
    if (!stream) {
        pybind11::gil_scoped_acquire acquire;
        std::ostringstream error_stream;
        error_stream << "error: couldn't open output file " << output_file;
        throw std::invalid_argument(error_stream.str());
    }
    if (!Assignment::Serialize::write_result(stream, result)) {
        pybind11::gil_scoped_acquire acquire;
        std::ostringstream error_stream;
        error_stream
            << "error: couldn't write the assignment into the output file "
            << output_file;
        throw std::invalid_argument(error_stream.str());
    }
}

Assignment::Result read_assignment(std::string &input_file) {
    pybind11::gil_scoped_release release;
    Compression::InflateStream stream;
    stream.open(input_file);
    if (!stream) {
        pybind11::gil_scoped_acquire acquire;
        std::ostringstream error_stream;
        error_stream << "error: couldn't open input file " << input_file;
        throw std::invalid_argument(error_stream.str());
    }
    Assignment::Result result;
    if (!Assignment::Serialize::read_result(stream, &result)) {
        pybind11::gil_scoped_acquire acquire;
        std::ostringstream error_stream;
        error_stream << "error: couldn't read the assignment from the input "
                        "file "
                     << input_file;
        throw std::invalid_argument(error_stream.str());
    }
    return result;
}

std::string to_string(const std::optional<double> &value) {
    if (!value) {
        return "None";
    }
    return std::to_string(value.value());
}
}  // namespace PythonAPI

PYBIND11_MODULE(peakmatch, m) {
    // Documentation.
    m.doc() = "peakmatch documentation";

    // Records.
    py::class_<Records::Spectrum>(m, "Spectrum")
        .def(py::init<>())
        .def(py::init<std::vector<double>, std::vector<double>>(),
             py::arg("mz"), py::arg("intensity"))
        .def_readwrite("mz", &Records::Spectrum::mz)
        .def_readwrite("intensity", &Records::Spectrum::intensity)
        .def("__repr__", [](const Records::Spectrum &s) {
            return "Spectrum <num_peaks: " + std::to_string(s.mz.size()) + ">";
        });

    py::class_<Records::PredictedRecord>(m, "PredictedRecord")
        .def(py::init<>())
        .def(py::init<std::string, std::optional<Records::Spectrum>,
                      std::optional<double>, std::optional<double>>(),
             py::arg("label"), py::arg("spectrum") = py::none(),
             py::arg("rt") = py::none(), py::arg("lmax") = py::none())
        .def_readwrite("label", &Records::PredictedRecord::label)
        .def_readwrite("spectrum", &Records::PredictedRecord::spectrum)
        .def_readwrite("rt", &Records::PredictedRecord::rt)
        .def_readwrite("lmax", &Records::PredictedRecord::lmax)
        .def("__repr__", [](const Records::PredictedRecord &r) {
            return "PredictedRecord <label: " + r.label +
                   ", rt: " + PythonAPI::to_string(r.rt) +
                   ", lmax: " + PythonAPI::to_string(r.lmax) + ">";
        });

    py::class_<Records::ObservedRecord>(m, "ObservedRecord")
        .def(py::init<>())
        .def(py::init<std::optional<Records::Spectrum>, std::optional<double>,
                      std::optional<double>, std::optional<uint64_t>>(),
             py::arg("spectrum") = py::none(), py::arg("rt") = py::none(),
             py::arg("lmax") = py::none(), py::arg("peak_id") = py::none())
        .def_readwrite("spectrum", &Records::ObservedRecord::spectrum)
        .def_readwrite("rt", &Records::ObservedRecord::rt)
        .def_readwrite("lmax", &Records::ObservedRecord::lmax)
        .def_readwrite("peak_id", &Records::ObservedRecord::peak_id)
        .def("__repr__", [](const Records::ObservedRecord &r) {
            return "ObservedRecord <rt: " + PythonAPI::to_string(r.rt) +
                   ", lmax: " + PythonAPI::to_string(r.lmax) + ">";
        });

    // Configuration.
    py::class_<ScoreMatrix::Weights>(m, "Weights")
        .def(py::init<>())
        .def_readwrite("ms", &ScoreMatrix::Weights::ms)
        .def_readwrite("rt", &ScoreMatrix::Weights::rt)
        .def_readwrite("lmax", &ScoreMatrix::Weights::lmax);

    py::class_<Spectral::Tolerance>(m, "Tolerance")
        .def_readonly("mz", &Spectral::Tolerance::mz)
        .def_readonly("ppm", &Spectral::Tolerance::ppm);

    py::class_<ScoreMatrix::Parameters>(m, "Parameters")
        .def(py::init(&PythonAPI::make_parameters), py::arg("w_ms") = 0.5,
             py::arg("w_rt") = 0.3, py::arg("w_lmax") = 0.2,
             py::arg("mz_tol") = py::none(), py::arg("ppm") = py::none(),
             py::arg("rt_sigma") = Proximity::DEFAULT_RT_SIGMA,
             py::arg("lmax_sigma") = Proximity::DEFAULT_LMAX_SIGMA,
             py::arg("normalize_spectra") = true)
        .def_readonly("weights", &ScoreMatrix::Parameters::weights)
        .def_readonly("tolerance", &ScoreMatrix::Parameters::tolerance)
        .def_readonly("rt_sigma", &ScoreMatrix::Parameters::rt_sigma)
        .def_readonly("lmax_sigma", &ScoreMatrix::Parameters::lmax_sigma)
        .def_readonly("normalize_spectra",
                      &ScoreMatrix::Parameters::normalize_spectra);

    // Results.
    py::class_<Assignment::Match>(m, "AssignmentMatch")
        .def_readonly("predicted_index", &Assignment::Match::predicted_index)
        .def_readonly("observed_index", &Assignment::Match::observed_index)
        .def_readonly("score", &Assignment::Match::score)
        .def("__repr__", [](const Assignment::Match &a) {
            return "AssignmentMatch <predicted_index: " +
                   std::to_string(a.predicted_index) +
                   ", observed_index: " + std::to_string(a.observed_index) +
                   ", score: " + std::to_string(a.score) + ">";
        });

    py::class_<Assignment::Result>(m, "Assignment")
        .def_readonly("matches", &Assignment::Result::matches)
        .def_readonly("total_score", &Assignment::Result::total_score)
        .def_readonly("degraded", &Assignment::Result::degraded)
        .def_readonly("score_matrix", &Assignment::Result::score_matrix)
        .def("dump", &PythonAPI::write_assignment)
        .def("__repr__", [](const Assignment::Result &r) {
            return "Assignment <num_matches: " +
                   std::to_string(r.matches.size()) +
                   ", total_score: " + std::to_string(r.total_score) +
                   ", degraded: " + (r.degraded ? "True" : "False") + ">";
        });

    py::class_<Reconcile::Match>(m, "Match")
        .def_readonly("predicted_index", &Reconcile::Match::predicted_index)
        .def_readonly("observed_index", &Reconcile::Match::observed_index)
        .def_readonly("score", &Reconcile::Match::score)
        .def_readonly("predicted", &Reconcile::Match::predicted)
        .def_readonly("observed", &Reconcile::Match::observed)
        .def("__repr__", [](const Reconcile::Match &a) {
            return "Match <label: " + a.predicted.label +
                   ", observed_index: " + std::to_string(a.observed_index) +
                   ", score: " + std::to_string(a.score) + ">";
        });

    py::class_<Reconcile::Result>(m, "ReconcileResult")
        .def_readonly("matches", &Reconcile::Result::matches)
        .def_readonly("unmatched_predicted",
                      &Reconcile::Result::unmatched_predicted)
        .def_readonly("unmatched_observed",
                      &Reconcile::Result::unmatched_observed)
        .def_readonly("total_score", &Reconcile::Result::total_score)
        .def_readonly("degraded", &Reconcile::Result::degraded)
        .def_readonly("score_matrix", &Reconcile::Result::score_matrix)
        .def("__repr__", [](const Reconcile::Result &r) {
            return "ReconcileResult <num_matches: " +
                   std::to_string(r.matches.size()) +
                   ", total_score: " + std::to_string(r.total_score) +
                   ", degraded: " + (r.degraded ? "True" : "False") + ">";
        });

    // Functions.
    m.def("rt_score", &Proximity::rt_score,
          "Gaussian proximity between two retention times", py::arg("a"),
          py::arg("b"), py::arg("sigma") = Proximity::DEFAULT_RT_SIGMA)
        .def("lmax_score", &Proximity::lmax_score,
             "Gaussian proximity between two absorption maxima", py::arg("a"),
             py::arg("b"), py::arg("sigma") = Proximity::DEFAULT_LMAX_SIGMA)
        .def("cosine_similarity", &PythonAPI::cosine_similarity,
             "Cosine similarity between two aligned mass spectra",
             py::arg("predicted"), py::arg("observed"),
             py::arg("mz_tol") = py::none(), py::arg("ppm") = py::none(),
             py::arg("normalize") = true)
        .def("build_score_matrix", &PythonAPI::build_score_matrix,
             "Build the aggregate similarity matrix between predicted and "
             "observed records",
             py::arg("predicted"), py::arg("observed"),
             py::arg("parameters") = ScoreMatrix::Parameters(),
             py::arg("max_threads") = 1)
        .def("solve", &PythonAPI::solve,
             "Find the one to one assignment that maximizes the total score",
             py::arg("score_matrix"), py::arg("solver") = "exact")
        .def("reconcile", &PythonAPI::reconcile,
             "Match predicted and observed records", py::arg("predicted"),
             py::arg("observed"),
             py::arg("parameters") = ScoreMatrix::Parameters(),
             py::arg("solver") = "exact", py::arg("max_threads") = 1)
        .def("annotate_observed", &Reconcile::annotate_observed,
             "Label each observed record with its matched predicted record",
             py::arg("result"), py::arg("n_observed"))
        .def("read_predicted_tsv", &PythonAPI::read_predicted_tsv,
             "Read predicted records from a tab separated file",
             py::arg("file_name"))
        .def("read_observed_tsv", &PythonAPI::read_observed_tsv,
             "Read observed records from a tab separated file",
             py::arg("file_name"))
        .def("write_predicted_records", &PythonAPI::write_predicted_records,
             "Write the predicted records into a binary file",
             py::arg("records"), py::arg("file_name"))
        .def("read_predicted_records", &PythonAPI::read_predicted_records,
             "Read the predicted records from a binary file",
             py::arg("file_name"))
        .def("write_observed_records", &PythonAPI::write_observed_records,
             "Write the observed records into a binary file",
             py::arg("records"), py::arg("file_name"))
        .def("read_observed_records", &PythonAPI::read_observed_records,
             "Read the observed records from a binary file",
             py::arg("file_name"))
        .def("read_assignment", &PythonAPI::read_assignment,
             "Read an assignment from a binary file", py::arg("file_name"));
}
