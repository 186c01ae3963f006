#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <map>
#include <sstream>
#include <string>

#include "records/records_files.hpp"

namespace {
// Helper function to trim the whitespace surrounding a string.
void trim_space(std::string &s) {
    auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
}

std::vector<std::string> split(const std::string &line, char delimiter) {
    std::vector<std::string> cells;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, delimiter)) {
        trim_space(cell);
        cells.push_back(cell);
    }
    // A trailing delimiter still means there is one more (empty) cell.
    if (!line.empty() && line.back() == delimiter) {
        cells.emplace_back();
    }
    return cells;
}

bool is_absent(const std::string &cell) {
    return cell.empty() || cell == "NA" || cell == "na";
}

std::optional<double> parse_double(const std::string &cell) {
    const char *begin = cell.c_str();
    char *end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0') {
        return std::nullopt;
    }
    return value;
}

std::optional<uint64_t> parse_uint64(const std::string &cell) {
    auto is_digit = [](unsigned char ch) { return std::isdigit(ch) != 0; };
    if (cell.empty() || !std::all_of(cell.begin(), cell.end(), is_digit)) {
        return std::nullopt;
    }
    errno = 0;
    auto value = std::strtoull(cell.c_str(), nullptr, 10);
    if (errno == ERANGE) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(value);
}

std::optional<std::vector<double>> parse_list(const std::string &cell) {
    std::vector<double> values;
    for (const auto &item : split(cell, ',')) {
        auto value = parse_double(item);
        if (!value) {
            return std::nullopt;
        }
        values.push_back(value.value());
    }
    return values;
}

// The parsed contents of a single line. Absent cells are left as nullopt.
struct Row {
    std::string label;
    std::optional<Records::Spectrum> spectrum;
    std::optional<double> rt;
    std::optional<double> lmax;
    std::optional<uint64_t> peak_id;
};

using ColumnMap = std::map<std::string, size_t>;

std::optional<ColumnMap> read_header(std::istream &stream) {
    std::string line;
    while (std::getline(stream, line)) {
        trim_space(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        ColumnMap columns;
        auto names = split(line, '\t');
        for (size_t i = 0; i < names.size(); ++i) {
            auto name = names[i];
            for (auto &ch : name) {
                ch = static_cast<char>(
                    std::tolower(static_cast<unsigned char>(ch)));
            }
            columns[name] = i;
        }
        return columns;
    }
    return std::nullopt;
}

bool parse_row(const std::vector<std::string> &cells, const ColumnMap &columns,
               Row *row) {
    auto cell_at = [&](const std::string &name) -> std::string {
        auto it = columns.find(name);
        if (it == columns.end() || it->second >= cells.size()) {
            return "";
        }
        return cells[it->second];
    };

    auto label = cell_at("label");
    row->label = is_absent(label) ? "" : label;

    auto rt = cell_at("rt");
    if (!is_absent(rt)) {
        row->rt = parse_double(rt);
        if (!row->rt) {
            return false;
        }
    }
    auto lmax = cell_at("lmax");
    if (!is_absent(lmax)) {
        row->lmax = parse_double(lmax);
        if (!row->lmax) {
            return false;
        }
    }
    auto peak_id = cell_at("peak_id");
    if (!is_absent(peak_id)) {
        row->peak_id = parse_uint64(peak_id);
        if (!row->peak_id) {
            return false;
        }
    }

    // If only one of the spectral columns is given the spectrum is kept with
    // mismatched lengths so that validation can report it.
    auto mz = cell_at("mz");
    auto intensity = cell_at("intensity");
    if (!is_absent(mz) || !is_absent(intensity)) {
        Records::Spectrum spectrum;
        if (!is_absent(mz)) {
            auto values = parse_list(mz);
            if (!values) {
                return false;
            }
            spectrum.mz = values.value();
        }
        if (!is_absent(intensity)) {
            auto values = parse_list(intensity);
            if (!values) {
                return false;
            }
            spectrum.intensity = values.value();
        }
        row->spectrum = std::move(spectrum);
    }
    return true;
}

bool read_rows(std::istream &stream, std::vector<Row> *rows) {
    auto columns = read_header(stream);
    if (!columns) {
        return false;
    }
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        std::string trimmed = line;
        trim_space(trimmed);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }
        Row row;
        if (!parse_row(split(line, '\t'), columns.value(), &row)) {
            return false;
        }
        rows->push_back(std::move(row));
    }
    return true;
}
}  // namespace

bool Records::Files::Tsv::read_predicted(
    std::istream &stream, std::vector<Records::PredictedRecord> *records) {
    std::vector<Row> rows;
    if (!read_rows(stream, &rows)) {
        return false;
    }
    records->clear();
    records->reserve(rows.size());
    for (auto &row : rows) {
        records->push_back({row.label, std::move(row.spectrum), row.rt,
                            row.lmax});
    }
    return true;
}

bool Records::Files::Tsv::read_observed(
    std::istream &stream, std::vector<Records::ObservedRecord> *records) {
    std::vector<Row> rows;
    if (!read_rows(stream, &rows)) {
        return false;
    }
    records->clear();
    records->reserve(rows.size());
    for (auto &row : rows) {
        records->push_back(
            {std::move(row.spectrum), row.rt, row.lmax, row.peak_id});
    }
    return true;
}
