#include "DataFrameIO.h"

#include "CSVUtils.h"
#include "CommonUtils.h"
#include "SieveExceptions.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <ostream>
#include <sstream>

#ifdef SIEVE_USE_NATIVE_PARQUET
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace {
bool parseDouble(const std::string& raw, double& out) {
    const std::string s = CommonUtils::trim(raw);
    if (s.empty()) return false;
    const char* begin = s.c_str();
    char* end = nullptr;
    const double v = std::strtod(begin, &end);
    if (end != begin + s.size()) return false;
    out = v;
    return true;
}

#ifdef SIEVE_USE_NATIVE_PARQUET
std::shared_ptr<arrow::Array> buildArrowArray(const TypedColumn& col, std::string& errorOut) {
    std::shared_ptr<arrow::Array> arr;
    arrow::Status st;
    if (col.isNumeric()) {
        const auto& values = std::get<std::vector<double>>(col.values);
        arrow::DoubleBuilder builder;
        for (size_t r = 0; r < values.size() && st.ok(); ++r) {
            st = col.missing[r] ? builder.AppendNull() : builder.Append(values[r]);
        }
        if (st.ok()) st = builder.Finish(&arr);
    } else {
        const auto& values = std::get<std::vector<std::string>>(col.values);
        arrow::StringBuilder builder;
        for (size_t r = 0; r < values.size() && st.ok(); ++r) {
            st = col.missing[r] ? builder.AppendNull() : builder.Append(values[r]);
        }
        if (st.ok()) st = builder.Finish(&arr);
    }
    if (!st.ok()) {
        errorOut = "Failed to build arrow column '" + col.name + "': " + st.ToString();
        return nullptr;
    }
    return arr;
}
#endif
} // namespace

namespace DataFrameIO {

bool isMissingToken(const std::string& raw) {
    std::string s = CommonUtils::trim(raw);
    if (s.empty()) return true;
    s = CommonUtils::toLower(s);
    return s == "na" || s == "n/a" || s == "null" || s == "none" || s == "nan" || s == "missing";
}

DataFrame readCsv(std::istream& in, char delimiter) {
    CSVUtils::skipBOM(in);
    bool malformed = false;
    auto headerRaw = CSVUtils::parseCSVLine(in, delimiter, &malformed);
    if (malformed || headerRaw.empty()) throw Sieve::DatasetException("Malformed or empty CSV header");
    const auto header = CSVUtils::normalizeHeader(headerRaw);

    std::vector<std::vector<std::string>> cells(header.size());
    size_t lineNo = 1;
    while (in.peek() != EOF) {
        ++lineNo;
        auto row = CSVUtils::parseCSVLine(in, delimiter, &malformed);
        if (malformed) throw Sieve::DatasetException("Unterminated quoted field near line " + std::to_string(lineNo));
        if (row.empty()) continue;
        if (row.size() > header.size()) {
            throw Sieve::DatasetException("Row at line " + std::to_string(lineNo) + " has " +
                                          std::to_string(row.size()) + " fields, header has " +
                                          std::to_string(header.size()));
        }
        row.resize(header.size());
        for (size_t c = 0; c < header.size(); ++c) cells[c].push_back(std::move(row[c]));
    }

    DataFrame frame;
    for (size_t c = 0; c < header.size(); ++c) {
        const auto& raw = cells[c];
        MissingMask missing(raw.size(), static_cast<uint8_t>(0));
        std::vector<double> numeric(raw.size(), 0.0);
        bool allNumeric = true;
        for (size_t r = 0; r < raw.size(); ++r) {
            if (isMissingToken(raw[r])) {
                missing[r] = static_cast<uint8_t>(1);
                continue;
            }
            if (allNumeric && !parseDouble(raw[r], numeric[r])) allNumeric = false;
        }

        TypedColumn col;
        col.name = header[c];
        col.missing = std::move(missing);
        if (allNumeric) {
            col.values = std::move(numeric);
        } else {
            std::vector<std::string> text(raw.size());
            for (size_t r = 0; r < raw.size(); ++r) {
                if (!col.missing[r]) text[r] = raw[r];
            }
            col.values = std::move(text);
        }
        frame.addColumn(std::move(col));
    }
    return frame;
}

DataFrame loadCsv(const std::string& path, char delimiter) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw Sieve::IOException("Cannot open dataset '" + path + "'", path);
    return readCsv(in, delimiter);
}

void writeCsv(const DataFrame& data, std::ostream& out, char delimiter) {
    const auto& cols = data.columns();
    for (size_t c = 0; c < cols.size(); ++c) {
        if (c > 0) out << delimiter;
        out << CSVUtils::quoteField(cols[c].name, delimiter);
    }
    out << '\n';
    for (size_t r = 0; r < data.rowCount(); ++r) {
        for (size_t c = 0; c < cols.size(); ++c) {
            if (c > 0) out << delimiter;
            out << CSVUtils::quoteField(cols[c].cellText(r), delimiter);
        }
        out << '\n';
    }
}

void saveCsv(const DataFrame& data, const std::string& path, char delimiter) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw Sieve::IOException("Cannot open output '" + path + "'", path);
    writeCsv(data, out, delimiter);
    if (!out.good()) throw Sieve::IOException("Failed while writing '" + path + "'", path);
}

void saveParquet(const DataFrame& data, const std::string& path) {
#ifdef SIEVE_USE_NATIVE_PARQUET
    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    for (const auto& col : data.columns()) {
        std::string error;
        auto arr = buildArrowArray(col, error);
        if (!arr) throw Sieve::IOException(error, path);
        fields.push_back(arrow::field(col.name, col.isNumeric() ? arrow::float64() : arrow::utf8(), true));
        arrays.push_back(std::move(arr));
    }

    auto schema = std::make_shared<arrow::Schema>(fields);
    auto table = arrow::Table::Make(schema, arrays, static_cast<int64_t>(data.rowCount()));

    auto outRes = arrow::io::FileOutputStream::Open(path);
    if (!outRes.ok()) {
        throw Sieve::IOException("Failed to open parquet output path: " + outRes.status().ToString(), path);
    }
    std::shared_ptr<arrow::io::FileOutputStream> sink = outRes.ValueOrDie();

    const int64_t chunkRows = std::max<int64_t>(1024, std::min<int64_t>(65536, static_cast<int64_t>(data.rowCount())));
    auto writeStatus = parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), sink, chunkRows);
    if (!writeStatus.ok()) {
        throw Sieve::IOException("Parquet write failed: " + writeStatus.ToString(), path);
    }
    auto closeStatus = sink->Close();
    if (!closeStatus.ok()) {
        throw Sieve::IOException("Failed to close parquet output stream: " + closeStatus.ToString(), path);
    }
#else
    (void)data;
    throw Sieve::IOException("Parquet export requires a build with Apache Arrow/Parquet", path);
#endif
}

} // namespace DataFrameIO
