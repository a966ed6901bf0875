#include "string_utils.hpp"
#include <sstream>
#include <vector>
#include <string>
#include <iomanip>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

using std::string;
using std::vector;
using std::ostringstream;


void process_line(string &line, const string comment_str) {
    std::replace_if(line.begin(), line.end(), [](char c){
        return c == '\t' || c == ',' || c == ';' || c == '\r' || c == '\n';
    }, ' ');

    size_t comment_pos = line.find(comment_str);
    if (comment_pos != string::npos) {
        line.erase(comment_pos);
    }

    size_t first = line.find_first_not_of(' ');
    if (first == string::npos) {
        line.clear();
        return;
    }
    line = line.substr(first, line.find_last_not_of(' ') - first + 1);
}


string join_string(const vector<string> &str_vec, const string &split_str) {
    string out;
    for (size_t i = 0; i < str_vec.size(); ++i) {
        if (i > 0) out += split_str;
        out += str_vec[i];
    }
    return out;
}


double string_to_double(const string &str) {
    double value = 0;
    if (!try_string_to_double(str, value)) {
        spdlog::error("'{}' cannot be converted to a finite double", str);
        throw std::runtime_error("Non-numeric value: '" + str + "'");
    }
    return value;
}


bool try_string_to_double(const string &str, double &value) {
    if (str.empty()) return false;
    char *endptr = nullptr;
    double result = strtod(str.c_str(), &endptr);
    if (endptr == str.c_str() || *endptr != '\0' || !std::isfinite(result)) {
        return false;
    }
    value = result;
    return true;
}


bool is_nan(const string &str, const vector<string> &nan_vec) {
    return std::find(nan_vec.begin(), nan_vec.end(), str) != nan_vec.end();
}


string double_to_string_sig(double value, int digits) {
    if (std::isnan(value)) return "NA";
    if (std::isinf(value)) return value > 0 ? "Inf" : "-Inf";
    if (digits < 1) digits = 1;
    ostringstream stream;
    stream << std::setprecision(digits) << value;
    return stream.str();
}
