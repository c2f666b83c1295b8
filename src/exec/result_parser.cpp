#include "exec/result_parser.hpp"
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include "common/io_utils.hpp"

namespace kata {
using namespace std;
using namespace nlohmann;

const size_t MAX_ECHOED_LINE = 200;

static bool parse_result(const json &j, test_result &result, string &error) {
    if (!j.count("name") || !j.at("name").is_string()) {
        error = "missing string field \"name\"";
        return false;
    }
    if (!j.count("passed") || !j.at("passed").is_boolean()) {
        error = "missing boolean field \"passed\"";
        return false;
    }
    if (j.count("message") && !j.at("message").is_null() && !j.at("message").is_string()) {
        error = "field \"message\" must be a string";
        return false;
    }

    result.name = j.at("name").get<string>();
    result.passed = j.at("passed").get<bool>();
    if (j.count("message") && j.at("message").is_string())
        result.message = j.at("message").get<string>();
    return true;
}

static bool check_completion(const json &j, const string &token, size_t count, string &error) {
    if (token.empty() || !j.count("token") || !j.at("token").is_string() || j.at("token").get<string>() != token) {
        error = "completion record was not written by the test harness";
        return false;
    }
    if (!j.count("count") || !j.at("count").is_number_unsigned() || j.at("count").get<size_t>() != count) {
        error = fmt::format("completion record does not match the {} reported test(s)", count);
        return false;
    }
    return true;
}

test_report parse_test_report(const string &raw, const string &token) {
    test_report report;
    istringstream stream(raw);
    string line;
    size_t line_no = 0;
    bool finished = false;

    auto malformed = [&](const string &error) {
        if (report.malformed_lines++ == 0) {
            string echoed = line.size() > MAX_ECHOED_LINE ? line.substr(0, MAX_ECHOED_LINE) + "..." : line;
            report.first_error = fmt::format("line {}: {}: {}", line_no, error, sanitize_utf8(echoed));
        }
    };

    while (getline(stream, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == string::npos) continue;

        json j;
        try {
            j = json::parse(line);
        } catch (json::parse_error &) {
            malformed("not a JSON object");
            continue;
        }
        if (!j.is_object()) {
            malformed("not a JSON object");
            continue;
        }
        if (finished) {
            malformed("content after the completion record");
            continue;
        }

        string error;
        if (j.count("done")) {
            if (check_completion(j, token, report.results.size(), error))
                finished = true;
            else
                malformed(error);
            continue;
        }

        test_result result;
        if (parse_result(j, result, error))
            report.results.push_back(move(result));
        else
            malformed(error);
    }

    report.complete = finished && report.malformed_lines == 0;
    if (report.malformed_lines > 0) {
        test_result diagnostic;
        diagnostic.name = "harness";
        diagnostic.passed = false;
        diagnostic.message = fmt::format("test harness produced {} unrecognized line(s), first at {}",
                                         report.malformed_lines, report.first_error);
        report.results.push_back(move(diagnostic));
    }
    return report;
}

string format_test_line(const test_result &result) {
    json j = {{"name", result.name}, {"passed", result.passed}, {"message", sanitize_utf8(result.message)}};
    return j.dump();
}

string format_completion_line(size_t count, const string &token) {
    json j = {{"done", true}, {"count", count}, {"token", token}};
    return j.dump();
}

}  // namespace kata
