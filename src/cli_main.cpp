#include <cxxopts.hpp>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "unbox/Decode.hpp"
#include "unbox/Formatter.hpp"
#include "unbox/Loader.hpp"
#include "unbox/Uri.hpp"

using nlohmann::json;
using namespace unbox;

namespace {

struct InspectRequest {
    Path path = Path::key("");
    std::string type = "value";
    bool allow_invalid = false;
    DateFormatter formatter;
    DecodeOptions options;
};

template <typename T>
Result<json> decode_scalar(const Value& tree, const InspectRequest& req) {
    auto result = decode_at<T>(tree, req.path, req.options);
    if (!result) return result.error();
    return json(result.value());
}

template <typename T>
Result<json> decode_list(const Value& tree, const InspectRequest& req) {
    auto result = decode_at<std::vector<T>>(tree, req.path, req.allow_invalid, req.options);
    if (!result) return result.error();
    return json(result.value());
}

Result<json> decode_uri(const Value& tree, const InspectRequest& req) {
    auto result = decode_at<Uri>(tree, req.path, req.options);
    if (!result) return result.error();
    const Uri& uri = result.value();
    return json{{"text", uri.text()}, {"scheme", uri.scheme()}, {"authority", uri.authority()},
                {"path", uri.path()}, {"query", uri.query()}, {"fragment", uri.fragment()}};
}

Result<json> decode_date(const Value& tree, const InspectRequest& req) {
    return decode_custom<json>(tree, [&req](Unboxer& unboxer) -> std::optional<json> {
        auto time = unboxer.required_formatted(req.path, req.formatter);
        return json(format_time(time, "%Y-%m-%dT%H:%M:%SZ"));
    }, req.options);
}

Result<json> decode_as(const Value& tree, const InspectRequest& req) {
    const std::string& type = req.type;
    if (type == "value") return decode_scalar<Value>(tree, req);
    if (type == "bool") return decode_scalar<bool>(tree, req);
    if (type == "int") return decode_scalar<std::int64_t>(tree, req);
    if (type == "uint") return decode_scalar<std::uint64_t>(tree, req);
    if (type == "double") return decode_scalar<double>(tree, req);
    if (type == "string") return decode_scalar<std::string>(tree, req);
    if (type == "uri") return decode_uri(tree, req);
    if (type == "date") return decode_date(tree, req);
    if (type == "array:value") return decode_list<Value>(tree, req);
    if (type == "array:bool") return decode_list<bool>(tree, req);
    if (type == "array:int") return decode_list<std::int64_t>(tree, req);
    if (type == "array:uint") return decode_list<std::uint64_t>(tree, req);
    if (type == "array:double") return decode_list<double>(tree, req);
    if (type == "array:string") return decode_list<std::string>(tree, req);
    throw std::invalid_argument("Unknown type: '" + type + "'");
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("unbox-inspect", "Decode a value from a JSON/TOML file as a given type");

        options.add_options()
            ("i,input", "Path to JSON/TOML input file", cxxopts::value<std::string>())
            ("k,key", "Flat key to decode (matched literally)", cxxopts::value<std::string>())
            ("p,path", "Dot-separated key path to decode (e.g. items.0.name)", cxxopts::value<std::string>())
            ("a,as", "Target type: value|bool|int|uint|double|string|uri|date|array:<scalar>",
                cxxopts::value<std::string>()->default_value("value"))
            ("date-format", "std::get_time pattern for --as date",
                cxxopts::value<std::string>()->default_value("%Y-%m-%dT%H:%M:%S"))
            ("allow-invalid", "Drop invalid array elements instead of failing")
            ("m,mode", "Decode mode: throwing|accumulating",
                cxxopts::value<std::string>()->default_value("throwing"))
            ("w,warnings", "Print decode warnings to stderr")
            ("h,help", "Show help");

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("input")) {
            std::cout << options.help() << "\n";
            return result.count("help") ? 0 : 1;
        }
        if (result.count("key") && result.count("path")) {
            std::cerr << "Error: use either --key or --path, not both\n";
            return 1;
        }
        if (!result.count("key") && !result.count("path")) {
            std::cerr << "Error: one of --key or --path is required\n";
            return 1;
        }

        InspectRequest req;
        req.path = result.count("key")
            ? Path::key(result["key"].as<std::string>())
            : Path::key_path(result["path"].as<std::string>());
        req.type = result["as"].as<std::string>();
        req.allow_invalid = result.count("allow-invalid") > 0;
        req.formatter = DateFormatter(result["date-format"].as<std::string>());
        req.options.mode = parse_decode_mode(result["mode"].as<std::string>());
        if (result.count("warnings")) {
            req.options.observer = std::make_shared<StreamWarningLogger>(std::cerr);
        } else {
            req.options.emit_warnings = false;
        }

        const Value tree = load_tree_file(result["input"].as<std::string>());

        Result<json> decoded = decode_as(tree, req);
        if (!decoded) {
            std::cerr << "Error: " << decoded.error().what() << "\n";
            return 1;
        }
        std::cout << decoded.value().dump(2) << "\n";
        return 0;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
