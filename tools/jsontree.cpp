// jsontree - command-line front end for diff, patch and pointer lookup.
//
//   jsontree diff OLD NEW [--ignore-case] [--ignore-whitespace]
//                         [--ignore-order] [--include-same]
//                         [--max-depth N] [--as-patch]
//   jsontree patch DOC PATCH
//   jsontree get DOC POINTER
//
// Files may be "-" for stdin. Output goes to stdout, errors to stderr.

#include <jsontree-cpp/jsontree.hpp>

#include <boost/program_options.hpp>
#include <spdlog/cfg/env.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace jt = jsontree_cpp;
namespace po = boost::program_options;

static auto read_document(const std::string& file) -> jt::Value {
    if (file == "-") {
        auto text = std::string{std::istreambuf_iterator<char>{std::cin}, {}};
        return jt::parse(text);
    }
    auto in = std::ifstream{file, std::ios::binary};
    if (!in) {
        throw jt::Exception{jt::ErrorKind::operation_failed, "cannot open '" + file + "'"};
    }
    auto buffer = std::ostringstream{};
    buffer << in.rdbuf();
    return jt::parse(buffer.str());
}

static void print_usage(const po::options_description& desc) {
    std::cout << "usage: jsontree diff OLD NEW [options]\n"
                 "       jsontree patch DOC PATCH\n"
                 "       jsontree get DOC POINTER\n\n"
              << desc;
}

int main(int argc, char** argv) {
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "show help message")
        ("ignore-case", po::bool_switch(), "compare strings case-insensitively")
        ("ignore-whitespace", po::bool_switch(), "ignore whitespace inside strings")
        ("ignore-order", po::bool_switch(), "compare arrays as multisets")
        ("include-same", po::bool_switch(), "also report unchanged values")
        ("max-depth", po::value<std::size_t>()->default_value(0), "maximum depth, 0 = unlimited")
        ("as-patch", po::bool_switch(), "print the diff as a patch document")
        ("indent", po::value<int>()->default_value(2), "output indentation, -1 = compact")
        ("log-level", po::value<std::string>(), "trace, debug, info, warn, error or off")
    ;

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>())
        ("args", po::value<std::vector<std::string>>());

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1).add("args", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(all).positional(positional).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "jsontree: " << e.what() << "\n";
        return 2;
    }

    if (vm.count("help") || !vm.count("command")) {
        print_usage(desc);
        return vm.count("help") ? 0 : 2;
    }

    jt::logger();
    spdlog::cfg::load_env_levels();
    if (vm.count("log-level")) {
        jt::set_log_level(spdlog::level::from_str(vm["log-level"].as<std::string>()));
    }

    const auto command = vm["command"].as<std::string>();
    const auto args = vm.count("args") ? vm["args"].as<std::vector<std::string>>()
                                       : std::vector<std::string>{};
    const auto indent = vm["indent"].as<int>();

    if (args.size() != 2 || (command != "diff" && command != "patch" && command != "get")) {
        print_usage(desc);
        return 2;
    }

    try {
        if (command == "diff") {
            auto options = jt::DiffOptions{
                .ignore_case = vm["ignore-case"].as<bool>(),
                .ignore_whitespace = vm["ignore-whitespace"].as<bool>(),
                .ignore_order = vm["ignore-order"].as<bool>(),
                .include_same = vm["include-same"].as<bool>(),
                .max_depth = vm["max-depth"].as<std::size_t>(),
            };
            auto records = jt::diff(read_document(args[0]), read_document(args[1]), options);
            if (vm["as-patch"].as<bool>()) {
                std::cout << jt::dump(jt::to_value(jt::generate_patch(records)), indent) << "\n";
            } else {
                for (const auto& record : records) {
                    std::cout << jt::to_string(record) << "\n";
                }
            }
        } else if (command == "patch") {
            auto result = jt::apply_patch(read_document(args[0]), read_document(args[1]));
            std::cout << jt::dump(result, indent) << "\n";
        } else {
            auto doc = read_document(args[0]);
            std::cout << jt::dump(jt::get(doc, jt::Pointer::parse(args[1])), indent) << "\n";
        }
    } catch (const jt::Exception& e) {
        std::cerr << "jsontree: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
