/**
 * =============================================================================
 * Options.cpp - Command-Line Parsing
 * =============================================================================
 *
 * @file Options.cpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#include "Options.hpp"

#include <sstream>
#include <stdexcept>

namespace {

int parseTop(const std::string& value) {
    std::size_t consumed = 0;
    int top = 0;
    try {
        top = std::stoi(value, &consumed);
    } catch (const std::logic_error&) {
        // std::stoi reports both invalid_argument and out_of_range
        throw std::invalid_argument("-top expects a positive integer, got '" + value + "'");
    }
    if (consumed != value.size() || top < 1) {
        throw std::invalid_argument("-top expects a positive integer, got '" + value + "'");
    }
    return top;
}

} // namespace

Options parseOptions(int argc, const char* const argv[]) {
    Options options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.size() < 2 || arg[0] != '-') {
            throw std::invalid_argument("unexpected argument '" + arg + "'");
        }

        // Strip "-" or "--", then split "name=value"
        std::string name = arg.substr(arg[1] == '-' ? 2 : 1);
        std::string value;
        bool hasValue = false;
        std::size_t eq = name.find('=');
        if (eq != std::string::npos) {
            value = name.substr(eq + 1);
            name = name.substr(0, eq);
            hasValue = true;
        }

        if (name == "h" || name == "help") {
            options.help = true;
            continue;
        }

        if (name != "model" && name != "input" && name != "labels" && name != "top") {
            throw std::invalid_argument("unknown flag '" + arg + "'");
        }

        if (!hasValue) {
            if (i + 1 >= argc) {
                throw std::invalid_argument("flag '" + arg + "' needs a value");
            }
            value = argv[++i];
        }

        if (name == "model") {
            options.modelPath = value;
        } else if (name == "input") {
            options.inputPath = value;
        } else if (name == "labels") {
            options.labelsPath = value;
        } else {
            options.top = parseTop(value);
        }
    }

    return options;
}

std::string usage(const std::string& programName) {
    std::ostringstream out;
    out << "Usage: " << programName << " [options]\n"
        << "  -model <path>   path to the model file (default \"model/model.onnx\")\n"
        << "  -input <path>   path to the input file, '-' for stdin (default \"images/avatar64.png\")\n"
        << "  -labels <path>  label file, one label per line (default: FER+ emotions)\n"
        << "  -top <k>        number of results to print (default 2)\n"
        << "  -h              help\n";
    return out.str();
}
